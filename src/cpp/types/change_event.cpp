#include <rangewatch/types/change_event.h>
#include <rangewatch/types/range_definition.h>

namespace rangewatch {
    ChangeEvent ChangeEvent::with_range(const RangeDefinition &range) const {
        return ChangeEvent{query, matches, range.alias, range.suffix};
    }
} // namespace rangewatch
