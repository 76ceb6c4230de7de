#include <rangewatch/runtime/observable_ranges.h>
#include <rangewatch/runtime/range_monitor.h>

namespace rangewatch {
    RangeService::RangeService(RangeMonitor &monitor) : _monitor{monitor} {}

    bool RangeService::is_active(std::string_view alias_or_query) const { return _monitor.is_active(alias_or_query); }

    ChangeStream RangeService::as_observable() const {
        return _monitor.observe().filter([](const ChangeEvent &change) { return change.matches; });
    }

    Subscription RangeService::subscribe(ChangeCallback next) { return as_observable().subscribe(std::move(next)); }
} // namespace rangewatch
