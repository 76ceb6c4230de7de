#ifndef RANGEWATCH_STRING_UTILS_H
#define RANGEWATCH_STRING_UTILS_H

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/types/change_event.h>
#include <rangewatch/types/range_definition.h>

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace rangewatch {
    template<typename T>
    std::string to_string(const T &value);

    template<>
    RANGEWATCH_EXPORT std::string to_string(const bool &value);

    template<>
    RANGEWATCH_EXPORT std::string to_string(const RangeDefinition &value);

    template<>
    RANGEWATCH_EXPORT std::string to_string(const ChangeEvent &value);

    /**
     * True when ``value`` contains ``filter`` (case-sensitive). An empty filter matches everything.
     */
    [[nodiscard]] RANGEWATCH_EXPORT bool contains(std::string_view value, std::string_view filter);
} // namespace rangewatch

template<>
struct fmt::formatter<rangewatch::RangeDefinition> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const rangewatch::RangeDefinition &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(rangewatch::to_string(value), ctx);
    }
};

template<>
struct fmt::formatter<rangewatch::ChangeEvent> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const rangewatch::ChangeEvent &value, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(rangewatch::to_string(value), ctx);
    }
};

#endif  // RANGEWATCH_STRING_UTILS_H
