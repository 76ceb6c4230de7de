#include <rangewatch/util/string_utils.h>

namespace rangewatch {
    template<>
    std::string to_string(const bool &value) { return value ? "true" : "false"; }

    template<>
    std::string to_string(const RangeDefinition &value) {
        return fmt::format("RangeDefinition[alias={}, suffix={}, query='{}'{}]", value.alias, value.suffix,
                           value.query, value.overlapping ? ", overlapping" : "");
    }

    template<>
    std::string to_string(const ChangeEvent &value) {
        if (value.has_alias()) {
            return fmt::format("ChangeEvent[{} {}({}) query='{}']", value.matches ? "activate" : "deactivate",
                               value.alias, value.suffix, value.query);
        }
        return fmt::format("ChangeEvent[{} query='{}']", value.matches ? "activate" : "deactivate", value.query);
    }

    bool contains(std::string_view value, std::string_view filter) {
        return filter.empty() || value.find(filter) != std::string_view::npos;
    }
} // namespace rangewatch
