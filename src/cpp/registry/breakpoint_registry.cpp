#include <rangewatch/registry/breakpoint_registry.h>
#include <rangewatch/registry/breakpoint_tools.h>
#include <rangewatch/util/errors.h>

#include <fmt/ranges.h>

namespace rangewatch {
    BreakPointRegistry::BreakPointRegistry(RangeDefinitions ranges) : _items{merge_by_alias(ranges)} { index(); }

    BreakPointRegistry BreakPointRegistry::build(const RangeDefinitions &defaults, const RangeDefinitions &custom,
                                                 const std::vector<std::string> &required_aliases) {
        BreakPointRegistry registry;
        registry._items = merge_by_alias(defaults, custom);
        registry.index();

        std::vector<std::string_view> missing;
        for (const auto &alias : required_aliases) {
            if (registry.find_by_alias(alias) == nullptr) { missing.emplace_back(alias); }
        }
        if (!missing.empty()) {
            throw_error<ConfigurationError>("BreakPointRegistry is missing required alias(es): {}",
                                            fmt::join(missing, ", "));
        }
        return registry;
    }

    const RangeDefinitions &BreakPointRegistry::items() const { return _items; }

    std::size_t BreakPointRegistry::size() const { return _items.size(); }

    bool BreakPointRegistry::empty() const { return _items.empty(); }

    const RangeDefinition *BreakPointRegistry::find_by_alias(std::string_view alias) const {
        auto it = _by_alias.find(alias);
        return it == _by_alias.end() ? nullptr : &_items[it->second];
    }

    const RangeDefinition *BreakPointRegistry::find_by_query(std::string_view query) const {
        auto it = _by_query.find(query);
        return it == _by_query.end() ? nullptr : &_items[it->second];
    }

    const RangeDefinition *BreakPointRegistry::find(std::string_view alias_or_query) const {
        auto range = find_by_alias(alias_or_query);
        return range != nullptr ? range : find_by_query(alias_or_query);
    }

    std::string BreakPointRegistry::resolve_query(std::string_view alias_or_query) const {
        auto range = find(alias_or_query);
        return range != nullptr ? range->query : std::string{alias_or_query};
    }

    std::optional<std::size_t> BreakPointRegistry::index_of(std::string_view query) const {
        auto it = _by_query.find(query);
        if (it == _by_query.end()) { return std::nullopt; }
        return it->second;
    }

    RangeDefinitions BreakPointRegistry::overlapping_ranges() const {
        RangeDefinitions overlaps;
        for (const auto &range : _items) {
            if (range.overlapping) { overlaps.push_back(range); }
        }
        return overlaps;
    }

    std::vector<std::string> BreakPointRegistry::queries() const {
        std::vector<std::string> result;
        result.reserve(_by_query.size());
        StringSet seen;
        for (const auto &range : _items) {
            if (seen.insert(range.query).second) { result.push_back(range.query); }
        }
        return result;
    }

    void BreakPointRegistry::index() {
        _by_alias.clear();
        _by_query.clear();
        for (std::size_t i = 0; i < _items.size(); ++i) {
            _by_alias.try_emplace(_items[i].alias, i);
            _by_query.try_emplace(_items[i].query, i);
        }
    }
} // namespace rangewatch
