#ifndef RANGEWATCH_BREAKPOINT_REGISTRY_H
#define RANGEWATCH_BREAKPOINT_REGISTRY_H

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/types/range_definition.h>
#include <rangewatch/util/string_map.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangewatch {
    /**
     * The canonical, ordered and de-duplicated list of range definitions.
     *
     * The registry is expected to be ordered smallest range first: the position of a range is its priority
     * when several ranges are true at once (lower index wins). It is built once and then only read, so a
     * single instance can be shared by every monitor and service. Lookups return non-owning pointers into
     * the registry, ``nullptr`` when nothing matches.
     */
    class RANGEWATCH_EXPORT BreakPointRegistry {
    public:
        BreakPointRegistry() = default;

        /**
         * Validates suffixes and merges entries sharing an alias (see merge_by_alias).
         */
        explicit BreakPointRegistry(RangeDefinitions ranges);

        /**
         * Merge ``custom`` over ``defaults`` and check that every alias in ``required_aliases`` survived.
         * Raises ConfigurationError listing the missing aliases otherwise.
         */
        [[nodiscard]] static BreakPointRegistry build(const RangeDefinitions &defaults,
                                                      const RangeDefinitions &custom = {},
                                                      const std::vector<std::string> &required_aliases = {});

        [[nodiscard]] const RangeDefinitions &items() const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] bool empty() const;

        [[nodiscard]] const RangeDefinition *find_by_alias(std::string_view alias) const;

        /**
         * The first range (in priority order) registered for ``query``.
         */
        [[nodiscard]] const RangeDefinition *find_by_query(std::string_view query) const;

        /**
         * Alias lookup, falling back to a query lookup.
         */
        [[nodiscard]] const RangeDefinition *find(std::string_view alias_or_query) const;

        /**
         * The query registered for an alias, or the input itself when it is not a known alias.
         */
        [[nodiscard]] std::string resolve_query(std::string_view alias_or_query) const;

        /**
         * Priority (registry position) of the first range registered for ``query``.
         */
        [[nodiscard]] std::optional<std::size_t> index_of(std::string_view query) const;

        /**
         * All ranges flagged as overlapping, in registry order.
         */
        [[nodiscard]] RangeDefinitions overlapping_ranges() const;

        /**
         * The distinct queries of the registry in first-seen order.
         */
        [[nodiscard]] std::vector<std::string> queries() const;

    private:
        void index();

        RangeDefinitions _items;
        StringMap<std::size_t> _by_alias;
        StringMap<std::size_t> _by_query;
    };
} // namespace rangewatch

#endif  // RANGEWATCH_BREAKPOINT_REGISTRY_H
