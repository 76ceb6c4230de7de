#ifndef RANGEWATCH_BREAKPOINT_TOOLS_H
#define RANGEWATCH_BREAKPOINT_TOOLS_H

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/types/range_definition.h>

#include <string>
#include <string_view>

namespace rangewatch {
    /**
     * Build the PascalCase suffix for an alias: the alias is split on every non-alphanumeric character,
     * the first character of each segment is upper-cased and the segments are concatenated.
     * ``gt-lg`` -> ``GtLg``, ``handset.portrait`` -> ``HandsetPortrait``.
     * Returns an empty string when the alias has no alphanumeric characters.
     */
    [[nodiscard]] RANGEWATCH_EXPORT std::string derive_suffix(std::string_view alias);

    /**
     * Fill in the suffix of every range that has none. Existing suffixes are never replaced.
     * Raises ConfigurationError for a range whose alias cannot produce a suffix.
     */
    [[nodiscard]] RANGEWATCH_EXPORT RangeDefinitions validate_suffixes(RangeDefinitions ranges);

    /**
     * Concatenate ``defaults`` and ``custom``, validate the suffixes and merge by alias. An entry replaces an
     * earlier entry with the same alias in place (so custom entries override defaults), new aliases are
     * appended, the first-seen order is kept.
     */
    [[nodiscard]] RANGEWATCH_EXPORT RangeDefinitions merge_by_alias(const RangeDefinitions &defaults,
                                                                  const RangeDefinitions &custom = {});
} // namespace rangewatch

#endif  // RANGEWATCH_BREAKPOINT_TOOLS_H
