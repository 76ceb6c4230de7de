#pragma once

/**
 * @file range_definition.h
 * @brief RangeDefinition - a named condition range (breakpoint).
 */

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/rangewatch_forward_declarations.h>

#include <string>
#include <vector>

namespace rangewatch {

/**
 * @brief A named query range, immutable once it has been placed in a registry.
 *
 * The query is opaque to the engine, it is only ever handed to the evaluator. The suffix is the
 * PascalCase display identifier (``gt-sm`` -> ``GtSm``); an empty suffix is derived from the alias when
 * the range is validated. The priority of a range is implicit, it is the position in its registry
 * (earlier is more specific).
 */
struct RANGEWATCH_EXPORT RangeDefinition {
    std::string alias;
    std::string query;
    std::string suffix{};
    // May be true at the same time as another range, e.g. an open ended ``gt-sm`` range.
    bool overlapping{false};

    bool operator==(const RangeDefinition &) const = default;
};

} // namespace rangewatch
