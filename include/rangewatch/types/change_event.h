#pragma once

/**
 * @file change_event.h
 * @brief ChangeEvent - a single activation or deactivation of a query.
 */

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/rangewatch_forward_declarations.h>

#include <string>

namespace rangewatch {

/**
 * @brief Transition of a query: matches == true when the query just became active, false when it just
 * became inactive.
 *
 * Raw events produced by the evaluator adapter carry only the query and the matches flag. The monitor
 * resolves the alias and suffix after priority resolution, producing a new event (see with_range) rather
 * than editing one that has already been emitted.
 */
struct RANGEWATCH_EXPORT ChangeEvent {
    std::string query{};
    bool matches{false};
    std::string alias{};
    std::string suffix{};

    [[nodiscard]] bool has_alias() const { return !alias.empty(); }

    /**
     * A copy of this event carrying the alias and suffix of ``range``. The query and matches flag are
     * those of this event.
     */
    [[nodiscard]] ChangeEvent with_range(const RangeDefinition &range) const;

    bool operator==(const ChangeEvent &) const = default;
};

} // namespace rangewatch
