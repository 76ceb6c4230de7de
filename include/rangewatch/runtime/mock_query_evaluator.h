#ifndef RANGEWATCH_MOCK_QUERY_EVALUATOR_H
#define RANGEWATCH_MOCK_QUERY_EVALUATOR_H

#include <rangewatch/registry/breakpoint_registry.h>
#include <rangewatch/runtime/query_evaluator.h>

#include <string>
#include <string_view>
#include <vector>

namespace rangewatch {
    /**
     * Evaluator whose query states are driven by hand, for tests and headless hosts.
     *
     * Queries are all false until activated. State changes notify listeners synchronously, deactivations
     * first. With a registry attached, aliases are accepted wherever a query is.
     */
    class RANGEWATCH_EXPORT MockQueryEvaluator : public QueryEvaluatorBase {
    public:
        MockQueryEvaluator() = default;

        /**
         * ``registry`` is only used to resolve aliases and must outlive the evaluator.
         */
        explicit MockQueryEvaluator(const BreakPointRegistry &registry);

        [[nodiscard]] QueryResult evaluate(std::string_view query) const override;

        /**
         * Make ``alias_or_query`` true. When ``exclusive`` (the default) every other active query is
         * deactivated first, simulating mutually exclusive ranges; otherwise other states are left alone.
         * Returns true when any query changed state.
         */
        bool activate(std::string_view alias_or_query, bool exclusive = true);

        /**
         * Make ``alias_or_query`` false. Returns true when it was active.
         */
        bool deactivate(std::string_view alias_or_query);

        /**
         * Deactivate everything, notifying listeners. Listeners stay attached.
         */
        void clear_all();

        /**
         * Active queries in activation order.
         */
        [[nodiscard]] const std::vector<std::string> &active_queries() const;

    private:
        [[nodiscard]] std::string resolve(std::string_view alias_or_query) const;

        bool set_state(const std::string &query, bool matches);

        const BreakPointRegistry *_registry{nullptr};
        std::vector<std::string> _active;
    };
} // namespace rangewatch

#endif  // RANGEWATCH_MOCK_QUERY_EVALUATOR_H
