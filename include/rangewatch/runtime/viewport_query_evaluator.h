#ifndef RANGEWATCH_VIEWPORT_QUERY_EVALUATOR_H
#define RANGEWATCH_VIEWPORT_QUERY_EVALUATOR_H

#include <rangewatch/runtime/query_evaluator.h>
#include <rangewatch/runtime/viewport_query.h>

#include <string>
#include <string_view>

namespace rangewatch {
    /**
     * Evaluator for hosts that own a window or surface: queries are tested against a Viewport model and the
     * host reports geometry changes through resize / set_media_type.
     *
     * A viewport change re-evaluates every query that has listeners and notifies the ones whose state
     * flipped, all deactivations of the change before any activation. Queries outside the supported dialect
     * (see ViewportQuery) never match.
     */
    class RANGEWATCH_EXPORT ViewportQueryEvaluator : public QueryEvaluatorBase {
    public:
        explicit ViewportQueryEvaluator(Viewport viewport = {});

        [[nodiscard]] QueryResult evaluate(std::string_view query) const override;

        [[nodiscard]] const Viewport &viewport() const;

        /**
         * Returns the number of queries that changed state.
         */
        std::size_t resize(int width, int height);

        std::size_t set_media_type(std::string media_type);

        std::size_t set_viewport(Viewport viewport);

        /**
         * Number of parsed queries held, one per query with listeners. Other queries are parsed per call.
         */
        [[nodiscard]] std::size_t cached_queries() const;

    protected:
        void on_first_listener(const std::string &query) override;

        void on_last_listener(const std::string &query) override;

    private:
        std::size_t viewport_changed();

        Viewport _viewport;
        StringMap<ViewportQuery> _parsed;
        // Last state announced for each query with listeners.
        StringMap<bool> _matches;
    };
} // namespace rangewatch

#endif  // RANGEWATCH_VIEWPORT_QUERY_EVALUATOR_H
