#ifndef RANGEWATCH_QUERY_EVALUATOR_H
#define RANGEWATCH_QUERY_EVALUATOR_H

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/rangewatch_forward_declarations.h>
#include <rangewatch/util/string_map.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rangewatch {
    struct QueryResult {
        bool matches{false};
    };

    using QueryListener = std::function<void(const QueryResult &)>;

    /**
     * The capability that knows how to test a query string and report its transitions. Supplied by the host
     * (a windowing layer, a test double, ...); the engine never interprets the query itself.
     *
     * A query the evaluator does not understand must simply never match, evaluate does not throw.
     */
    struct RANGEWATCH_EXPORT QueryEvaluator {
        virtual ~QueryEvaluator() = default;

        [[nodiscard]] virtual QueryResult evaluate(std::string_view query) const = 0;

        /**
         * Register a listener called with the new state on every transition of ``query``.
         */
        virtual ListenerId on_change(const std::string &query, QueryListener listener) = 0;

        virtual void off_change(const std::string &query, ListenerId id) = 0;
    };

    /**
     * Listener bookkeeping shared by the evaluators shipped with the engine.
     */
    struct RANGEWATCH_EXPORT QueryEvaluatorBase : QueryEvaluator {
        ListenerId on_change(const std::string &query, QueryListener listener) override;

        void off_change(const std::string &query, ListenerId id) override;

        [[nodiscard]] std::size_t listener_count(std::string_view query) const;

        [[nodiscard]] bool has_listeners(std::string_view query) const;

        /**
         * Queries that currently have at least one listener.
         */
        [[nodiscard]] std::vector<std::string> subscribed_queries() const;

    protected:
        /**
         * Deliver ``matches`` to every listener of ``query``. Listeners removed while this runs are skipped.
         */
        void notify(const std::string &query, bool matches);

        /**
         * Called when ``query`` gains its first listener and after it loses its last one.
         */
        virtual void on_first_listener(const std::string &) {}

        virtual void on_last_listener(const std::string &) {}

    private:
        StringMap<std::vector<std::pair<ListenerId, QueryListener>>> _listeners;
        ListenerId _next_id{1};
    };
} // namespace rangewatch

#endif  // RANGEWATCH_QUERY_EVALUATOR_H
