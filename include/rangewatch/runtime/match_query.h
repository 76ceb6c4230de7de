#ifndef RANGEWATCH_MATCH_QUERY_H
#define RANGEWATCH_MATCH_QUERY_H

#include <rangewatch/runtime/query_evaluator.h>
#include <rangewatch/types/change_event.h>

#include <string>
#include <string_view>
#include <vector>

namespace rangewatch {
    /**
     * Adapter between the evaluator capability and the engine.
     *
     * Owns the map from query string to its single underlying evaluator subscription and the logical
     * listeners fanned out from it: however many listeners are registered for a query, the evaluator sees
     * exactly one on_change for it. Every underlying transition is turned into a raw ChangeEvent
     * (query + matches, no alias) and delivered to all listeners of that query.
     *
     * A listener registered while its query is already true immediately receives one synthetic activation,
     * so late subscribers still learn about a range that is already active.
     *
     * Registration, removal and delivery are expected on one thread. The evaluator must outlive the adapter.
     */
    class RANGEWATCH_EXPORT MatchQuery {
    public:
        using callback_type = ChangeCallback;

        explicit MatchQuery(QueryEvaluator &evaluator);

        ~MatchQuery();

        MatchQuery(const MatchQuery &) = delete;

        MatchQuery &operator=(const MatchQuery &) = delete;

        /**
         * Current truth of ``query`` as reported by the evaluator. The query does not need to be registered;
         * empty and unknown queries are false.
         */
        [[nodiscard]] bool is_active(std::string_view query) const;

        /**
         * Attach ``callback`` to the transitions of ``query``. Returns INVALID_LISTENER_ID (and registers
         * nothing) for an empty query or an empty callback.
         */
        ListenerId register_query(const std::string &query, callback_type callback);

        /**
         * Detach a listener. The underlying evaluator subscription is dropped with the last listener.
         */
        void unregister_query(const std::string &query, ListenerId id);

        [[nodiscard]] bool is_registered(std::string_view query) const;

        [[nodiscard]] std::size_t listener_count(std::string_view query) const;

        [[nodiscard]] std::vector<std::string> registered_queries() const;

        [[nodiscard]] QueryEvaluator &evaluator() const;

    private:
        struct Entry {
            ListenerId underlying{INVALID_LISTENER_ID};
            std::vector<std::pair<ListenerId, callback_type>> listeners;
        };

        void dispatch(const std::string &query, const QueryResult &result);

        QueryEvaluator &_evaluator;
        StringMap<Entry> _registry;
        ListenerId _next_id{1};
    };
} // namespace rangewatch

#endif  // RANGEWATCH_MATCH_QUERY_H
