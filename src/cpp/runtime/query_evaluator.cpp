#include <rangewatch/runtime/query_evaluator.h>

#include <algorithm>

namespace rangewatch {
    ListenerId QueryEvaluatorBase::on_change(const std::string &query, QueryListener listener) {
        if (!listener) { return INVALID_LISTENER_ID; }
        auto id = _next_id++;
        auto [it, inserted] = _listeners.try_emplace(query);
        it->second.emplace_back(id, std::move(listener));
        if (inserted) { on_first_listener(query); }
        return id;
    }

    void QueryEvaluatorBase::off_change(const std::string &query, ListenerId id) {
        auto it = _listeners.find(query);
        if (it == _listeners.end()) { return; }
        auto &listeners = it->second;
        std::erase_if(listeners, [id](const auto &entry) { return entry.first == id; });
        if (listeners.empty()) {
            _listeners.erase(it);
            on_last_listener(query);
        }
    }

    std::size_t QueryEvaluatorBase::listener_count(std::string_view query) const {
        auto it = _listeners.find(query);
        return it == _listeners.end() ? 0 : it->second.size();
    }

    bool QueryEvaluatorBase::has_listeners(std::string_view query) const { return listener_count(query) > 0; }

    std::vector<std::string> QueryEvaluatorBase::subscribed_queries() const {
        std::vector<std::string> queries;
        queries.reserve(_listeners.size());
        for (const auto &[query, _] : _listeners) { queries.push_back(query); }
        return queries;
    }

    void QueryEvaluatorBase::notify(const std::string &query, bool matches) {
        auto it = _listeners.find(query);
        if (it == _listeners.end()) { return; }

        std::vector<ListenerId> ids;
        ids.reserve(it->second.size());
        for (const auto &entry : it->second) { ids.push_back(entry.first); }

        const QueryResult result{matches};
        for (auto id : ids) {
            // Re-resolve every time, a listener may have (un)registered listeners and moved the storage.
            auto current = _listeners.find(query);
            if (current == _listeners.end()) { return; }
            auto &listeners = current->second;
            auto entry = std::find_if(listeners.begin(), listeners.end(),
                                      [id](const auto &candidate) { return candidate.first == id; });
            if (entry == listeners.end()) { continue; }
            auto listener = entry->second;
            listener(result);
        }
    }
} // namespace rangewatch
