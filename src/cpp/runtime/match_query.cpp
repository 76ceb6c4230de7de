#include <rangewatch/runtime/match_query.h>

#include <algorithm>
#include <cstdio>
#include <exception>

namespace rangewatch {
    MatchQuery::MatchQuery(QueryEvaluator &evaluator) : _evaluator{evaluator} {}

    MatchQuery::~MatchQuery() {
        for (const auto &[query, entry] : _registry) {
            try {
                _evaluator.off_change(query, entry.underlying);
            } catch (const std::exception &e) {
                fprintf(stderr, "Warning: exception while detaching query '%s': %s\n", query.c_str(), e.what());
            }
        }
    }

    bool MatchQuery::is_active(std::string_view query) const {
        if (query.empty()) { return false; }
        return _evaluator.evaluate(query).matches;
    }

    ListenerId MatchQuery::register_query(const std::string &query, callback_type callback) {
        if (query.empty() || !callback) { return INVALID_LISTENER_ID; }

        auto it = _registry.find(query);
        if (it == _registry.end()) {
            Entry entry;
            entry.underlying = _evaluator.on_change(query, [this, query](const QueryResult &result) {
                dispatch(query, result);
            });
            it = _registry.emplace(query, std::move(entry)).first;
        }
        auto id = _next_id++;
        it->second.listeners.emplace_back(id, callback);

        // Announce an already active range to the new listener only.
        if (is_active(query)) { callback(ChangeEvent{query, true}); }
        return id;
    }

    void MatchQuery::unregister_query(const std::string &query, ListenerId id) {
        auto it = _registry.find(query);
        if (it == _registry.end()) { return; }
        auto &listeners = it->second.listeners;
        std::erase_if(listeners, [id](const auto &entry) { return entry.first == id; });
        if (listeners.empty()) {
            auto underlying = it->second.underlying;
            _registry.erase(it);
            _evaluator.off_change(query, underlying);
        }
    }

    bool MatchQuery::is_registered(std::string_view query) const { return _registry.contains(query); }

    std::size_t MatchQuery::listener_count(std::string_view query) const {
        auto it = _registry.find(query);
        return it == _registry.end() ? 0 : it->second.listeners.size();
    }

    std::vector<std::string> MatchQuery::registered_queries() const {
        std::vector<std::string> queries;
        queries.reserve(_registry.size());
        for (const auto &[query, _] : _registry) { queries.push_back(query); }
        return queries;
    }

    QueryEvaluator &MatchQuery::evaluator() const { return _evaluator; }

    void MatchQuery::dispatch(const std::string &query, const QueryResult &result) {
        auto it = _registry.find(query);
        if (it == _registry.end()) { return; }

        std::vector<ListenerId> ids;
        ids.reserve(it->second.listeners.size());
        for (const auto &entry : it->second.listeners) { ids.push_back(entry.first); }

        const ChangeEvent change{query, result.matches};
        for (auto id : ids) {
            auto current = _registry.find(query);
            if (current == _registry.end()) { return; }
            auto &listeners = current->second.listeners;
            auto entry = std::find_if(listeners.begin(), listeners.end(),
                                      [id](const auto &candidate) { return candidate.first == id; });
            if (entry == listeners.end()) { continue; }
            auto callback = entry->second;
            callback(change);
        }
    }
} // namespace rangewatch
