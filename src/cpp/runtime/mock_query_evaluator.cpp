#include <rangewatch/runtime/mock_query_evaluator.h>

#include <algorithm>

namespace rangewatch {
    MockQueryEvaluator::MockQueryEvaluator(const BreakPointRegistry &registry) : _registry{&registry} {}

    QueryResult MockQueryEvaluator::evaluate(std::string_view query) const {
        if (query.empty()) { return {}; }
        return {std::find(_active.begin(), _active.end(), query) != _active.end()};
    }

    bool MockQueryEvaluator::activate(std::string_view alias_or_query, bool exclusive) {
        auto query = resolve(alias_or_query);
        if (query.empty()) { return false; }

        bool changed{false};
        if (exclusive) {
            auto others = _active;
            for (const auto &other : others) {
                if (other != query) { changed = set_state(other, false) || changed; }
            }
        }
        changed = set_state(query, true) || changed;
        return changed;
    }

    bool MockQueryEvaluator::deactivate(std::string_view alias_or_query) {
        return set_state(resolve(alias_or_query), false);
    }

    void MockQueryEvaluator::clear_all() {
        auto active = _active;
        for (const auto &query : active) { set_state(query, false); }
    }

    const std::vector<std::string> &MockQueryEvaluator::active_queries() const { return _active; }

    std::string MockQueryEvaluator::resolve(std::string_view alias_or_query) const {
        return _registry != nullptr ? _registry->resolve_query(alias_or_query) : std::string{alias_or_query};
    }

    bool MockQueryEvaluator::set_state(const std::string &query, bool matches) {
        if (query.empty() || evaluate(query).matches == matches) { return false; }
        if (matches) {
            _active.push_back(query);
        } else {
            std::erase(_active, query);
        }
        notify(query, matches);
        return true;
    }
} // namespace rangewatch
