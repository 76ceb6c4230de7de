#include <rangewatch/runtime/viewport_query_evaluator.h>

#include <vector>

namespace rangewatch {
    ViewportQueryEvaluator::ViewportQueryEvaluator(Viewport viewport) : _viewport{std::move(viewport)} {}

    QueryResult ViewportQueryEvaluator::evaluate(std::string_view query) const {
        if (query.empty()) { return {}; }
        if (auto it = _parsed.find(query); it != _parsed.end()) { return {it->second.matches(_viewport)}; }
        return {ViewportQuery::parse(query).matches(_viewport)};
    }

    const Viewport &ViewportQueryEvaluator::viewport() const { return _viewport; }

    std::size_t ViewportQueryEvaluator::resize(int width, int height) {
        _viewport.width = width;
        _viewport.height = height;
        return viewport_changed();
    }

    std::size_t ViewportQueryEvaluator::set_media_type(std::string media_type) {
        _viewport.media_type = std::move(media_type);
        return viewport_changed();
    }

    std::size_t ViewportQueryEvaluator::set_viewport(Viewport viewport) {
        _viewport = std::move(viewport);
        return viewport_changed();
    }

    std::size_t ViewportQueryEvaluator::cached_queries() const { return _parsed.size(); }

    void ViewportQueryEvaluator::on_first_listener(const std::string &query) {
        _parsed.insert_or_assign(query, ViewportQuery::parse(query));
        _matches[query] = evaluate(query).matches;
    }

    void ViewportQueryEvaluator::on_last_listener(const std::string &query) {
        _matches.erase(query);
        _parsed.erase(query);
    }

    std::size_t ViewportQueryEvaluator::viewport_changed() {
        std::vector<std::string> deactivated;
        std::vector<std::string> activated;
        for (auto &[query, matches] : _matches) {
            bool now = evaluate(query).matches;
            if (now == matches) { continue; }
            matches = now;
            (now ? activated : deactivated).push_back(query);
        }
        for (const auto &query : deactivated) { notify(query, false); }
        for (const auto &query : activated) { notify(query, true); }
        return deactivated.size() + activated.size();
    }
} // namespace rangewatch
