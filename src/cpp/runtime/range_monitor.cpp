#include <rangewatch/runtime/range_monitor.h>

#include <algorithm>
#include <cstdio>
#include <exception>

namespace rangewatch {
    RangeMonitor::RangeMonitor(const BreakPointRegistry &breakpoints, MatchQuery &match_query,
                               FlushScheduler &scheduler)
        : _breakpoints{breakpoints}, _match_query{match_query},
          _queue{[this](const ChangeEvent &change) { next(change); }, breakpoints.items(), scheduler},
          _self{std::make_shared<RangeMonitor *>(this)} {
        register_breakpoints();
    }

    RangeMonitor::~RangeMonitor() {
        for (const auto &[query, id] : _registrations) {
            try {
                _match_query.unregister_query(query, id);
            } catch (const std::exception &e) {
                fprintf(stderr, "Warning: exception while unregistering query '%s': %s\n", query.c_str(), e.what());
            }
        }
    }

    const RangeDefinitions &RangeMonitor::breakpoints() const { return _breakpoints.items(); }

    const BreakPointRegistry &RangeMonitor::registry() const { return _breakpoints; }

    bool RangeMonitor::is_active(std::string_view alias_or_query) const {
        return _match_query.is_active(_breakpoints.resolve_query(alias_or_query));
    }

    const RangeDefinition *RangeMonitor::active() const {
        const RangeDefinition *fallback{nullptr};
        for (const auto &range : _breakpoints.items()) {
            if (!_match_query.is_active(range.query)) { continue; }
            if (!range.overlapping) { return &range; }
            fallback = &range;
        }
        return fallback;
    }

    RangeDefinitions RangeMonitor::active_overlaps() const {
        RangeDefinitions overlaps;
        for (const auto &range : _breakpoints.items()) {
            if (range.overlapping && _match_query.is_active(range.query)) { overlaps.push_back(range); }
        }
        return overlaps;
    }

    ChangeStream RangeMonitor::observe() const { return _source.as_stream(); }

    ChangeStream RangeMonitor::observe(std::string_view alias_or_query) {
        if (alias_or_query.empty()) { return observe(); }

        const auto *range = _breakpoints.find(alias_or_query);
        auto query = range != nullptr ? range->query : std::string{alias_or_query};
        auto predicate = [query](const ChangeEvent &change) { return change.query == query; };

        std::weak_ptr<RangeMonitor *> self{_self};
        auto stream = _source.as_stream(predicate, [self, query](const ChangeCallback &deliver) {
            if (auto monitor = self.lock()) { (*monitor)->announce_current(query, deliver); }
        });
        if (range == nullptr) { return stream; }
        // Several aliases may share a query, label with the one that was asked for.
        return stream.map([observed = *range](const ChangeEvent &change) { return change.with_range(observed); });
    }

    Subscription RangeMonitor::subscribe(ChangeCallback callback) { return _source.subscribe(std::move(callback)); }

    void RangeMonitor::add_observer(ChangeObserver *observer) { _queue.add_observer(observer); }

    void RangeMonitor::remove_observer(ChangeObserver *observer) { _queue.remove_observer(observer); }

    void RangeMonitor::register_breakpoints() {
        for (const auto &query : _breakpoints.queries()) { register_query(query); }
    }

    void RangeMonitor::register_query(const std::string &query) {
        if (is_registered(query)) { return; }
        // Record before registering: the adapter may announce the current state synchronously.
        _registrations.emplace_back(query, INVALID_LISTENER_ID);
        auto index = _registrations.size() - 1;
        auto id = _match_query.register_query(query, [this](const ChangeEvent &change) { on_raw_change(change); });
        _registrations[index].second = id;
    }

    bool RangeMonitor::is_registered(const std::string &query) const {
        return std::any_of(_registrations.begin(), _registrations.end(),
                           [&query](const auto &registration) { return registration.first == query; });
    }

    void RangeMonitor::announce_current(const std::string &query, const ChangeCallback &deliver) {
        if (!is_registered(query)) {
            // The adapter announces the current state of a new registration to the monitor, which forwards it.
            register_query(query);
            return;
        }
        if (_match_query.is_active(query)) { deliver(ChangeEvent{query, true}); }
    }

    void RangeMonitor::on_raw_change(const ChangeEvent &change) {
        for (auto *observer : _queue.observers()) { observer->on_raw_change(change); }
        if (_breakpoints.find_by_query(change.query) != nullptr) {
            _queue.on_raw_change(change);
        } else {
            next(change);
        }
    }

    void RangeMonitor::next(const ChangeEvent &change) {
        const auto *range = change.has_alias() ? nullptr : _breakpoints.find_by_query(change.query);
        const auto event = range != nullptr ? change.with_range(*range) : change;
        for (auto *observer : _queue.observers()) { observer->on_emit(event); }
        _source.next(event);
    }
} // namespace rangewatch
