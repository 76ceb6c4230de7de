#include <rangewatch/runtime/change_queue.h>

#include <algorithm>
#include <utility>

namespace rangewatch {
    struct ChangeQueue::FlushGuard {
        explicit FlushGuard(ChangeQueue &queue) : _queue{queue} {}
        ~FlushGuard() { _queue._flush_pending = false; }

    private:
        ChangeQueue &_queue;
    };

    ChangeQueue::ChangeQueue(notify_type notify, const RangeDefinitions &ranges, FlushScheduler &scheduler)
        : _notify{std::move(notify)}, _ranges{ranges}, _scheduler{scheduler},
          _self{std::make_shared<ChangeQueue *>(this)} {
    }

    void ChangeQueue::on_raw_change(ChangeEvent change) {
        auto &buffer = change.matches ? _activated : _deactivated;
        buffer.push_back(std::move(change));
        if (!_flush_pending) { schedule_flush(); }
    }

    bool ChangeQueue::flush_pending() const { return _flush_pending; }

    std::size_t ChangeQueue::queued_activations() const { return _activated.size(); }

    std::size_t ChangeQueue::queued_deactivations() const { return _deactivated.size(); }

    FlushScheduler &ChangeQueue::scheduler() const { return _scheduler; }

    void ChangeQueue::add_observer(ChangeObserver *observer) {
        if (observer != nullptr && std::find(_observers.begin(), _observers.end(), observer) == _observers.end()) {
            _observers.push_back(observer);
        }
    }

    void ChangeQueue::remove_observer(ChangeObserver *observer) { std::erase(_observers, observer); }

    const std::vector<ChangeObserver *> &ChangeQueue::observers() const { return _observers; }

    void ChangeQueue::schedule_flush() {
        _flush_pending = true;
        std::weak_ptr<ChangeQueue *> self{_self};
        try {
            _scheduler.schedule([self] {
                if (auto queue = self.lock()) { (*queue)->flush(); }
            });
        } catch (...) {
            // The scheduler refused the task (or an immediate flush threw): leave the next event free to retry.
            _flush_pending = false;
            throw;
        }
    }

    void ChangeQueue::flush() {
        {
            FlushGuard guard{*this};
            // Take the cycle's events, anything raised while announcing goes into the next cycle.
            auto deactivated = std::exchange(_deactivated, {});
            auto activated = std::exchange(_activated, {});

            for (auto *observer : _observers) { observer->on_before_flush(deactivated.size(), activated.size()); }

            std::size_t emitted{0};
            try {
                for (const auto &change : deactivated) {
                    _notify(change);
                    ++emitted;
                }
                if (const auto *activation = find_activation(activated); activation != nullptr) {
                    _notify(*activation);
                    ++emitted;
                }
            } catch (...) {
                // Events raised before the failure would otherwise leak into an unrelated later cycle.
                _activated.clear();
                _deactivated.clear();
                throw;
            }

            for (auto *observer : _observers) { observer->on_after_flush(emitted); }
        }
        if (!_activated.empty() || !_deactivated.empty()) { schedule_flush(); }
    }

    const ChangeEvent *ChangeQueue::find_activation(const std::vector<ChangeEvent> &activated) const {
        for (const auto &range : _ranges) {
            auto it = std::find_if(activated.begin(), activated.end(),
                                   [&range](const ChangeEvent &change) { return change.query == range.query; });
            if (it != activated.end()) { return &*it; }
        }
        return nullptr;
    }
} // namespace rangewatch
