#ifndef RANGEWATCH_CHANGE_QUEUE_H
#define RANGEWATCH_CHANGE_QUEUE_H

#include <rangewatch/runtime/change_observer.h>
#include <rangewatch/runtime/flush_scheduler.h>
#include <rangewatch/types/change_event.h>
#include <rangewatch/types/range_definition.h>

#include <functional>
#include <memory>
#include <vector>

namespace rangewatch {
    /**
     * Coalesces the raw transitions of one flush cycle into the canonical notification sequence.
     *
     * Raw events are buffered as activations or deactivations. The first event of a cycle asks the
     * scheduler for a flush; the flush then announces:
     *
     * 1. every buffered deactivation, in arrival order,
     * 2. at most one activation: walking the ranges in priority order, the first range that has a queued
     *    activation wins. Arrival order never breaks ties, and activations for queries that are not in
     *    the range list are not announced.
     *
     * A deactivation and an activation of the same query in one cycle are both announced. An empty cycle
     * announces nothing.
     *
     * ``ranges`` must outlive the queue. Events raised while a flush is announcing are held for a
     * follow-up flush, scheduled once the current one completes.
     */
    class RANGEWATCH_EXPORT ChangeQueue {
    public:
        using notify_type = std::function<void(const ChangeEvent &)>;

        ChangeQueue(notify_type notify, const RangeDefinitions &ranges, FlushScheduler &scheduler);

        ChangeQueue(const ChangeQueue &) = delete;

        ChangeQueue &operator=(const ChangeQueue &) = delete;

        /**
         * Notification from the evaluator adapter that a query activated or deactivated.
         */
        void on_raw_change(ChangeEvent change);

        [[nodiscard]] bool flush_pending() const;

        [[nodiscard]] std::size_t queued_activations() const;

        [[nodiscard]] std::size_t queued_deactivations() const;

        [[nodiscard]] FlushScheduler &scheduler() const;

        void add_observer(ChangeObserver *observer);

        void remove_observer(ChangeObserver *observer);

        [[nodiscard]] const std::vector<ChangeObserver *> &observers() const;

    protected:
        void schedule_flush();

        void flush();

        /**
         * Highest priority queued activation, nullptr when none of them belongs to a known range.
         */
        [[nodiscard]] const ChangeEvent *find_activation(const std::vector<ChangeEvent> &activated) const;

    private:
        struct FlushGuard;

        notify_type _notify;
        const RangeDefinitions &_ranges;
        FlushScheduler &_scheduler;
        std::vector<ChangeEvent> _activated;
        std::vector<ChangeEvent> _deactivated;
        bool _flush_pending{false};
        std::vector<ChangeObserver *> _observers;
        // Deferred flushes hold a weak reference so a queue destroyed before its turn is skipped.
        std::shared_ptr<ChangeQueue *> _self;
    };
} // namespace rangewatch

#endif  // RANGEWATCH_CHANGE_QUEUE_H
