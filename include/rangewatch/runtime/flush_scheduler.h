#ifndef RANGEWATCH_FLUSH_SCHEDULER_H
#define RANGEWATCH_FLUSH_SCHEDULER_H

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/rangewatch_forward_declarations.h>

#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace rangewatch {
    enum class ScheduleMode { IMMEDIATE = 0, DEFERRED = 1 };

    /**
     * Decides when a change queue flush runs.
     *
     * IMMEDIATE runs the flush in-line, before the raw change that requested it returns; use it where
     * notifications must be deterministic (tests, replays). DEFERRED holds the flush until the host loop
     * next calls DeferredScheduler::run_pending, so that every range flipped by one external change (a
     * single resize) lands in the same flush.
     */
    struct RANGEWATCH_EXPORT FlushScheduler {
        using task_type = std::function<void()>;

        virtual ~FlushScheduler() = default;

        virtual void schedule(task_type task) = 0;

        [[nodiscard]] virtual ScheduleMode mode() const = 0;
    };

    struct RANGEWATCH_EXPORT ImmediateScheduler final : FlushScheduler {
        void schedule(task_type task) override;

        [[nodiscard]] ScheduleMode mode() const override;
    };

    /**
     * Next-turn scheduler. Tasks may be posted from any thread, they only ever run on the thread calling
     * run_pending.
     */
    struct RANGEWATCH_EXPORT DeferredScheduler final : FlushScheduler {
        using LockType = std::mutex;
        using LockGuard = std::lock_guard<LockType>;

        void schedule(task_type task) override;

        [[nodiscard]] ScheduleMode mode() const override;

        /**
         * Run the tasks queued before this call. Tasks scheduled while these run are left for the next turn.
         * Returns the number of tasks that ran.
         */
        std::size_t run_pending();

        [[nodiscard]] std::size_t pending() const;

        explicit operator bool() const;

    private:
        mutable LockType _lock;
        std::deque<task_type> _tasks;
    };

    [[nodiscard]] RANGEWATCH_EXPORT flush_scheduler_u_ptr make_scheduler(ScheduleMode mode);
} // namespace rangewatch

#endif  // RANGEWATCH_FLUSH_SCHEDULER_H
