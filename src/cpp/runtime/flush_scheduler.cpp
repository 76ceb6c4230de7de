#include <rangewatch/runtime/flush_scheduler.h>

namespace rangewatch {
    void ImmediateScheduler::schedule(task_type task) {
        if (task) { task(); }
    }

    ScheduleMode ImmediateScheduler::mode() const { return ScheduleMode::IMMEDIATE; }

    void DeferredScheduler::schedule(task_type task) {
        if (!task) { return; }
        LockGuard guard(_lock);
        _tasks.push_back(std::move(task));
    }

    ScheduleMode DeferredScheduler::mode() const { return ScheduleMode::DEFERRED; }

    std::size_t DeferredScheduler::run_pending() {
        std::deque<task_type> turn;
        {
            LockGuard guard(_lock);
            turn.swap(_tasks);
        }
        std::size_t count{0};
        while (!turn.empty()) {
            auto task = std::move(turn.front());
            turn.pop_front();
            ++count;
            try {
                task();
            } catch (...) {
                // Put the rest of this turn back ahead of anything queued since, then surface the error.
                LockGuard guard(_lock);
                while (!turn.empty()) {
                    _tasks.push_front(std::move(turn.back()));
                    turn.pop_back();
                }
                throw;
            }
        }
        return count;
    }

    std::size_t DeferredScheduler::pending() const {
        LockGuard guard(_lock);
        return _tasks.size();
    }

    DeferredScheduler::operator bool() const { return pending() > 0; }

    flush_scheduler_u_ptr make_scheduler(ScheduleMode mode) {
        switch (mode) {
            case ScheduleMode::IMMEDIATE: return std::make_unique<ImmediateScheduler>();
            case ScheduleMode::DEFERRED: return std::make_unique<DeferredScheduler>();
        }
        return std::make_unique<ImmediateScheduler>();
    }
} // namespace rangewatch
