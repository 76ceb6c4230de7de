#ifndef RANGEWATCH_RANGE_MONITOR_H
#define RANGEWATCH_RANGE_MONITOR_H

#include <rangewatch/registry/breakpoint_registry.h>
#include <rangewatch/runtime/change_queue.h>
#include <rangewatch/runtime/change_stream.h>
#include <rangewatch/runtime/match_query.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rangewatch {
    /**
     * Watches every range of a registry and publishes their transitions as ChangeEvents.
     *
     * It is the RangeMonitor that:
     *  - registers each distinct registry query with the evaluator adapter on construction
     *  - routes the raw transitions of registered ranges through a ChangeQueue (priority + coalescing)
     *  - forwards transitions of ad-hoc queries (observed but not in the registry) directly
     *  - injects the alias and suffix of the matching range into every outgoing event
     *  - answers "what is active right now" (active, active_overlaps, is_active)
     *
     * The registry, adapter and scheduler must outlive the monitor. Destroying the monitor detaches all of
     * its adapter listeners.
     */
    class RANGEWATCH_EXPORT RangeMonitor {
    public:
        RangeMonitor(const BreakPointRegistry &breakpoints, MatchQuery &match_query, FlushScheduler &scheduler);

        ~RangeMonitor();

        RangeMonitor(const RangeMonitor &) = delete;

        RangeMonitor &operator=(const RangeMonitor &) = delete;

        /**
         * Read-only access to the ranges of the registry, in priority order.
         */
        [[nodiscard]] const RangeDefinitions &breakpoints() const;

        [[nodiscard]] const BreakPointRegistry &registry() const;

        /**
         * Is the range named by ``alias_or_query`` currently true? Unknown aliases are evaluated as literal
         * queries, which are false when nothing matches them.
         */
        [[nodiscard]] bool is_active(std::string_view alias_or_query) const;

        /**
         * The highest priority currently true range that is not overlapping. When only overlapping ranges
         * are true, the lowest priority of those is returned; nullptr when nothing is true.
         */
        [[nodiscard]] const RangeDefinition *active() const;

        /**
         * The overlapping ranges that are currently true, in priority order.
         */
        [[nodiscard]] RangeDefinitions active_overlaps() const;

        /**
         * All transitions.
         */
        [[nodiscard]] ChangeStream observe() const;

        /**
         * Only the transitions of the query named by ``alias_or_query``, labelled with the alias that was
         * observed. Each new subscriber first receives the current state when the query is active. A literal
         * query that is not in the registry is registered with the adapter when the stream is first
         * subscribed to; that first announcement is forwarded like any ad-hoc transition, so it also reaches
         * subscribers of observe().
         */
        [[nodiscard]] ChangeStream observe(std::string_view alias_or_query);

        Subscription subscribe(ChangeCallback callback);

        void add_observer(ChangeObserver *observer);

        void remove_observer(ChangeObserver *observer);

    protected:
        void register_breakpoints();

        void register_query(const std::string &query);

        [[nodiscard]] bool is_registered(const std::string &query) const;

        /**
         * Give a new stream subscriber the current state of ``query``, registering an ad-hoc query first.
         */
        void announce_current(const std::string &query, const ChangeCallback &deliver);

        void on_raw_change(const ChangeEvent &change);

        /**
         * Inject alias information and publish.
         */
        void next(const ChangeEvent &change);

    private:
        const BreakPointRegistry &_breakpoints;
        MatchQuery &_match_query;
        ChangeQueue _queue;
        ChangeSubject _source;
        std::vector<std::pair<std::string, ListenerId>> _registrations;
        std::shared_ptr<RangeMonitor *> _self;
    };
} // namespace rangewatch

#endif  // RANGEWATCH_RANGE_MONITOR_H
