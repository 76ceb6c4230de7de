#ifndef RANGEWATCH_FORWARD_DECLARATIONS_H
#define RANGEWATCH_FORWARD_DECLARATIONS_H

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rangewatch {
    // RangeDefinition - value type, registry lookups hand out const RangeDefinition * into the registry
    struct RangeDefinition;
    using RangeDefinitions = std::vector<RangeDefinition>;

    struct ChangeEvent;
    using ChangeCallback = std::function<void(const ChangeEvent &)>;
    using ChangePredicate = std::function<bool(const ChangeEvent &)>;

    class BreakPointRegistry;

    // Evaluator capability and the adapter that multiplexes on top of it
    struct QueryEvaluator;
    class MatchQuery;

    using ListenerId = std::size_t;
    inline constexpr ListenerId INVALID_LISTENER_ID = 0;

    struct FlushScheduler;
    using flush_scheduler_u_ptr = std::unique_ptr<FlushScheduler>;

    struct ChangeObserver;

    class ChangeQueue;
    class RangeMonitor;
    struct ObservableRanges;
} // namespace rangewatch

#endif  // RANGEWATCH_FORWARD_DECLARATIONS_H
