#ifndef RANGEWATCH_CHANGE_OBSERVER_H
#define RANGEWATCH_CHANGE_OBSERVER_H

#include <rangewatch/rangewatch_export.h>
#include <rangewatch/types/change_event.h>

#include <cstddef>

namespace rangewatch {
    /**
     * Hooks into the monitor pipeline, used for tracing. Observers are externally owned and must be removed
     * before they are destroyed.
     */
    struct RANGEWATCH_EXPORT ChangeObserver {
        virtual ~ChangeObserver() = default;

        // A raw transition reported by the evaluator adapter, before coalescing.
        virtual void on_raw_change(const ChangeEvent &) {
        };

        virtual void on_before_flush(std::size_t /*deactivations*/, std::size_t /*activations*/) {
        };

        virtual void on_after_flush(std::size_t /*emitted*/) {
        };

        // A canonical event, alias injected, about to be delivered to subscribers.
        virtual void on_emit(const ChangeEvent &) {
        };
    };
} // namespace rangewatch

#endif  // RANGEWATCH_CHANGE_OBSERVER_H
