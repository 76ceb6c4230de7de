#ifndef RANGEWATCH_OBSERVABLE_RANGES_H
#define RANGEWATCH_OBSERVABLE_RANGES_H

#include <rangewatch/runtime/change_stream.h>

#include <string_view>

namespace rangewatch {
    /**
     * Activation-only view of range transitions, for consumers that only care about what just became
     * true. Deactivations are never delivered through this interface.
     */
    struct RANGEWATCH_EXPORT ObservableRanges {
        virtual ~ObservableRanges() = default;

        [[nodiscard]] virtual bool is_active(std::string_view alias_or_query) const = 0;

        /**
         * The activation stream, for composing further filters.
         */
        [[nodiscard]] virtual ChangeStream as_observable() const = 0;

        virtual Subscription subscribe(ChangeCallback next) = 0;
    };

    /**
     * ObservableRanges over the stream of a RangeMonitor, which must outlive the service.
     */
    class RANGEWATCH_EXPORT RangeService final : public ObservableRanges {
    public:
        explicit RangeService(RangeMonitor &monitor);

        [[nodiscard]] bool is_active(std::string_view alias_or_query) const override;

        [[nodiscard]] ChangeStream as_observable() const override;

        Subscription subscribe(ChangeCallback next) override;

    private:
        RangeMonitor &_monitor;
    };
} // namespace rangewatch

#endif  // RANGEWATCH_OBSERVABLE_RANGES_H
