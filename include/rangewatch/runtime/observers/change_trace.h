#pragma once

#include <rangewatch/runtime/change_observer.h>

#include <iosfwd>
#include <optional>
#include <string>

namespace rangewatch {

    /**
     * @brief Logs each step a change takes through the monitor: raw transition, flush, emitted event.
     *
     * Voluminous, but the quickest way to see why a range did or did not win a flush.
     */
    class RANGEWATCH_EXPORT ChangeTrace : public ChangeObserver {
    public:
        /**
         * @brief Construct a new Change Trace object
         *
         * @param filter Only report events whose query or alias contains this text
         * @param raw Log raw evaluator transitions
         * @param flush Log flush begin/end
         * @param emit Log the canonical events delivered to subscribers
         * @param out Stream to write to, by default std::cerr (or std::cout when the logger is disabled)
         */
        explicit ChangeTrace(const std::optional<std::string>& filter = std::nullopt,
                             bool raw = true, bool flush = true, bool emit = true,
                             std::ostream* out = nullptr);

        void on_raw_change(const ChangeEvent& change) override;
        void on_before_flush(std::size_t deactivations, std::size_t activations) override;
        void on_after_flush(std::size_t emitted) override;
        void on_emit(const ChangeEvent& change) override;

        // Static configuration
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _raw;
        bool _flush;
        bool _emit;
        std::ostream* _out;

        static bool _use_logger;

        void _print(const std::string& msg) const;
        bool _should_log(const ChangeEvent& change) const;
    };

} // namespace rangewatch
