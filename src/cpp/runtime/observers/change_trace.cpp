#include <rangewatch/runtime/observers/change_trace.h>
#include <rangewatch/util/string_utils.h>

#include <fmt/format.h>
#include <iostream>

namespace rangewatch {

    // Static member initialization
    bool ChangeTrace::_use_logger = true;

    ChangeTrace::ChangeTrace(const std::optional<std::string>& filter, bool raw, bool flush, bool emit,
                             std::ostream* out)
        : _filter(filter), _raw(raw), _flush(flush), _emit(emit), _out(out) {
    }

    void ChangeTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void ChangeTrace::on_raw_change(const ChangeEvent& change) {
        if (!_raw || !_should_log(change)) {
            return;
        }
        _print(fmt::format("raw {}", change));
    }

    void ChangeTrace::on_before_flush(std::size_t deactivations, std::size_t activations) {
        if (!_flush) {
            return;
        }
        _print(fmt::format("flush begin: {} deactivation(s), {} activation(s) queued", deactivations, activations));
    }

    void ChangeTrace::on_after_flush(std::size_t emitted) {
        if (!_flush) {
            return;
        }
        _print(fmt::format("flush end: {} emitted", emitted));
    }

    void ChangeTrace::on_emit(const ChangeEvent& change) {
        if (!_emit || !_should_log(change)) {
            return;
        }
        _print(fmt::format("emit {}", change));
    }

    void ChangeTrace::_print(const std::string& msg) const {
        std::string formatted = fmt::format("[rangewatch] {}", msg);
        if (_out != nullptr) {
            *_out << formatted << std::endl;
        } else if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    bool ChangeTrace::_should_log(const ChangeEvent& change) const {
        if (!_filter.has_value()) {
            return true;
        }
        return contains(change.query, _filter.value()) || (change.has_alias() && contains(change.alias, _filter.value()));
    }

} // namespace rangewatch
