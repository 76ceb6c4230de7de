#ifndef RANGEWATCH_UTIL_ERRORS
#define RANGEWATCH_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <stdexcept>
#include <string>
#include <utility>

namespace rangewatch {

    /**
     * Raised when a breakpoint registry cannot be built from the supplied range lists, for example when an
     * alias required by a consumer is missing after the merge. Fatal to the build call only.
     */
    struct ConfigurationError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Raise ``Error`` with a message formatted from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace rangewatch

#endif // RANGEWATCH_UTIL_ERRORS
