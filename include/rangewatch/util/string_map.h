#pragma once

/**
 * @file string_map.h
 * @brief String keyed hash map used for the alias, query and listener indices.
 *
 * Keys are owned std::string, lookups accept std::string_view without materialising a temporary string.
 */

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace rangewatch {

struct StringHash {
    using is_transparent = void;
    using is_avalanching = void;

    [[nodiscard]] auto operator()(std::string_view value) const noexcept -> uint64_t {
        return ankerl::unordered_dense::hash<std::string_view>{}(value);
    }
};

template<typename V>
using StringMap = ankerl::unordered_dense::map<std::string, V, StringHash, std::equal_to<>>;

using StringSet = ankerl::unordered_dense::set<std::string, StringHash, std::equal_to<>>;

} // namespace rangewatch
