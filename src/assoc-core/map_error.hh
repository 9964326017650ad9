#pragma once

#include <assoc-core/fwd.hh>

#include <string>

/// Recoverable failures of map operations, carried in ac::result<T, ac::map_error>.
/// Programmer errors (bad capacity, bad load factor, invalid copy function) are assertions instead.
enum class ac::map_error : ac::u8
{
    /// get(key) for a key that is not in the map
    not_found,

    /// min/max/remove_min/remove_max on an empty map
    underflow,

    /// select(rank) with rank outside [0, size)
    index_out_of_range,
};

namespace ac
{
/// "not_found", "underflow", "index_out_of_range"
[[nodiscard]] std::string to_string(map_error e);
} // namespace ac
