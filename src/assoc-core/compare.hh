#pragma once

#include <assoc-core/fwd.hh>

#include <concepts>
#include <type_traits>

/// Natural order: a < b
/// Default Less parameter of sorted_array_map.
struct ac::less
{
    template <class A, class B>
    [[nodiscard]] constexpr bool operator()(A const& a, B const& b) const
        requires requires {
            { a < b } -> std::convertible_to<bool>;
        }
    {
        return bool(a < b);
    }
};

namespace ac
{
/// Less is a strict weak ordering on K, called as less(a, b) == "a comes before b".
/// A key type without operator< and without a supplied comparator is rejected here,
/// at compile time, when the map type is instantiated.
///
/// Usage:
///   auto by_length = [](std::string const& a, std::string const& b) { return a.size() < b.size(); };
///   auto m = ac::sorted_array_map<std::string, int, decltype(by_length)>(by_length);
template <class Less, class K>
concept ordering_for = std::is_copy_constructible_v<Less> && requires(Less const& less, K const& a, K const& b) {
    { less(a, b) } -> std::convertible_to<bool>;
};

/// Keys are equivalent under Less iff neither comes before the other
template <class Less, class K>
    requires ordering_for<Less, K>
[[nodiscard]] constexpr bool equivalent(Less const& less, K const& a, K const& b)
{
    return !less(a, b) && !less(b, a);
}
} // namespace ac
