#pragma once

#include <assoc-core/fwd.hh>
#include <assoc-core/impl/range_traits.hh>
#include <assoc-core/utility.hh>

#include <bit>
#include <concepts>
#include <cstdint>
#include <functional>
#include <iterator>
#include <string_view>
#include <tuple>
#include <type_traits>

// =========================================================================================================
// Structural hashing
// =========================================================================================================
//
// hash_of(v) produces a 64 bit hash that depends only on the observable value of v:
//   - types with a v.hash() member use it (entries, maps)
//   - integers, enums, chars, bools: mixed bit pattern
//   - floats: bit pattern, -0.0 hashes like 0.0
//   - pointers: the address
//   - string-likes: content bytes
//   - ranges: elements in order (deep), so vector<vector<int>> keys hash by content
//   - tuple-likes: elements in order
//   - anything else with a std::hash specialization
//
// Equal values (per ==) hash equally as long as the element types honor that contract.
// Hashes are not stable across versions and must not be persisted.

namespace ac
{
/// splitmix64 finalizer, every input bit affects every output bit
[[nodiscard]] constexpr u64 hash_mix(u64 x)
{
    x += 0x9e37'79b9'7f4a'7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58'476d'1ce4'e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d0'49bb'1331'11ebull;
    return x ^ (x >> 31);
}

/// Order-dependent combination, hash_combine(a, b) != hash_combine(b, a) in general
[[nodiscard]] constexpr u64 hash_combine(u64 seed, u64 h)
{
    return hash_mix(seed ^ (h + 0x9e37'79b9'7f4a'7c15ull + (seed << 6) + (seed >> 2)));
}

template <class T>
[[nodiscard]] constexpr u64 hash_of(T const& v);

/// Types that can be hashed by hash_of
template <class T>
concept hashable = requires(T const& v) {
    { ac::hash_of(v) } -> std::same_as<u64>;
};

namespace impl
{
template <class T>
concept has_hash_member = requires(T const& v) {
    { v.hash() } -> std::convertible_to<u64>;
};

template <class T>
concept is_string_like = std::is_convertible_v<T const&, std::string_view>;

template <class T>
concept has_std_hash = requires(T const& v) {
    { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
};

// FNV-1a over the bytes, then mixed
constexpr u64 hash_bytes(std::string_view s)
{
    u64 h = 0xcbf2'9ce4'8422'2325ull;
    for (auto const c : s)
    {
        h ^= u64(static_cast<unsigned char>(c));
        h *= 0x0000'0100'0000'01b3ull;
    }
    return hash_mix(h);
}

template <class T, std::size_t... I>
constexpr u64 hash_tuple(T const& v, std::index_sequence<I...>)
{
    using std::get;
    u64 h = hash_mix(sizeof...(I));
    ((h = hash_combine(h, ac::hash_of(get<I>(v)))), ...);
    return h;
}
} // namespace impl

template <class T>
[[nodiscard]] constexpr u64 hash_of(T const& v)
{
    if constexpr (impl::has_hash_member<T>)
    {
        return u64(v.hash());
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return hash_mix(v ? 1 : 0);
    }
    else if constexpr (std::is_enum_v<T>)
    {
        return hash_mix(u64(std::underlying_type_t<T>(v)));
    }
    else if constexpr (std::is_integral_v<T>)
    {
        return hash_mix(u64(v));
    }
    else if constexpr (std::is_same_v<T, float>)
    {
        // -0.0 == 0.0, so both must hash the same
        return hash_mix(u64(std::bit_cast<u32>(v == 0.0f ? 0.0f : v)));
    }
    else if constexpr (std::is_same_v<T, double>)
    {
        return hash_mix(std::bit_cast<u64>(v == 0.0 ? 0.0 : v));
    }
    else if constexpr (std::is_pointer_v<T> || std::is_null_pointer_v<T>)
    {
        return hash_mix(u64(reinterpret_cast<std::uintptr_t>(v)));
    }
    else if constexpr (impl::is_string_like<T>)
    {
        return impl::hash_bytes(std::string_view(v));
    }
    else if constexpr (impl::is_range<T>)
    {
        u64 h = hash_mix(0);
        for (auto const& e : v)
            h = hash_combine(h, ac::hash_of(e));
        return h;
    }
    else if constexpr (impl::is_tuple_like<T>)
    {
        return impl::hash_tuple(v, std::make_index_sequence<std::tuple_size<T>::value>{});
    }
    else if constexpr (impl::has_std_hash<T>)
    {
        return hash_mix(u64(std::hash<T>{}(v)));
    }
    else
    {
        static_assert(always_false_t<T>, "no hash_of for this type: add a hash() member or specialize std::hash");
        return 0;
    }
}
} // namespace ac

/// Default Hash parameter of the hash maps, forwards to ac::hash_of
struct ac::hash
{
    template <class T>
    [[nodiscard]] constexpr u64 operator()(T const& v) const
    {
        return ac::hash_of(v);
    }
};

/// Default Eq parameter of the hash maps, structural ==
struct ac::equal_to
{
    template <class A, class B>
    [[nodiscard]] constexpr bool operator()(A const& a, B const& b) const
    {
        return bool(a == b);
    }
};
