#pragma once

#include <assoc-core/fwd.hh>
#include <assoc-core/hash.hh>
#include <assoc-core/to_debug_string.hh>
#include <assoc-core/utility.hh>

#include <string>
#include <type_traits>
#include <utility> // tuple_size

/// Immutable key-value pair.
///
/// Two forms are in use:
///   entry<K, V>               - owns key and value, returned by remove_min/remove_max
///   entry<K const&, V const&> - view into a map, yielded by entries(); invalidated with the map's storage
///
/// Read-only access via key()/value() or structured bindings:
///   for (auto const& [k, v] : m.entries())
///       ...
///
/// Equality and hash are structural and work across the two forms.
template <class K, class V>
struct ac::entry
{
    using key_t = std::remove_cvref_t<K>;
    using value_t = std::remove_cvref_t<V>;

    // construction
public:
    constexpr entry(K key, V value) : _key(ac::forward<K>(key)), _value(ac::forward<V>(value)) {}

    /// entry<K, V> from an entry<K const&, V const&> view: copies key and value out of the map
    template <class K2, class V2>
        requires(!std::is_same_v<entry<K2, V2>, entry> && std::is_constructible_v<K, K2 const&>
                 && std::is_constructible_v<V, V2 const&>)
    constexpr entry(entry<K2, V2> const& rhs) : _key(rhs.key()), _value(rhs.value()) // NOLINT
    {
    }

    // access
public:
    [[nodiscard]] constexpr key_t const& key() const { return _key; }
    [[nodiscard]] constexpr value_t const& value() const { return _value; }

    /// 31 * hash(key) + 31 * hash(value), mod 2^64
    [[nodiscard]] constexpr u64 hash() const { return 31 * ac::hash_of(_key) + 31 * ac::hash_of(_value); }

    /// "key: value", e.g. 1: "one"
    [[nodiscard]] std::string to_string() const
    {
        return ac::to_debug_string(_key) + ": " + ac::to_debug_string(_value);
    }

    template <std::size_t I, class E>
        requires(std::is_same_v<std::remove_cvref_t<E>, entry> && I < 2)
    [[nodiscard]] friend constexpr decltype(auto) get(E const& e) noexcept
    {
        if constexpr (I == 0)
            return e.key();
        else
            return e.value();
    }

    // members
private:
    K _key;
    V _value;
};

namespace ac
{
template <class K1, class V1, class K2, class V2>
[[nodiscard]] constexpr bool operator==(entry<K1, V1> const& lhs, entry<K2, V2> const& rhs)
{
    return lhs.key() == rhs.key() && lhs.value() == rhs.value();
}

/// entry<K const&, V const&> view over a stored key and value
template <class K, class V>
using entry_ref = entry<K const&, V const&>;
} // namespace ac

namespace std
{
template <class K, class V>
struct tuple_size<ac::entry<K, V>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class K, class V>
struct tuple_element<I, ac::entry<K, V>>
{
    static_assert(I < 2);
    using type = std::conditional_t<I == 0, typename ac::entry<K, V>::key_t const, typename ac::entry<K, V>::value_t const>;
};
} // namespace std
