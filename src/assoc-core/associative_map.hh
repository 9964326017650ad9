#pragma once

#include <assoc-core/fwd.hh>
#include <assoc-core/to_debug_string.hh>

#include <concepts>
#include <string>

// =========================================================================================================
// Shared contract of the map family
// =========================================================================================================
//
// sorted_array_map, chaining_hash_map, probing_hash_map and unordered_array_map have no common base.
// They share a surface (size, contains, find, get, put, remove, keys, values, entries, ...) and
// the algorithms below, which only need that surface:
//
//   maps_equal(a, b)   - same size and every entry of a is in b with an equal value
//   map_hash(m)        - sum of entry hashes, independent of iteration order
//   map_to_string(m)   - "[2]{ 1: \"a\", 2: \"b\" }", "[0]{ }" when empty
//
// operator== is defined for any two maps of the family with comparable keys and values,
// so a sorted map can be compared to a probing map holding the same entries.

namespace ac
{
template <class M>
concept associative_map = requires(M const& m, typename M::key_t const& key) {
    typename M::key_t;
    typename M::value_t;
    { m.size() } -> std::convertible_to<isize>;
    { m.empty() } -> std::convertible_to<bool>;
    { m.contains(key) } -> std::convertible_to<bool>;
    { m.find(key) } -> std::convertible_to<typename M::value_t const*>;
    m.entries().begin();
};

template <associative_map A, associative_map B>
[[nodiscard]] bool maps_equal(A const& a, B const& b)
{
    if (a.size() != b.size())
        return false;

    for (auto const& e : a.entries())
    {
        auto const v = b.find(e.key());
        if (v == nullptr || !(*v == e.value()))
            return false;
    }

    return true;
}

template <associative_map M>
[[nodiscard]] u64 map_hash(M const& m)
{
    u64 h = 0;
    for (auto const& e : m.entries())
        h += e.hash();
    return h;
}

template <associative_map M>
[[nodiscard]] std::string map_to_string(M const& m)
{
    auto s = "[" + ac::to_string(m.size()) + "]{ ";
    auto first = true;
    for (auto const& e : m.entries())
    {
        if (!first)
            s += ", ";
        first = false;
        s += e.to_string();
    }
    s += first ? "}" : " }";
    return s;
}

template <associative_map A, associative_map B>
    requires requires(typename A::key_t const& ka, typename B::key_t const& kb, typename A::value_t const& va,
                      typename B::value_t const& vb) {
        { kb == ka } -> std::convertible_to<bool>;
        { vb == va } -> std::convertible_to<bool>;
    }
[[nodiscard]] bool operator==(A const& a, B const& b)
{
    return ac::maps_equal(a, b);
}
} // namespace ac
