#pragma once

#include <assoc-core/entry.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <type_traits>
#include <utility>

// Lazy views returned by keys(), values() and entries() of the maps.
// A view is created fresh by every call and can be iterated any number of times.
// Views borrow the map's storage: any put/remove/clear on the map invalidates them.

namespace ac::impl
{
/// Contiguous [first, last) of keys or values, iterated by pointer
template <class T>
struct array_view_range
{
    [[nodiscard]] T const* begin() const { return _first; }
    [[nodiscard]] T const* end() const { return _last; }
    [[nodiscard]] isize size() const { return _last - _first; }
    [[nodiscard]] bool empty() const { return _first == _last; }

    T const* _first = nullptr;
    T const* _last = nullptr;
};

/// Entries over parallel key and value arrays
template <class K, class V>
struct parallel_entry_range
{
    struct iterator
    {
        [[nodiscard]] entry_ref<K, V> operator*() const { return {*_key, *_value}; }

        iterator& operator++()
        {
            ++_key;
            ++_value;
            return *this;
        }

        [[nodiscard]] bool operator==(iterator const& rhs) const { return _key == rhs._key; }

        K const* _key;
        V const* _value;
    };

    [[nodiscard]] iterator begin() const { return {_keys, _values}; }
    [[nodiscard]] iterator end() const { return {_keys + _count, _values + _count}; }
    [[nodiscard]] isize size() const { return _count; }
    [[nodiscard]] bool empty() const { return _count == 0; }

    K const* _keys = nullptr;
    V const* _values = nullptr;
    isize _count = 0;
};

/// Keys or values of an entry range whose iteration ends at ac::sentinel.
/// Used by the hash maps, which have no contiguous key storage.
template <class EntryRange, bool ProjectKeys>
struct entry_projection_range
{
    using base_iterator = decltype(std::declval<EntryRange const&>().begin());

    struct iterator
    {
        [[nodiscard]] decltype(auto) operator*() const
        {
            if constexpr (ProjectKeys)
                return (*_it).key();
            else
                return (*_it).value();
        }

        iterator& operator++()
        {
            ++_it;
            return *this;
        }

        [[nodiscard]] bool operator==(ac::sentinel s) const { return _it == s; }

        base_iterator _it;
    };

    [[nodiscard]] iterator begin() const { return {_entries.begin()}; }
    [[nodiscard]] ac::sentinel end() const { return {}; }

    EntryRange _entries;
};
} // namespace ac::impl
