#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/associative_map.hh>
#include <assoc-core/entry.hh>
#include <assoc-core/function_ref.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/hash.hh>
#include <assoc-core/impl/map_ranges.hh>
#include <assoc-core/map_error.hh>
#include <assoc-core/optional.hh>
#include <assoc-core/result.hh>
#include <assoc-core/utility.hh>
#include <assoc-core/vector.hh>

#include <string>

/// Small map over two parallel arrays, scanned linearly with Eq.
///
/// Keeps insertion order, removal shifts the tail left.
/// All lookups are O(size), which is the right trade-off for a handful of entries:
/// chaining_hash_map uses it as its bucket type.
///
/// Capacity doubles when a new key does not fit and halves when size drops to a quarter of it.
template <class K, class V, class Eq = ac::equal_to>
struct ac::unordered_array_map
{
    using key_t = K;
    using value_t = V;

    static constexpr isize default_capacity = 4;

    // construction
public:
    unordered_array_map() : unordered_array_map(default_capacity) {}

    /// Precondition: capacity > 0
    explicit unordered_array_map(isize capacity, Eq eq = {}) : _capacity(capacity), _eq(ac::move(eq))
    {
        AC_ASSERT(capacity > 0, "capacity must be positive");
        _keys = ac::vector<K>::create_with_capacity(capacity);
        _values = ac::vector<V>::create_with_capacity(capacity);
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _keys.size(); }
    [[nodiscard]] bool empty() const { return _keys.empty(); }
    [[nodiscard]] isize capacity() const { return _capacity; }

    [[nodiscard]] bool contains(K const& key) const { return index_of(key).has_value(); }

    /// Pointer to the value stored for key, nullptr if absent.
    /// Invalidated by any put/remove/clear.
    [[nodiscard]] V* find(K const& key)
    {
        auto const i = index_of(key);
        return i.has_value() ? &_values[i.value()] : nullptr;
    }
    [[nodiscard]] V const* find(K const& key) const
    {
        auto const i = index_of(key);
        return i.has_value() ? &_values[i.value()] : nullptr;
    }

    [[nodiscard]] ac::result<V, ac::map_error> get(K const& key) const
    {
        if (auto const v = find(key))
            return *v;
        return ac::error(ac::map_error::not_found);
    }

    [[nodiscard]] V get(K const& key, V fallback) const
    {
        if (auto const v = find(key))
            return *v;
        return fallback;
    }

    // modifiers
public:
    /// Inserts or overwrites. Returns true iff key was not present before.
    bool put(K key, V value)
    {
        if (auto const v = find(key))
        {
            *v = ac::move(value);
            return false;
        }

        if (size() == _capacity)
            resize(_capacity * 2);

        _keys.push_back(ac::move(key));
        _values.push_back(ac::move(value));
        return true;
    }

    /// Returns true iff key was present.
    bool remove(K const& key)
    {
        auto const i = index_of(key);
        if (!i.has_value())
            return false;

        _keys.remove_at(i.value());
        _values.remove_at(i.value());

        if (size() == _capacity / 4)
            resize(ac::max<isize>(_capacity / 2, 1));

        return true;
    }

    /// Drops all entries, capacity goes back to default_capacity.
    void clear()
    {
        _keys = ac::vector<K>::create_with_capacity(default_capacity);
        _values = ac::vector<V>::create_with_capacity(default_capacity);
        _capacity = default_capacity;
    }

    /// Hands every entry to sink(K&&, V&&) in insertion order and leaves the map empty.
    /// The capacity is kept.
    template <class F>
    void drain_into(F&& sink)
    {
        for (isize i = 0; i < size(); ++i)
            sink(ac::move(_keys[i]), ac::move(_values[i]));
        _keys.clear();
        _values.clear();
    }

    // copies
public:
    /// Independent copy with capacity max(2 * size, default_capacity).
    [[nodiscard]] unordered_array_map copy() const
    {
        auto cp = unordered_array_map(copy_capacity(), _eq);
        for (isize i = 0; i < size(); ++i)
        {
            cp._keys.push_back(_keys[i]);
            cp._values.push_back(_values[i]);
        }
        return cp;
    }

    /// Copy whose keys and values are produced by the given functions.
    /// Keys mapping to equal copies collapse, the later one wins.
    [[nodiscard]] unordered_array_map deepcopy(function_ref<K(K const&)> copy_key, function_ref<V(V const&)> copy_value) const
    {
        AC_ASSERT(copy_key.is_valid() && copy_value.is_valid(), "deepcopy needs valid copy functions");

        auto cp = unordered_array_map(copy_capacity(), _eq);
        for (isize i = 0; i < size(); ++i)
            cp.put(copy_key(_keys[i]), copy_value(_values[i]));
        return cp;
    }

    // iteration
public:
    /// Keys in insertion order
    [[nodiscard]] impl::array_view_range<K> keys() const { return {_keys.begin(), _keys.end()}; }
    [[nodiscard]] impl::array_view_range<V> values() const { return {_values.begin(), _values.end()}; }
    [[nodiscard]] impl::parallel_entry_range<K, V> entries() const { return {_keys.data(), _values.data(), size()}; }

    // structural identity
public:
    [[nodiscard]] u64 hash() const { return ac::map_hash(*this); }
    [[nodiscard]] std::string to_string() const { return ac::map_to_string(*this); }

    // helpers
private:
    [[nodiscard]] ac::optional<isize> index_of(K const& key) const
    {
        for (isize i = 0; i < size(); ++i)
            if (_eq(key, _keys[i]))
                return i;
        return ac::nullopt;
    }

    [[nodiscard]] isize copy_capacity() const { return size() >= 2 ? size() * 2 : default_capacity; }

    // new stores of exactly new_capacity, entries are moved over
    void resize(isize new_capacity)
    {
        auto new_keys = ac::vector<K>::create_with_capacity(new_capacity);
        auto new_values = ac::vector<V>::create_with_capacity(new_capacity);
        for (isize i = 0; i < size(); ++i)
        {
            new_keys.push_back(ac::move(_keys[i]));
            new_values.push_back(ac::move(_values[i]));
        }
        _keys = ac::move(new_keys);
        _values = ac::move(new_values);
        _capacity = new_capacity;
    }

    // members
private:
    ac::vector<K> _keys;
    ac::vector<V> _values;
    isize _capacity;
    Eq _eq;
};
