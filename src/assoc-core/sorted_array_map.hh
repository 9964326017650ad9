#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/associative_map.hh>
#include <assoc-core/compare.hh>
#include <assoc-core/entry.hh>
#include <assoc-core/function_ref.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/impl/map_ranges.hh>
#include <assoc-core/map_error.hh>
#include <assoc-core/optional.hh>
#include <assoc-core/result.hh>
#include <assoc-core/search_position.hh>
#include <assoc-core/utility.hh>
#include <assoc-core/vector.hh>

#include <string>

/// Ordered map over two parallel arrays kept sorted by Less.
///
/// Lookups are binary searches, O(log n).
/// Inserting a new key or removing one shifts the entries behind it, O(n).
/// Iteration is in ascending key order.
///
/// On top of the shared map surface it answers order queries:
///   min/max, floor/ceil, rank/select, remove_min/remove_max, and ranged keys/values/entries.
///
///   auto m = ac::sorted_array_map<int, std::string>();
///   m.put(5, "five");
///   m.put(2, "two");
///   m.floor(3);   // 2
///   m.rank(5);    // 1
///
/// Capacity doubles when a new key does not fit and halves when size drops to a quarter of it.
/// Less must satisfy ac::ordering_for<Less, K>; keys without an order do not compile.
template <class K, class V, class Less = ac::less>
struct ac::sorted_array_map
{
    static_assert(ac::ordering_for<Less, K>, "sorted_array_map needs a Less that orders K: "
                                             "provide operator< for the key type or pass a comparator");

    using key_t = K;
    using value_t = V;

    static constexpr isize default_capacity = 4;

    // construction
public:
    sorted_array_map() : sorted_array_map(default_capacity, Less{}) {}

    /// Precondition: capacity > 0
    explicit sorted_array_map(isize capacity) : sorted_array_map(capacity, Less{}) {}

    explicit sorted_array_map(Less less) : sorted_array_map(default_capacity, ac::move(less)) {}

    /// Precondition: capacity > 0
    sorted_array_map(isize capacity, Less less) : _capacity(capacity), _less(ac::move(less))
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
    [[nodiscard]] Less const& comparator() const { return _less; }

    [[nodiscard]] bool contains(K const& key) const { return search(key).is_found(); }

    /// Pointer to the value stored for key, nullptr if absent.
    /// Invalidated by any put/remove/clear.
    [[nodiscard]] V* find(K const& key)
    {
        auto const pos = search(key);
        return pos.is_found() ? &_values[pos.index()] : nullptr;
    }
    [[nodiscard]] V const* find(K const& key) const
    {
        auto const pos = search(key);
        return pos.is_found() ? &_values[pos.index()] : nullptr;
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
        auto const pos = search(key);
        if (pos.is_found())
        {
            _values[pos.index()] = ac::move(value);
            return false;
        }

        if (size() == _capacity)
            resize(_capacity * 2);

        _keys.insert_at(pos.index(), ac::move(key));
        _values.insert_at(pos.index(), ac::move(value));
        return true;
    }

    /// Returns true iff key was present.
    bool remove(K const& key)
    {
        auto const pos = search(key);
        if (!pos.is_found())
            return false;

        remove_index(pos.index());
        return true;
    }

    /// Drops all entries, capacity goes back to default_capacity.
    void clear()
    {
        _keys = ac::vector<K>::create_with_capacity(default_capacity);
        _values = ac::vector<V>::create_with_capacity(default_capacity);
        _capacity = default_capacity;
    }

    // order queries
public:
    /// Smallest key, map_error::underflow if empty.
    [[nodiscard]] ac::result<K, ac::map_error> min() const
    {
        if (empty())
            return ac::error(ac::map_error::underflow);
        return _keys.front();
    }

    /// Largest key, map_error::underflow if empty.
    [[nodiscard]] ac::result<K, ac::map_error> max() const
    {
        if (empty())
            return ac::error(ac::map_error::underflow);
        return _keys.back();
    }

    /// Largest key <= key, if any.
    [[nodiscard]] ac::optional<K> floor(K const& key) const
    {
        auto const i = floor_index(key);
        if (!i.has_value())
            return ac::nullopt;
        return _keys[i.value()];
    }

    /// Smallest key >= key, if any.
    [[nodiscard]] ac::optional<K> ceil(K const& key) const
    {
        auto const i = ceil_index(key);
        if (!i.has_value())
            return ac::nullopt;
        return _keys[i.value()];
    }

    /// Number of keys strictly less than key. Defined for absent keys too.
    /// rank(select(r)) == r for every 0 <= r < size().
    [[nodiscard]] isize rank(K const& key) const { return search(key).index(); }

    /// Key with the given rank, map_error::index_out_of_range unless 0 <= rank < size().
    [[nodiscard]] ac::result<K, ac::map_error> select(isize rank) const
    {
        if (rank < 0 || rank >= size())
            return ac::error(ac::map_error::index_out_of_range);
        return _keys[rank];
    }

    /// Removes and returns the entry with the smallest key, map_error::underflow if empty.
    ac::result<ac::entry<K, V>, ac::map_error> remove_min()
    {
        if (empty())
            return ac::error(ac::map_error::underflow);
        return extract_index(0);
    }

    /// Removes and returns the entry with the largest key, map_error::underflow if empty.
    ac::result<ac::entry<K, V>, ac::map_error> remove_max()
    {
        if (empty())
            return ac::error(ac::map_error::underflow);
        return extract_index(size() - 1);
    }

    // copies
public:
    /// Independent copy with capacity max(2 * size, default_capacity).
    [[nodiscard]] sorted_array_map copy() const
    {
        auto cp = sorted_array_map(copy_capacity(), _less);
        for (isize i = 0; i < size(); ++i)
        {
            cp._keys.push_back(_keys[i]);
            cp._values.push_back(_values[i]);
        }
        return cp;
    }

    /// Copy whose keys and values are produced by the given functions.
    /// The copied keys are re-sorted, keys mapping to equivalent copies collapse.
    [[nodiscard]] sorted_array_map deepcopy(function_ref<K(K const&)> copy_key, function_ref<V(V const&)> copy_value) const
    {
        AC_ASSERT(copy_key.is_valid() && copy_value.is_valid(), "deepcopy needs valid copy functions");

        auto cp = sorted_array_map(copy_capacity(), _less);
        for (isize i = 0; i < size(); ++i)
            cp.put(copy_key(_keys[i]), copy_value(_values[i]));
        return cp;
    }

    // iteration
public:
    /// All keys in ascending order
    [[nodiscard]] impl::array_view_range<K> keys() const { return {_keys.begin(), _keys.end()}; }
    [[nodiscard]] impl::array_view_range<V> values() const { return {_values.begin(), _values.end()}; }
    [[nodiscard]] impl::parallel_entry_range<K, V> entries() const { return {_keys.data(), _values.data(), size()}; }

    /// Keys in [ceil(low), floor(high)], empty if there are none
    [[nodiscard]] impl::array_view_range<K> keys(K const& low, K const& high) const
    {
        auto const [first, last] = index_range(low, high);
        return {_keys.data() + first, _keys.data() + last};
    }
    [[nodiscard]] impl::array_view_range<V> values(K const& low, K const& high) const
    {
        auto const [first, last] = index_range(low, high);
        return {_values.data() + first, _values.data() + last};
    }
    [[nodiscard]] impl::parallel_entry_range<K, V> entries(K const& low, K const& high) const
    {
        auto const [first, last] = index_range(low, high);
        return {_keys.data() + first, _values.data() + first, last - first};
    }

    // structural identity
public:
    [[nodiscard]] u64 hash() const { return ac::map_hash(*this); }
    [[nodiscard]] std::string to_string() const { return ac::map_to_string(*this); }

    // helpers
private:
    [[nodiscard]] ac::search_position search(K const& key) const
    {
        return ac::binary_search(_keys.data(), size(), key, _less);
    }

    [[nodiscard]] ac::optional<isize> floor_index(K const& key) const
    {
        auto const pos = search(key);
        if (pos.is_found())
            return pos.index();
        if (pos.index() == 0)
            return ac::nullopt;
        return pos.index() - 1;
    }

    [[nodiscard]] ac::optional<isize> ceil_index(K const& key) const
    {
        auto const pos = search(key);
        if (pos.index() == size())
            return ac::nullopt;
        return pos.index();
    }

    struct index_span
    {
        isize first;
        isize last; // exclusive
    };

    // [ceil_index(low), floor_index(high)] as a half-open span, {0, 0} if empty
    [[nodiscard]] index_span index_range(K const& low, K const& high) const
    {
        auto const lo = ceil_index(low);
        auto const hi = floor_index(high);
        if (!lo.has_value() || !hi.has_value() || lo.value() > hi.value())
            return {0, 0};
        return {lo.value(), hi.value() + 1};
    }

    [[nodiscard]] isize copy_capacity() const { return size() >= 2 ? size() * 2 : default_capacity; }

    void remove_index(isize i)
    {
        _keys.remove_at(i);
        _values.remove_at(i);
        shrink_if_sparse();
    }

    [[nodiscard]] ac::entry<K, V> extract_index(isize i)
    {
        auto e = ac::entry<K, V>(_keys.pop_at(i), _values.pop_at(i));
        shrink_if_sparse();
        return e;
    }

    void shrink_if_sparse()
    {
        if (size() == _capacity / 4)
            resize(ac::max<isize>(_capacity / 2, 1));
    }

    // new stores of exactly new_capacity, entries are moved over in order
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
    Less _less;
};
