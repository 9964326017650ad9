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
#include <assoc-core/unordered_array_map.hh>
#include <assoc-core/utility.hh>
#include <assoc-core/vector.hh>

#include <string>

/// Hash map with separate chaining.
///
/// Each of the capacity() buckets is either absent or a small unordered_array_map
/// holding every entry whose key hashes to that bucket. Buckets are created on first
/// insertion and dropped as soon as they become empty.
///
/// Bucket index: (hash(key) & 0x7fff'ffff'ffff'ffff) % capacity()
///
/// Resizing happens before the key is hashed:
///   put:    size == capacity      -> rehash into 2 * capacity buckets
///   remove: size == capacity / 4  -> rehash into capacity / 2 buckets, never below the initial capacity
/// A rehash builds the complete new bucket array before it replaces the old one.
///
/// Iteration walks buckets in index order and each bucket in its insertion order.
template <class K, class V, class Hash = ac::hash, class Eq = ac::equal_to>
struct ac::chaining_hash_map
{
    using key_t = K;
    using value_t = V;
    using bucket_t = ac::unordered_array_map<K, V, Eq>;

    static constexpr isize default_capacity = 4;
    static constexpr isize bucket_capacity = 2;

    // construction
public:
    chaining_hash_map() : chaining_hash_map(default_capacity) {}

    /// Precondition: capacity > 0
    /// capacity is also the smallest bucket count the map shrinks back to
    explicit chaining_hash_map(isize capacity, Hash hasher = {}, Eq eq = {})
      : _initial_capacity(capacity), _hash(ac::move(hasher)), _eq(ac::move(eq))
    {
        AC_ASSERT(capacity > 0, "capacity must be positive");
        _buckets = ac::vector<ac::optional<bucket_t>>::create_defaulted(capacity);
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }
    [[nodiscard]] isize capacity() const { return _buckets.size(); }

    /// Number of buckets currently allocated, i.e. holding at least one entry
    [[nodiscard]] isize bucket_count_in_use() const
    {
        isize n = 0;
        for (auto const& b : _buckets)
            n += b.has_value() ? 1 : 0;
        return n;
    }

    [[nodiscard]] bool contains(K const& key) const { return find(key) != nullptr; }

    /// Pointer to the value stored for key, nullptr if absent.
    /// Invalidated by any put/remove/clear.
    [[nodiscard]] V* find(K const& key)
    {
        auto& b = _buckets[bucket_index(key)];
        return b.has_value() ? b.value().find(key) : nullptr;
    }
    [[nodiscard]] V const* find(K const& key) const
    {
        auto const& b = _buckets[bucket_index(key)];
        return b.has_value() ? b.value().find(key) : nullptr;
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
        if (_size == capacity())
            rehash(capacity() * 2);

        auto& b = _buckets[bucket_index(key)];
        if (!b.has_value())
            b.emplace(bucket_capacity, _eq);

        if (!b.value().put(ac::move(key), ac::move(value)))
            return false;

        ++_size;
        return true;
    }

    /// Returns true iff key was present.
    bool remove(K const& key)
    {
        if (_size == capacity() / 4)
            rehash(ac::max<isize>(capacity() / 2, _initial_capacity));

        auto& b = _buckets[bucket_index(key)];
        if (!b.has_value())
            return false;

        if (!b.value().remove(key))
            return false;

        if (b.value().empty())
            b.reset();

        --_size;
        return true;
    }

    /// Drops all entries and buckets, capacity goes back to default_capacity.
    /// From then on the map shrinks down to default_capacity.
    void clear()
    {
        _buckets = ac::vector<ac::optional<bucket_t>>::create_defaulted(default_capacity);
        _initial_capacity = default_capacity;
        _size = 0;
    }

    // copies
public:
    /// Independent copy with the same capacity, and therefore the same iteration order.
    [[nodiscard]] chaining_hash_map copy() const
    {
        auto cp = chaining_hash_map(capacity(), _hash, _eq);
        for (isize i = 0; i < capacity(); ++i)
            if (_buckets[i].has_value())
                cp._buckets[i].emplace(_buckets[i].value().copy());
        cp._size = _size;
        cp._initial_capacity = _initial_capacity;
        return cp;
    }

    /// Copy whose keys and values are produced by the given functions.
    /// Keys mapping to equal copies collapse, the later one in iteration order wins.
    [[nodiscard]] chaining_hash_map deepcopy(function_ref<K(K const&)> copy_key, function_ref<V(V const&)> copy_value) const
    {
        AC_ASSERT(copy_key.is_valid() && copy_value.is_valid(), "deepcopy needs valid copy functions");

        auto cp = chaining_hash_map(capacity(), _hash, _eq);
        cp._initial_capacity = _initial_capacity;
        for (auto const& e : entries())
            cp.put(copy_key(e.key()), copy_value(e.value()));
        return cp;
    }

    // iteration
public:
    struct entry_range
    {
        struct iterator
        {
            [[nodiscard]] entry_ref<K, V> operator*() const
            {
                auto const& b = _bucket->value();
                return {b.keys().begin()[_index], b.values().begin()[_index]};
            }

            iterator& operator++()
            {
                ++_index;
                if (_index == _bucket->value().size())
                {
                    ++_bucket;
                    _index = 0;
                    skip_absent();
                }
                return *this;
            }

            [[nodiscard]] bool operator==(ac::sentinel) const { return _bucket == _end; }

            void skip_absent()
            {
                while (_bucket != _end && !_bucket->has_value())
                    ++_bucket;
            }

            ac::optional<bucket_t> const* _bucket;
            ac::optional<bucket_t> const* _end;
            isize _index;
        };

        [[nodiscard]] iterator begin() const
        {
            auto it = iterator{_first, _last, 0};
            it.skip_absent();
            return it;
        }
        [[nodiscard]] ac::sentinel end() const { return {}; }

        ac::optional<bucket_t> const* _first;
        ac::optional<bucket_t> const* _last;
    };

    [[nodiscard]] entry_range entries() const { return {_buckets.begin(), _buckets.end()}; }
    [[nodiscard]] impl::entry_projection_range<entry_range, true> keys() const { return {entries()}; }
    [[nodiscard]] impl::entry_projection_range<entry_range, false> values() const { return {entries()}; }

    // structural identity
public:
    [[nodiscard]] u64 hash() const { return ac::map_hash(*this); }
    [[nodiscard]] std::string to_string() const { return ac::map_to_string(*this); }

    // helpers
private:
    [[nodiscard]] isize bucket_index(K const& key) const { return bucket_index(key, capacity()); }
    [[nodiscard]] isize bucket_index(K const& key, isize bucket_count) const
    {
        auto const h = u64(_hash(key)) & 0x7fff'ffff'ffff'ffffull;
        return isize(h % u64(bucket_count));
    }

    // moves every entry into new_capacity fresh buckets, then swaps them in
    void rehash(isize new_capacity)
    {
        if (new_capacity == capacity())
            return;

        auto buckets = ac::vector<ac::optional<bucket_t>>::create_defaulted(new_capacity);
        for (auto& old : _buckets)
        {
            if (!old.has_value())
                continue;

            old.value().drain_into(
                [&](K&& key, V&& value)
                {
                    auto& target = buckets[bucket_index(key, new_capacity)];
                    if (!target.has_value())
                        target.emplace(bucket_capacity, _eq);
                    target.value().put(ac::move(key), ac::move(value));
                });
        }

        _buckets = ac::move(buckets);
    }

    // members
private:
    ac::vector<ac::optional<bucket_t>> _buckets;
    isize _size = 0;
    isize _initial_capacity;
    Hash _hash;
    Eq _eq;
};
