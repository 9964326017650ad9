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
#include <assoc-core/search_position.hh>
#include <assoc-core/utility.hh>
#include <assoc-core/vector.hh>

#include <string>

/// Hash map with open addressing and linear probing.
///
/// Every slot is empty, live (holds a key and value) or dead (a tombstone).
/// A probe sequence starts at (hash(key) & 0x7fff'ffff'ffff'ffff) % capacity() and walks
/// forward, wrapping at the end of the table:
///   - lookups stop at the first empty slot and skip dead ones
///   - insertions take the first empty or dead slot, unless the key is found live before
///     the first empty slot
///
/// Removing a key clears its slot if the next slot is empty; otherwise the slot becomes
/// a tombstone so keys further down the probe chain stay reachable.
///
/// Resizing happens before probing:
///   put:    size >= load_factor * capacity -> rehash into 2 * capacity slots
///   remove: size <= capacity / 4           -> rehash into capacity / 2 slots (at least 1)
/// A rehash re-inserts the live entries only, so it also drops every tombstone.
///
/// The load factor must lie in (0.25, 1], the default is 0.70.
template <class K, class V, class Hash = ac::hash, class Eq = ac::equal_to>
struct ac::probing_hash_map
{
    using key_t = K;
    using value_t = V;

    static constexpr isize default_capacity = 4;
    static constexpr double default_load_factor = 0.70;

    enum class slot_state : u8
    {
        empty,
        live,
        dead,
    };

    // slots
public:
    struct node
    {
        K key;
        V value;

        node(K k, V v) : key(ac::move(k)), value(ac::move(v)) {}
    };

    struct slot
    {
        ac::optional<node> content; // engaged iff live
        bool dead = false;          // tombstone, never together with content

        [[nodiscard]] slot_state state() const
        {
            if (content.has_value())
                return slot_state::live;
            return dead ? slot_state::dead : slot_state::empty;
        }
    };

    // construction
public:
    probing_hash_map() : probing_hash_map(default_capacity, default_load_factor) {}

    /// Precondition: capacity > 0
    explicit probing_hash_map(isize capacity) : probing_hash_map(capacity, default_load_factor) {}

    /// Precondition: capacity > 0 and 0.25 < load_factor <= 1
    probing_hash_map(isize capacity, double load_factor, Hash hasher = {}, Eq eq = {})
      : _load_factor(load_factor), _hash(ac::move(hasher)), _eq(ac::move(eq))
    {
        AC_ASSERT(capacity > 0, "capacity must be positive");
        AC_ASSERT(load_factor > 0.25 && load_factor <= 1.0, "load factor must be in (0.25, 1]");
        _slots = ac::vector<slot>::create_defaulted(capacity);
    }

    /// Map with default_capacity slots and the given load factor.
    /// Precondition: 0.25 < load_factor <= 1
    [[nodiscard]] static probing_hash_map create_with_load_factor(double load_factor)
    {
        return probing_hash_map(default_capacity, load_factor);
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }
    [[nodiscard]] isize capacity() const { return _slots.size(); }
    [[nodiscard]] double load_factor() const { return _load_factor; }

    /// Number of dead slots, all of which disappear with the next rehash
    [[nodiscard]] isize tombstone_count() const
    {
        isize n = 0;
        for (auto const& s : _slots)
            n += s.state() == slot_state::dead ? 1 : 0;
        return n;
    }

    [[nodiscard]] slot_state state_of_slot(isize i) const { return _slots[i].state(); }

    [[nodiscard]] bool contains(K const& key) const { return probe_to_find(slot_index(key, capacity()), key).has_value(); }

    /// Pointer to the value stored for key, nullptr if absent.
    /// Invalidated by any put/remove/clear.
    [[nodiscard]] V* find(K const& key)
    {
        auto const i = probe_to_find(slot_index(key, capacity()), key);
        return i.has_value() ? &_slots[i.value()].content.value().value : nullptr;
    }
    [[nodiscard]] V const* find(K const& key) const
    {
        auto const i = probe_to_find(slot_index(key, capacity()), key);
        return i.has_value() ? &_slots[i.value()].content.value().value : nullptr;
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
        if (double(_size) >= _load_factor * double(capacity()))
            rehash(capacity() * 2);

        auto const pos = probe_to_insert(_slots, slot_index(key, capacity()), key);
        auto& s = _slots[pos.index()];
        if (pos.is_found())
        {
            s.content.value().value = ac::move(value);
            return false;
        }

        // fresh node for an empty slot, revived node for a tombstone
        s.content.emplace(ac::move(key), ac::move(value));
        s.dead = false;
        ++_size;
        return true;
    }

    /// Returns true iff key was present.
    bool remove(K const& key)
    {
        if (double(_size) <= 0.25 * double(capacity()))
            rehash(ac::max<isize>(capacity() / 2, 1));

        auto const i = probe_to_find(slot_index(key, capacity()), key);
        if (!i.has_value())
            return false;

        auto& s = _slots[i.value()];
        s.content.reset();
        // no probe chain continues through an empty successor
        s.dead = _slots[ac::wrapped_increment(i.value(), capacity())].state() != slot_state::empty;
        --_size;
        return true;
    }

    /// Drops all entries and tombstones, capacity goes back to default_capacity.
    /// The load factor is kept.
    void clear()
    {
        _slots = ac::vector<slot>::create_defaulted(default_capacity);
        _size = 0;
    }

    // copies
public:
    /// Independent copy with the same slot layout, tombstones included.
    [[nodiscard]] probing_hash_map copy() const { return *this; }

    /// Copy whose keys and values are produced by the given functions.
    /// Same capacity and load factor, no tombstones.
    /// Keys mapping to equal copies collapse, the later one in iteration order wins.
    [[nodiscard]] probing_hash_map deepcopy(function_ref<K(K const&)> copy_key, function_ref<V(V const&)> copy_value) const
    {
        AC_ASSERT(copy_key.is_valid() && copy_value.is_valid(), "deepcopy needs valid copy functions");

        auto cp = probing_hash_map(capacity(), _load_factor, _hash, _eq);
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
                auto const& n = _slot->content.value();
                return {n.key, n.value};
            }

            iterator& operator++()
            {
                ++_slot;
                skip_unused();
                return *this;
            }

            [[nodiscard]] bool operator==(ac::sentinel) const { return _slot == _end; }

            void skip_unused()
            {
                while (_slot != _end && !_slot->content.has_value())
                    ++_slot;
            }

            slot const* _slot;
            slot const* _end;
        };

        [[nodiscard]] iterator begin() const
        {
            auto it = iterator{_first, _last};
            it.skip_unused();
            return it;
        }
        [[nodiscard]] ac::sentinel end() const { return {}; }

        slot const* _first;
        slot const* _last;
    };

    /// Live entries in slot order
    [[nodiscard]] entry_range entries() const { return {_slots.begin(), _slots.end()}; }
    [[nodiscard]] impl::entry_projection_range<entry_range, true> keys() const { return {entries()}; }
    [[nodiscard]] impl::entry_projection_range<entry_range, false> values() const { return {entries()}; }

    // structural identity
public:
    [[nodiscard]] u64 hash() const { return ac::map_hash(*this); }
    [[nodiscard]] std::string to_string() const { return ac::map_to_string(*this); }

    // helpers
private:
    [[nodiscard]] isize slot_index(K const& key, isize slot_count) const
    {
        auto const h = u64(_hash(key)) & 0x7fff'ffff'ffff'ffffull;
        return isize(h % u64(slot_count));
    }

    // live slot holding key, nullopt once an empty slot ends the chain
    [[nodiscard]] ac::optional<isize> probe_to_find(isize start, K const& key) const
    {
        auto i = start;
        for (isize n = 0; n < capacity(); ++n, i = ac::wrapped_increment(i, capacity()))
        {
            auto const& s = _slots[i];
            if (s.state() == slot_state::empty)
                return ac::nullopt;
            if (s.content.has_value() && _eq(s.content.value().key, key))
                return i;
        }
        return ac::nullopt;
    }

    // found(i) for the live slot holding key, not_found(i) for the first empty or dead slot.
    // The scan continues past dead slots until an empty one, so a key stored behind a
    // tombstone is overwritten instead of inserted a second time.
    [[nodiscard]] ac::search_position probe_to_insert(ac::vector<slot> const& slots, isize start, K const& key) const
    {
        auto first_dead = ac::optional<isize>();
        auto i = start;
        for (isize n = 0; n < slots.size(); ++n, i = ac::wrapped_increment(i, slots.size()))
        {
            auto const& s = slots[i];
            switch (s.state())
            {
            case slot_state::empty:
                return ac::search_position::not_found(first_dead.value_or(i));
            case slot_state::dead:
                if (!first_dead.has_value())
                    first_dead = i;
                break;
            case slot_state::live:
                if (_eq(s.content.value().key, key))
                    return ac::search_position::found(i);
                break;
            }
        }

        if (first_dead.has_value())
            return ac::search_position::not_found(first_dead.value());

        AC_ASSERT_ALWAYS(false, "probing visited every slot without a free one, load factor invariant is broken");
        AC_BUILTIN_UNREACHABLE;
    }

    // moves the live nodes into new_capacity fresh slots, then swaps them in
    void rehash(isize new_capacity)
    {
        if (new_capacity == capacity())
            return;

        auto slots = ac::vector<slot>::create_defaulted(new_capacity);
        for (auto& old : _slots)
        {
            if (!old.content.has_value())
                continue;

            auto& n = old.content.value();
            auto const pos = probe_to_insert(slots, slot_index(n.key, new_capacity), n.key);
            slots[pos.index()].content.emplace(ac::move(n.key), ac::move(n.value));
        }

        _slots = ac::move(slots);
    }

    // members
private:
    ac::vector<slot> _slots;
    isize _size = 0;
    double _load_factor;
    Hash _hash;
    Eq _eq;
};
