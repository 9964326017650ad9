#pragma once

#include <assoc-core/compare.hh>
#include <assoc-core/fwd.hh>

/// Outcome of searching a key in a sorted sequence or a probe sequence.
///   found(i)      - the key is at index i
///   not_found(i)  - the key is absent, i is where it would be inserted
///
/// Usage:
///   auto const pos = ac::binary_search(keys.data(), keys.size(), key, less);
///   if (pos.is_found())
///       values[pos.index()] = value;
///   else
///       insert_at(pos.index(), key, value);
struct ac::search_position
{
    [[nodiscard]] static constexpr search_position found(isize index) { return {index, true}; }
    [[nodiscard]] static constexpr search_position not_found(isize insertion_point) { return {insertion_point, false}; }

    [[nodiscard]] constexpr bool is_found() const { return _is_found; }

    /// index of the key if found, otherwise the insertion point
    [[nodiscard]] constexpr isize index() const { return _index; }

    [[nodiscard]] friend constexpr bool operator==(search_position const&, search_position const&) = default;

    // members
private:
    constexpr search_position(isize index, bool is_found) : _index(index), _is_found(is_found) {}

    isize _index;
    bool _is_found;
};

namespace ac
{
/// Binary search for key in the ascending range [data, data + size).
/// Returns found(i) with less-equivalence at i, or not_found(i) where i is the number of elements before key.
template <class K, class Less>
    requires ordering_for<Less, K>
[[nodiscard]] constexpr search_position binary_search(K const* data, isize size, K const& key, Less const& less)
{
    isize lo = 0;
    isize hi = size - 1;
    while (lo <= hi)
    {
        auto const mid = lo + (hi - lo) / 2;
        if (less(data[mid], key))
            lo = mid + 1;
        else if (less(key, data[mid]))
            hi = mid - 1;
        else
            return search_position::found(mid);
    }
    return search_position::not_found(lo);
}
} // namespace ac
