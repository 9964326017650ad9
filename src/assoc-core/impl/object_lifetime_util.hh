#pragma once

#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <cstring>
#include <type_traits>

// Construction and destruction of element ranges in the raw buffer of ac::vector.
//
// The *_construct_into functions take the end of the live range by reference and bump it per element.
// If a constructor throws, [buffer, dest_end) is exactly what has to be destroyed.

namespace ac::impl
{
/// last to first, no-op for trivially destructible T
template <class T>
constexpr void destroy_range(T* first, T* last)
{
    if constexpr (!std::is_trivially_destructible_v<T>)
        while (last != first)
            (--last)->~T();
}

/// T() for ints is 0
template <class T>
constexpr void value_construct_into(T*& dest_end, isize count)
{
    for (isize i = 0; i < count; ++i)
    {
        new (ac::placement_new, dest_end) T();
        ++dest_end;
    }
}

template <class T>
constexpr void copy_construct_into(T*& dest_end, T const* first, T const* last)
{
    if constexpr (std::is_trivially_copyable_v<T>)
    {
        if (first == last)
            return;
        std::memcpy(dest_end, first, std::size_t(last - first) * sizeof(T));
        dest_end += last - first;
    }
    else
    {
        while (first != last)
        {
            new (ac::placement_new, dest_end) T(*first++);
            ++dest_end;
        }
    }
}

/// the moved-from sources still have to be destroyed by the caller
template <class T>
constexpr void move_construct_into(T*& dest_end, T* first, T* last)
{
    if constexpr (std::is_trivially_copyable_v<T>)
    {
        ac::impl::copy_construct_into(dest_end, static_cast<T const*>(first), static_cast<T const*>(last));
    }
    else
    {
        while (first != last)
        {
            new (ac::placement_new, dest_end) T(ac::move(*first++));
            ++dest_end;
        }
    }
}
} // namespace ac::impl
