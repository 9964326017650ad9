#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/fwd.hh>

#include <functional>
#include <type_traits>

// Small building blocks of the maps and their containers:
//
//   move, forward, exchange      - without pulling <utility> into every header
//   max                          - shrink targets: ac::max<isize>(capacity / 2, 1)
//   wrapped_increment            - next slot of a linear probe sequence
//   placement_new                - tag for constructing into raw storage without <new>
//   invoke, is_invocable_r       - used by function_ref
//   function_ptr<R(Args...)>     - readable function pointer type
//   always_false_t<T...>         - for static_assert in discarded branches
//   sentinel                     - end() of the hash map ranges

namespace ac
{
// move semantics

template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    static_assert(!std::is_lvalue_reference_v<T>, "forwarding an rvalue as an lvalue");
    return static_cast<T&&>(value);
}

/// Stores new_value in obj and returns what obj held before.
///   _data(ac::exchange(rhs._data, nullptr))
template <class T, class U = T>
[[nodiscard]] AC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_value) // NOLINT
{
    auto old = static_cast<T&&>(obj);
    obj = ac::forward<U>(new_value);
    return old;
}

// arithmetic

/// b unless a > b
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// (pos + 1) % size without the division, for 0 <= pos < size
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T pos, T size)
{
    AC_ASSERT(size > 0, "wrapped_increment needs a positive size");
    ++pos;
    return pos == size ? T(0) : pos;
}

// raw storage

struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

// callables

template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args)
{
    return std::invoke(ac::forward<F>(f), ac::forward<Args>(args)...);
}

template <class R, class F, class... Args>
constexpr bool is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr expects a function signature such as int(float)");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// ac::function_ptr<bool(int, int)> is bool (*)(int, int)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// ranges

/// end() of ranges whose iterators know by themselves when they are done
struct sentinel
{
};
} // namespace ac

[[nodiscard]] inline void* operator new(std::size_t, ac::placement_new_t, void* p) noexcept
{
    return p;
}
// only called if a constructor throws inside a placement new expression
inline void operator delete(void*, ac::placement_new_t, void*) noexcept {}
