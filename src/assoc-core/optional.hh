#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <type_traits>

/// Type of ac::nullopt. Only constructible through a private tag, so optional<T> o = {} stays unambiguous.
struct ac::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace ac
{
/// if (m.floor(k) == ac::nullopt) ...
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace ac

/// Either a T or nothing.
///
/// The maps use it for answers where "nothing" is not an error:
///   floor/ceil of a sorted_array_map, the bucket array of chaining_hash_map,
///   the node in a probing_hash_map slot.
///
/// Access goes through value(), which asserts has_value(); there is no operator* or operator->.
/// optional<T> is trivially copyable and destructible exactly when T is.
/// Unlike std::optional, moving out of an optional leaves the source empty.
template <class T>
struct ac::optional
{
    static_assert(!std::is_reference_v<T>, "optional<T&> is not supported, use T* instead");

    // construction
public:
    constexpr optional() : _none() {}
    constexpr optional(nullopt_t) : _none() {}

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& v) // NOLINT
      : _value(ac::forward<U>(v)), _has_value(true)
    {
    }

    // copy, move, destroy: trivial versions for trivially copyable T
public:
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // copy, move, destroy: everything else
public:
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _none()
    {
        if (rhs._has_value)
            construct(rhs._value);
    }

    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _none()
    {
        if (rhs._has_value)
        {
            construct(ac::move(rhs._value));
            rhs.reset();
        }
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (!rhs._has_value)
            reset();
        else if (_has_value)
            _value = rhs._value;
        else
            construct(rhs._value);
        return *this;
    }

    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (!rhs._has_value)
            reset();
        else if (_has_value)
            _value = ac::move(rhs._value);
        else
            construct(ac::move(rhs._value));
        rhs.reset();
        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // modifiers
public:
    /// Replaces any held value by T(args...)
    template <class... Args>
    T& emplace(Args&&... args)
    {
        reset();
        construct(ac::forward<Args>(args)...);
        return _value;
    }

    void reset()
    {
        if (!_has_value)
            return;

        if constexpr (!std::is_trivially_destructible_v<T>)
            _value.~T();
        _has_value = false;
    }

    // access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Precondition: has_value()
    [[nodiscard]] T& value() &
    {
        AC_ASSERT(_has_value, "value() of an empty optional");
        return _value;
    }
    [[nodiscard]] T const& value() const&
    {
        AC_ASSERT(_has_value, "value() of an empty optional");
        return _value;
    }
    [[nodiscard]] T&& value() &&
    {
        AC_ASSERT(_has_value, "value() of an empty optional");
        return ac::move(_value);
    }

    [[nodiscard]] T value_or(T fallback) const& { return _has_value ? _value : fallback; }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._has_value && rhs._has_value)
            return bool(lhs._value == rhs._value);
        return lhs._has_value == rhs._has_value;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._has_value && bool(lhs._value == rhs);
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// optional<int> == true would silently compare has_value() for some types, so it does not compile
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // helpers
private:
    template <class... Args>
    void construct(Args&&... args)
    {
        new (ac::placement_new, &_value) T(ac::forward<Args>(args)...);
        _has_value = true;
    }

    // members
private:
    union
    {
        char _none;
        T _value;
    };
    bool _has_value = false;
};
