#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <type_traits>

/// Wrapper marking a value as the error alternative of a result.
/// Usage:
///   return ac::error(ac::map_error::not_found);
template <class E>
struct ac::error
{
    E value;

    constexpr error(E v) : value(ac::move(v)) {} // NOLINT
};

/// Sum type holding either a success value T or an error value E.
/// Used for expected, recoverable failures such as a missing key:
///
///   auto r = m.get(key);
///   if (r.is_ok())
///       use(r.value());
///   else if (r.error() == ac::map_error::not_found)
///       ...
///
/// Constructed implicitly from a T (success) or from an ac::error<E> (failure).
/// value() on an error and error() on a success fail an assertion.
template <class T, class E>
struct ac::result
{
    static_assert(!std::is_same_v<T, E>, "success and error type must differ");

    // construction
public:
    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, result> && std::is_constructible_v<T, U>)
    result(U&& value) : _is_ok(true) // NOLINT
    {
        new (ac::placement_new, &_value) T(ac::forward<U>(value));
    }

    template <class G>
        requires std::is_constructible_v<E, G const&>
    result(ac::error<G> const& err) : _is_ok(false) // NOLINT
    {
        new (ac::placement_new, &_error) E(err.value);
    }

    result(result const& rhs) : _is_ok(rhs._is_ok)
    {
        if (_is_ok)
            new (ac::placement_new, &_value) T(rhs._value);
        else
            new (ac::placement_new, &_error) E(rhs._error);
    }
    result(result&& rhs) noexcept : _is_ok(rhs._is_ok)
    {
        if (_is_ok)
            new (ac::placement_new, &_value) T(ac::move(rhs._value));
        else
            new (ac::placement_new, &_error) E(ac::move(rhs._error));
    }

    result& operator=(result const& rhs)
    {
        if (this != &rhs)
        {
            auto copy = rhs;
            *this = ac::move(copy);
        }
        return *this;
    }
    result& operator=(result&& rhs) noexcept
    {
        if (this != &rhs)
        {
            destroy();
            _is_ok = rhs._is_ok;
            if (_is_ok)
                new (ac::placement_new, &_value) T(ac::move(rhs._value));
            else
                new (ac::placement_new, &_error) E(ac::move(rhs._error));
        }
        return *this;
    }

    ~result() { destroy(); }

    // queries
public:
    [[nodiscard]] bool is_ok() const { return _is_ok; }
    [[nodiscard]] bool has_error() const { return !_is_ok; }

    // access
public:
    /// Precondition: is_ok()
    [[nodiscard]] T& value() &
    {
        AC_ASSERT(_is_ok, "attempted to access value of a result holding an error");
        return _value;
    }
    [[nodiscard]] T const& value() const&
    {
        AC_ASSERT(_is_ok, "attempted to access value of a result holding an error");
        return _value;
    }
    [[nodiscard]] T&& value() &&
    {
        AC_ASSERT(_is_ok, "attempted to access value of a result holding an error");
        return ac::move(_value);
    }

    /// Precondition: has_error()
    [[nodiscard]] E const& error() const
    {
        AC_ASSERT(!_is_ok, "attempted to access error of a successful result");
        return _error;
    }

    [[nodiscard]] T value_or(T fallback) const&
    {
        return _is_ok ? _value : fallback;
    }
    [[nodiscard]] T value_or(T fallback) &&
    {
        return _is_ok ? ac::move(_value) : fallback;
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(result const& lhs, result const& rhs)
        requires requires(T const& v, E const& e) {
            bool(v == v);
            bool(e == e);
        }
    {
        if (lhs._is_ok != rhs._is_ok)
            return false;
        return lhs._is_ok ? bool(lhs._value == rhs._value) : bool(lhs._error == rhs._error);
    }

    /// r == ac::error(ac::map_error::underflow)
    template <class G>
    [[nodiscard]] friend bool operator==(result const& lhs, ac::error<G> const& rhs)
    {
        return !lhs._is_ok && lhs._error == rhs.value;
    }

    // helpers
private:
    void destroy()
    {
        if (_is_ok)
            _value.~T();
        else
            _error.~E();
    }

    // members
private:
    union
    {
        T _value;
        E _error;
    };
    bool _is_ok;
};
