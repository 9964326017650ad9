#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <type_traits>

/// Borrowed callable of signature R(Args...), two pointers wide.
///
/// This is how deepcopy receives its key and value copy functions:
///
///   auto copy = m.deepcopy([](std::string const& k) { return k; },
///                          [](int const& v) { return v + 1; });
///
/// The callable is referenced, not stored, and has to outlive every call.
/// Lambdas passed as call arguments live until the end of the full expression, which covers deepcopy.
/// Function pointers and member pointers are referenced too, so bind them to a variable first.
template <class R, class... Args>
struct ac::function_ref<R(Args...)>
{
public:
    /// Not callable, is_valid() is false
    function_ref() = default;

    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref> && !std::is_function_v<std::remove_reference_t<F>>)
    function_ref(F&& callable) // NOLINT(google-explicit-constructor)
      : _callable(const_cast<void*>(static_cast<void const*>(&callable)))
      , _call(&call_as<std::remove_reference_t<F>>)
    {
        static_assert(ac::is_invocable_r<R, F&, Args...>, "callable does not match the signature of this function_ref");
    }

    [[nodiscard]] bool is_valid() const { return _call != nullptr; }
    [[nodiscard]] explicit operator bool() const { return _call != nullptr; }

    R operator()(Args... args) const
    {
        AC_ASSERT(is_valid(), "called an invalid function_ref");
        return _call(_callable, ac::forward<Args>(args)...);
    }

private:
    template <class Fn>
    static R call_as(void* callable, Args... args)
    {
        return ac::invoke(*static_cast<Fn*>(callable), ac::forward<Args>(args)...);
    }

    void* _callable = nullptr;
    ac::function_ptr<R(void*, Args...)> _call = nullptr;
};
