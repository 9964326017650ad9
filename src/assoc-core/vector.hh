#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/impl/object_lifetime_util.hh>
#include <assoc-core/utility.hh>

#include <new>

/// Dynamically allocated array of T elements with value semantics.
/// Backing store of every map in this library.
///
/// Capacity is exact: create_with_capacity(n) allocates room for exactly n elements,
/// so a map can size its storage to its own logical capacity.
/// push_back/emplace_back grow by doubling when the capacity is exhausted.
///
/// Any reallocation and any insert_at/remove_at invalidate pointers, references and iterators.
/// Reallocation always move-constructs into the new store (no copy fallback).
template <class T>
struct ac::vector
{
    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        AC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        AC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        AC_ASSERT(_size > 0, "vector is empty");
        return _data[0];
    }
    [[nodiscard]] constexpr T const& front() const
    {
        AC_ASSERT(_size > 0, "vector is empty");
        return _data[0];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        AC_ASSERT(_size > 0, "vector is empty");
        return _data[_size - 1];
    }
    [[nodiscard]] constexpr T const& back() const
    {
        AC_ASSERT(_size > 0, "vector is empty");
        return _data[_size - 1];
    }

    /// nullptr for a default-constructed vector
    [[nodiscard]] constexpr T* data() { return _data; }
    [[nodiscard]] constexpr T const* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data; }
    [[nodiscard]] constexpr T* end() { return _data + _size; }
    [[nodiscard]] constexpr T const* begin() const { return _data; }
    [[nodiscard]] constexpr T const* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    /// Number of elements that fit without reallocation.
    [[nodiscard]] constexpr isize capacity() const { return _capacity; }

    // factories
public:
    /// Empty vector with room for exactly "capacity" elements.
    [[nodiscard]] static vector create_with_capacity(isize capacity)
    {
        AC_ASSERT(capacity >= 0, "capacity must be non-negative");
        vector v;
        v._data = allocate(capacity);
        v._capacity = capacity;
        return v;
    }

    /// "size" value-initialized elements, capacity == size.
    [[nodiscard]] static vector create_defaulted(isize size)
    {
        auto v = create_with_capacity(size);
        auto end = v._data;
        impl::value_construct_into(end, size);
        v._size = size;
        return v;
    }

    /// "size" copies of value, capacity == size.
    [[nodiscard]] static vector create_filled(isize size, T const& value)
    {
        auto v = create_with_capacity(size);
        for (isize i = 0; i < size; ++i)
            v.emplace_back(value);
        return v;
    }

    // modifiers
public:
    /// Destroys all elements, keeps the capacity.
    constexpr void clear()
    {
        impl::destroy_range(_data, _data + _size);
        _size = 0;
    }

    /// Constructs a new element at the back, doubling the capacity if needed.
    /// The new element is constructed before existing elements are moved,
    /// so arguments may refer to elements of this vector.
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(ac::forward<Args>(args)...); }, "emplace_back: T is not constructible from the argument types");

        if (_size < _capacity) [[likely]]
        {
            auto const p = new (ac::placement_new, _data + _size) T(ac::forward<Args>(args)...);
            ++_size;
            return *p;
        }

        auto const new_capacity = ac::max<isize>(_capacity * 2, 1);
        auto const new_data = allocate(new_capacity);
        T* p = nullptr;
        try
        {
            p = new (ac::placement_new, new_data + _size) T(ac::forward<Args>(args)...);
        }
        catch (...)
        {
            deallocate(new_data);
            throw;
        }

        auto new_end = new_data;
        impl::move_construct_into(new_end, _data, _data + _size);
        replace_storage(new_data, new_capacity);
        ++_size;
        return *p;
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(ac::move(value)); }

    /// Inserts value before position idx, shifting [idx, size) one to the right.
    /// Precondition: 0 <= idx <= size().
    /// O(size - idx), plus a reallocation when full.
    T& insert_at(isize idx, T value)
    {
        AC_ASSERT(0 <= idx && idx <= _size, "insert position out of bounds");

        if (idx == _size)
            return emplace_back(ac::move(value));

        // last element is duplicated into the new back slot, the rest shifts by assignment
        emplace_back(ac::move(back()));
        for (auto i = _size - 2; i > idx; --i)
            _data[i] = ac::move(_data[i - 1]);
        _data[idx] = ac::move(value);
        return _data[idx];
    }

    /// Removes the element at idx, shifting [idx + 1, size) one to the left.
    /// Precondition: 0 <= idx < size().
    void remove_at(isize idx)
    {
        AC_ASSERT(0 <= idx && idx < _size, "index out of bounds");
        for (auto i = idx + 1; i < _size; ++i)
            _data[i - 1] = ac::move(_data[i]);
        remove_back();
    }

    /// Removes and returns the element at idx, preserving the order of the others.
    /// NOTE: prefer remove_at() if the value is not needed
    [[nodiscard("use remove_at() if you don't need the return value")]] T pop_at(isize idx)
    {
        AC_ASSERT(0 <= idx && idx < _size, "index out of bounds");
        auto value = ac::move(_data[idx]);
        remove_at(idx);
        return value;
    }

    /// Precondition: !empty().
    void remove_back()
    {
        AC_ASSERT(_size > 0, "cannot remove from empty vector");
        --_size;
        _data[_size].~T();
    }

    /// Precondition: !empty().
    [[nodiscard("use remove_back() if you don't need the return value")]] T pop_back()
    {
        AC_ASSERT(_size > 0, "cannot pop from empty vector");
        auto value = ac::move(_data[_size - 1]);
        remove_back();
        return value;
    }

    // ctors and assignment
public:
    vector() = default;

    vector(vector&& rhs) noexcept
      : _data(ac::exchange(rhs._data, nullptr)),
        _size(ac::exchange(rhs._size, 0)),
        _capacity(ac::exchange(rhs._capacity, 0))
    {
    }
    vector& operator=(vector&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            _data = ac::exchange(rhs._data, nullptr);
            _size = ac::exchange(rhs._size, 0);
            _capacity = ac::exchange(rhs._capacity, 0);
        }
        return *this;
    }

    /// Deep copy, the copy keeps the capacity of rhs.
    vector(vector const& rhs) : _data(allocate(rhs._capacity)), _capacity(rhs._capacity)
    {
        auto end = _data;
        try
        {
            impl::copy_construct_into(end, rhs.begin(), rhs.end());
        }
        catch (...)
        {
            impl::destroy_range(_data, end);
            deallocate(_data);
            throw;
        }
        _size = rhs._size;
    }
    vector& operator=(vector const& rhs)
    {
        if (this != &rhs)
        {
            auto copy = rhs;
            *this = ac::move(copy);
        }
        return *this;
    }

    ~vector() { release(); }

    // helpers
private:
    [[nodiscard]] static T* allocate(isize capacity)
    {
        if (capacity == 0)
            return nullptr;
        return static_cast<T*>(::operator new(capacity * sizeof(T), std::align_val_t(alignof(T))));
    }
    static void deallocate(T* p)
    {
        if (p != nullptr)
            ::operator delete(p, std::align_val_t(alignof(T)));
    }

    void release()
    {
        impl::destroy_range(_data, _data + _size);
        deallocate(_data);
        _data = nullptr;
        _size = 0;
        _capacity = 0;
    }

    // destroys the moved-from old elements, adopts the new store with the same size
    void replace_storage(T* new_data, isize new_capacity)
    {
        impl::destroy_range(_data, _data + _size);
        deallocate(_data);
        _data = new_data;
        _capacity = new_capacity;
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
    isize _capacity = 0;
};
