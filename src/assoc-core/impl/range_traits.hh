#pragma once

#include <iterator>
#include <tuple>
#include <utility> // tuple_size for pair

// Shape checks shared by hash_of and to_debug_string, which both recurse into
// ranges (vector<int> keys) and tuple-likes (entries, pairs).

namespace ac::impl
{
template <class T>
concept is_range = requires(T const& v) {
    std::begin(v);
    std::end(v);
};

template <class T>
concept is_tuple_like = requires { std::tuple_size<T>::value; };
} // namespace ac::impl
