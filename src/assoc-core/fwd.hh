#pragma once

#include <cstddef>
#include <cstdint>

// Integer aliases and forward declarations of every assoc-core type.
// Headers declare their types here and define them as "struct ac::name" in their own file.

namespace ac
{
using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i64 = std::int64_t;

/// Sizes, capacities, ranks and slot indices.
/// Signed, so capacity / 4 and size - 1 comparisons need no casts.
using isize = i64;

// vocabulary
struct nullopt_t;
template <class T>
struct optional;
template <class E>
struct error;
template <class T, class E>
struct result;
template <class Signature>
struct function_ref;
template <class T>
struct vector;

// maps
enum class map_error : u8;
struct search_position;
template <class K, class V>
struct entry;

struct less;
struct equal_to;
struct hash;

template <class K, class V, class Eq>
struct unordered_array_map;
template <class K, class V, class Less>
struct sorted_array_map;
template <class K, class V, class Hash, class Eq>
struct chaining_hash_map;
template <class K, class V, class Hash, class Eq>
struct probing_hash_map;
} // namespace ac
