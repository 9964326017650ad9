#pragma once

#include <assoc-core/fwd.hh>
#include <assoc-core/impl/range_traits.hh>
#include <assoc-core/to_string.hh>
#include <assoc-core/utility.hh>

#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

// Renders keys, values, entries and whole maps for humans.
// Map::to_string() is built from it, so the format here is what "[n]{ k: v, ... }" shows for k and v:
//
//   "pear"     strings (anything convertible to std::string_view), double quoted, unescaped
//   'x'  '\n'  chars, single quoted with C escapes
//   42  0.5    everything with an ac::to_string overload or an ADL to_string(v)
//   1: "a"     everything with a member v.to_string()
//   [1, 2]     ranges, cut off with ", ..." once max_length characters are written
//   (1, 'c')   tuple-likes
//
// Types matching none of these do not compile.

namespace ac
{
/// ac::to_string overloads or to_string(v) found by ADL
template <class T>
concept has_to_string = requires(T const& v) { to_string(v); };

struct debug_string_config
{
    isize max_length = 100;
};

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

namespace impl
{
inline void append_char_literal(std::string& out, char c)
{
    out += '\'';
    switch (c)
    {
    case '\0':
        out += "\\0";
        break;
    case '\t':
        out += "\\t";
        break;
    case '\n':
        out += "\\n";
        break;
    case '\r':
        out += "\\r";
        break;
    case '\'':
        out += "\\'";
        break;
    case '\\':
        out += "\\\\";
        break;
    default:
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F)
        {
            char esc[5];
            std::snprintf(esc, sizeof(esc), "\\x%02X", unsigned(static_cast<unsigned char>(c)));
            out += esc;
        }
        else
            out += c;
    }
    out += '\'';
}

// appends ", v" or "v" after the opening bracket
// false once the output is too long, after appending the ellipsis
template <class T>
bool append_element(std::string& out, T const& v, debug_string_config const& cfg)
{
    auto const first = out.size() == 1;
    if (isize(out.size()) >= cfg.max_length)
    {
        out += ", ...";
        return false;
    }

    if (!first)
        out += ", ";
    out += ac::to_debug_string(v, cfg);
    return true;
}

template <class T>
concept has_member_to_string = requires(T const& v) { v.to_string(); };
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    std::string out;

    if constexpr (std::is_convertible_v<T const&, std::string_view>)
    {
        out += '"';
        out += std::string_view(v);
        out += '"';
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        impl::append_char_literal(out, v);
    }
    else if constexpr (has_to_string<T>)
    {
        out = std::string(to_string(v));
    }
    else if constexpr (impl::has_member_to_string<T>)
    {
        out = std::string(v.to_string());
    }
    else if constexpr (impl::is_range<T>)
    {
        out += '[';
        for (auto const& e : v)
            if (!impl::append_element(out, e, cfg))
                break;
        out += ']';
    }
    else if constexpr (impl::is_tuple_like<T>)
    {
        out += '(';
        std::apply([&](auto const&... elems) { (void)(impl::append_element(out, elems, cfg) && ...); }, v);
        out += ')';
    }
    else
    {
        static_assert(always_false_t<T>, "no debug rendering for T, add a to_string(T const&) found by ADL");
    }

    return out;
}
} // namespace ac
