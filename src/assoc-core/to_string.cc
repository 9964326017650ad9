#include "to_string.hh"

#include <charconv>
#include <cstdint>
#include <cstdio>

namespace
{
template <class T>
std::string chars_of(T v)
{
    char buf[64];
    auto const res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}
} // namespace

std::string ac::to_string(void const* ptr)
{
    char buf[2 + 16 + 1];
    std::snprintf(buf, sizeof(buf), "0x%llx", static_cast<unsigned long long>(reinterpret_cast<std::uintptr_t>(ptr)));
    return buf;
}

std::string ac::to_string(bool b)
{
    return b ? "true" : "false";
}

std::string ac::to_string(char c)
{
    return std::string(1, c);
}

std::string ac::to_string(signed char i)
{
    return chars_of(int(i));
}

std::string ac::to_string(unsigned char i)
{
    return chars_of(unsigned(i));
}

std::string ac::to_string(signed short i)
{
    return chars_of(i);
}

std::string ac::to_string(unsigned short i)
{
    return chars_of(i);
}

std::string ac::to_string(signed int i)
{
    return chars_of(i);
}

std::string ac::to_string(unsigned int i)
{
    return chars_of(i);
}

std::string ac::to_string(signed long i)
{
    return chars_of(i);
}

std::string ac::to_string(unsigned long i)
{
    return chars_of(i);
}

std::string ac::to_string(signed long long i)
{
    return chars_of(i);
}

std::string ac::to_string(unsigned long long i)
{
    return chars_of(i);
}

std::string ac::to_string(float f)
{
    return chars_of(f);
}

std::string ac::to_string(double f)
{
    return chars_of(f);
}

std::string ac::to_string(char const* s)
{
    return {s};
}

std::string ac::to_string(std::string_view s)
{
    return std::string(s);
}
