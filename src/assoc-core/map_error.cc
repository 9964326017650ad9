#include "map_error.hh"

#include <assoc-core/assert.hh>

std::string ac::to_string(map_error e)
{
    switch (e)
    {
    case map_error::not_found:
        return "not_found";
    case map_error::underflow:
        return "underflow";
    case map_error::index_out_of_range:
        return "index_out_of_range";
    }

    AC_ASSERT_ALWAYS(false, "invalid map_error value");
    AC_BUILTIN_UNREACHABLE;
}
