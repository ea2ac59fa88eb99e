/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Detection is based on the __cpp_lib_format feature test macro. When the
 * standard library lacks std::format the fmt library is used instead.
 *
 * Usage:
 *   #include <relvault/compat/format.hpp>
 *   auto s = relvault::compat::format("Hello, {}!", name);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define RELVAULT_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define RELVAULT_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define RELVAULT_HAS_STD_FORMAT 1
#else
    #define RELVAULT_HAS_STD_FORMAT 0
#endif

#if RELVAULT_HAS_STD_FORMAT
    #include <format>
    namespace relvault::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace relvault::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
