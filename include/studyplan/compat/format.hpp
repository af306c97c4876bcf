/**
 * @file format.hpp
 * @brief studyplan::compat::format, backed by <format> or by fmt
 *
 * Standard libraries without <format> (libstdc++ before GCC 13) fall back
 * to fmt. Defining STUDYPLAN_FORCE_FMT selects fmt unconditionally.
 *
 *   auto line = studyplan::compat::format("{} slot(s) on {}", count, day);
 */

#pragma once

#include <version>

#if !defined(STUDYPLAN_FORCE_FMT) && defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define STUDYPLAN_HAS_STD_FORMAT 1
#else
    #define STUDYPLAN_HAS_STD_FORMAT 0
#endif

#if STUDYPLAN_HAS_STD_FORMAT
    #include <format>
#else
    #include <fmt/format.h>
#endif

namespace studyplan::compat {

#if STUDYPLAN_HAS_STD_FORMAT
using std::format;

template <typename... Args>
using format_string = std::format_string<Args...>;
#else
using fmt::format;

template <typename... Args>
using format_string = fmt::format_string<Args...>;
#endif

}  // namespace studyplan::compat
