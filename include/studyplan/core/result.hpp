/**
 * @file result.hpp
 * @brief Error reporting for the study planner, on top of common_system
 *
 * Fallible planner operations (zone and interval construction, config
 * validation) return kcenon::common::Result. Errors carry a code from
 * studyplan::error_codes and the module name "studyplan".
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/error/error_codes.h>
#include <kcenon/common/patterns/result.h>

#include <string>

namespace studyplan {

template <typename T>
using Result = kcenon::common::Result<T>;

using VoidResult = kcenon::common::VoidResult;

using error_info = kcenon::common::error_info;

/// Module name attached to every planner error
inline constexpr const char* error_module = "studyplan";

/**
 * @namespace error_codes
 * @brief Planner error codes, range -700 to -799
 *
 * The common_system codes are visible here as well.
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int studyplan_base = -700;

    // Time values (-700 to -719)
    constexpr int invalid_interval = studyplan_base - 0;
    constexpr int invalid_utc_offset = studyplan_base - 1;

    // scheduler_config validation (-720 to -739)
    constexpr int invalid_working_hours = studyplan_base - 20;
    constexpr int invalid_buffer = studyplan_base - 21;
    constexpr int invalid_min_slot_length = studyplan_base - 22;
    constexpr int invalid_duration_bounds = studyplan_base - 23;
    constexpr int invalid_default_duration = studyplan_base - 24;
    constexpr int invalid_horizon = studyplan_base - 25;
    constexpr int invalid_grid_step = studyplan_base - 26;
}  // namespace error_codes

using kcenon::common::ok;

/**
 * @brief Error result tagged with the planner module
 * @param code One of studyplan::error_codes
 * @param message Human readable description
 * @param details Offending values, if any
 */
template <typename T>
inline auto studyplan_error(int code, const std::string& message,
                            const std::string& details = "") -> Result<T> {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, error_module);
    }
    return kcenon::common::make_error<T>(code, message, error_module, details);
}

inline auto studyplan_void_error(int code, const std::string& message,
                                 const std::string& details = "") -> VoidResult {
    if (details.empty()) {
        return VoidResult(error_info{code, message, error_module});
    }
    return VoidResult(error_info{code, message, error_module, details});
}

}  // namespace studyplan
