/**
 * @file scheduler_config.cpp
 * @brief Validation of scheduler_config
 */

#include "studyplan/scheduling/scheduler_config.hpp"

#include "studyplan/compat/format.hpp"

#include <cmath>

namespace studyplan::scheduling {

auto scheduler_config::validate() const -> VoidResult {
    constexpr std::chrono::minutes day_length{24 * 60};

    if (work_day_start < std::chrono::minutes{0} || work_day_end > day_length ||
        work_day_start >= work_day_end) {
        return studyplan_void_error(
            error_codes::invalid_working_hours,
            "Working window must satisfy 00:00 <= start < end <= 24:00",
            compat::format("start_min={} end_min={}",
                           work_day_start.count(), work_day_end.count()));
    }
    if (buffer < std::chrono::minutes{0}) {
        return studyplan_void_error(error_codes::invalid_buffer,
                                    "Buffer must not be negative");
    }
    if (min_slot_length <= std::chrono::minutes{0}) {
        return studyplan_void_error(error_codes::invalid_min_slot_length,
                                    "Minimum slot length must be positive");
    }
    if (grid_step != defaults::grid_step) {
        return studyplan_void_error(error_codes::invalid_grid_step,
                                    "Only a 30 minute grid is supported");
    }
    if (!std::isfinite(min_duration.count()) || !std::isfinite(max_duration.count()) ||
        min_duration.count() <= 0.0 || min_duration > max_duration) {
        return studyplan_void_error(
            error_codes::invalid_duration_bounds,
            "Duration bounds must satisfy 0 < min <= max",
            compat::format("min_h={} max_h={}",
                           min_duration.count(), max_duration.count()));
    }
    if (!std::isfinite(default_duration.count()) || default_duration < min_duration ||
        default_duration > max_duration) {
        return studyplan_void_error(
            error_codes::invalid_default_duration,
            "Default duration must lie within the duration bounds");
    }
    if (horizon_days <= 0) {
        return studyplan_void_error(
            error_codes::invalid_horizon, "Horizon must cover at least one day",
            compat::format("horizon_days={}", horizon_days));
    }
    if (min_spread_window <= std::chrono::hours{0}) {
        return studyplan_void_error(
            error_codes::invalid_horizon, "Spread window must be positive");
    }
    return ok();
}

}  // namespace studyplan::scheduling
