/**
 * @file time_interval.cpp
 * @brief Implementation of time_interval helpers
 */

#include "studyplan/core/time_interval.hpp"

namespace studyplan::core {

auto time_interval::create(time_point start, time_point end) -> Result<time_interval> {
    if (!(start < end)) {
        return studyplan_error<time_interval>(
            error_codes::invalid_interval,
            "Interval start must be before its end");
    }
    return Result<time_interval>::ok(time_interval{start, end});
}

auto time_interval::to_string(const local_zone& zone) const -> std::string {
    return zone.format(start) + " - " + zone.format(end);
}

}  // namespace studyplan::core
