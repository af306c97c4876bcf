/**
 * @file boundary_rounder.cpp
 * @brief Implementation of half-hour grid rounding
 */

#include "studyplan/scheduling/boundary_rounder.hpp"

#include <chrono>

namespace studyplan::scheduling {

namespace {

using std::chrono::hours;
using std::chrono::minutes;

struct hour_parts {
    core::local_time_point hour_start;
    minutes minute_of_hour;
    core::clock::duration sub_minute;
};

auto split_hour(core::local_time_point local) -> hour_parts {
    auto hour_start = std::chrono::floor<hours>(local);
    auto since_hour = local - hour_start;
    auto minute_of_hour = std::chrono::floor<minutes>(since_hour);
    return {hour_start, minute_of_hour, since_hour - minute_of_hour};
}

}  // namespace

auto round_up_to_grid(core::time_point tp, const core::local_zone& zone)
    -> core::time_point {
    auto parts = split_hour(zone.to_local(tp));

    if (parts.minute_of_hour < minutes{15} &&
        parts.sub_minute == core::clock::duration::zero()) {
        return tp;
    }
    if (parts.minute_of_hour < minutes{45}) {
        return zone.to_sys(parts.hour_start + minutes{30});
    }
    return zone.to_sys(parts.hour_start + hours{1});
}

auto snap_forward_to_grid(core::time_point tp, const core::local_zone& zone)
    -> core::time_point {
    auto parts = split_hour(zone.to_local(tp));

    if (parts.minute_of_hour < minutes{30}) {
        return zone.to_sys(parts.hour_start + minutes{30});
    }
    return zone.to_sys(parts.hour_start + hours{1});
}

auto truncate_to_minute(core::time_point tp) -> core::time_point {
    return std::chrono::floor<minutes>(tp);
}

}  // namespace studyplan::scheduling
