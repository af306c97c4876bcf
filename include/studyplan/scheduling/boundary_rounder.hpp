/**
 * @file boundary_rounder.hpp
 * @brief Snapping of instants to the local :00 / :30 grid
 */

#pragma once

#include "studyplan/core/local_zone.hpp"

namespace studyplan::scheduling {

/**
 * @brief Round an instant onto the half-hour grid
 *
 * Local minute-of-hour decides the target:
 * - whole minutes in [0, 15) are returned unchanged
 * - [0, 45) with a sub-minute part, or [15, 45), goes to hh:30
 * - [45, 60) goes to (hh+1):00
 *
 * Minutes 31-44 therefore land on hh:30, which lies before the input;
 * snap_forward_to_grid() is the strictly non-decreasing variant.
 * The function is idempotent.
 *
 * @param tp Instant to round
 * @param zone Zone whose wall clock defines the grid
 */
[[nodiscard]] auto round_up_to_grid(core::time_point tp, const core::local_zone& zone)
    -> core::time_point;

/**
 * @brief Next grid line strictly after the instant's half hour
 *
 * Returns hh:30 when the local minute is below 30, otherwise (hh+1):00.
 * Used to recover when round_up_to_grid() moved an instant backwards.
 */
[[nodiscard]] auto snap_forward_to_grid(core::time_point tp, const core::local_zone& zone)
    -> core::time_point;

/**
 * @brief Drop the sub-minute part of an instant
 */
[[nodiscard]] auto truncate_to_minute(core::time_point tp) -> core::time_point;

}  // namespace studyplan::scheduling
