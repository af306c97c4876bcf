/**
 * @file scheduler_config.hpp
 * @brief Configuration for free-slot generation and work item placement
 *
 * The defaults reproduce the planner's fixed policy: a 09:00-21:00 working
 * window, a 30 minute buffer after every placement, durations clamped to
 * [0.5h, 6h] and a three week planning horizon.
 */

#pragma once

#include "studyplan/core/result.hpp"

#include <chrono>

namespace studyplan::scheduling {

/// Fractional hours, used for estimated work item durations
using hours_f = std::chrono::duration<double, std::ratio<3600>>;

// =============================================================================
// Default Policy Constants
// =============================================================================

namespace defaults {

/// Start of the daily working window (local time)
inline constexpr std::chrono::minutes work_day_start{9 * 60};

/// End of the daily working window (local time)
inline constexpr std::chrono::minutes work_day_end{21 * 60};

/// Gap enforced after every scheduled item
inline constexpr std::chrono::minutes buffer{30};

/// Shortest free segment kept by the generator
inline constexpr std::chrono::minutes min_slot_length{30};

/// Spacing of the grid that start and end times snap to
inline constexpr std::chrono::minutes grid_step{30};

/// Lower clamp bound for an item duration
inline constexpr hours_f min_duration{0.5};

/// Upper clamp bound for an item duration
inline constexpr hours_f max_duration{6.0};

/// Duration used when an item carries no usable estimate
inline constexpr hours_f default_duration{2.0};

/// Number of calendar days scanned for free time
inline constexpr int horizon_days = 21;

/// Smallest window used when spreading items towards a deadline
inline constexpr std::chrono::hours min_spread_window{24};

}  // namespace defaults

// =============================================================================
// Scheduler Configuration
// =============================================================================

/**
 * @brief Scheduling policy shared by the generator and the placement scheduler
 */
struct scheduler_config {
    /// Start of the daily working window, as an offset from local midnight
    std::chrono::minutes work_day_start{defaults::work_day_start};

    /// End of the daily working window, as an offset from local midnight
    std::chrono::minutes work_day_end{defaults::work_day_end};

    /// Buffer kept free after each placed item
    std::chrono::minutes buffer{defaults::buffer};

    /// Free segments shorter than this are discarded by the generator
    std::chrono::minutes min_slot_length{defaults::min_slot_length};

    /// Half-hour grid spacing; the rounder is defined for 30 minutes only
    std::chrono::minutes grid_step{defaults::grid_step};

    /// Item duration clamp, lower bound
    hours_f min_duration{defaults::min_duration};

    /// Item duration clamp, upper bound
    hours_f max_duration{defaults::max_duration};

    /// Duration substituted for missing or malformed estimates
    hours_f default_duration{defaults::default_duration};

    /// Number of forward calendar days considered
    int horizon_days{defaults::horizon_days};

    /// Minimum span used for deadline-based spreading
    std::chrono::hours min_spread_window{defaults::min_spread_window};

    /**
     * @brief Validate configuration
     * @return Success, or the first invalid field as an error
     */
    [[nodiscard]] auto validate() const -> VoidResult;

    /**
     * @brief Check if configuration is valid
     * @return true if valid
     */
    [[nodiscard]] auto is_valid() const -> bool { return validate().is_ok(); }
};

}  // namespace studyplan::scheduling
