/**
 * @file schedule_types.hpp
 * @brief Input and output records of a scheduling run
 */

#pragma once

#include "studyplan/core/time_interval.hpp"
#include "studyplan/scheduling/scheduler_config.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace studyplan::scheduling {

using core::clock;
using core::time_interval;
using core::time_point;

/// Interval taken by an existing calendar entry
using busy_interval = time_interval;

/// Unclaimed time inside the working window
using free_slot = time_interval;

/**
 * @brief One work item to be placed into free time
 *
 * Requests are processed strictly in the order the caller supplies them.
 */
struct work_item_request {
    /// Item title, "Subtask" is used when empty
    std::string title;

    /// Estimated effort in hours; absent or non-finite means "use the default"
    std::optional<double> estimated_hours;

    /// Resolved preferred start time
    std::optional<time_point> preferred_start;

    /// Position in the caller's input sequence
    std::size_t position{0};

    /// Free-text focus, carried to the calendar entry's location
    std::optional<std::string> focus;
};

/// A request that could not be placed, returned unchanged
using unscheduled_item = work_item_request;

/**
 * @brief Parent task information shared by every item of a run
 */
struct plan_context {
    /// Title of the task the items were broken out of
    std::string parent_title{"Assignment Plan"};

    /// Due instant of the parent task
    std::optional<time_point> deadline;

    /// Routing tag copied onto every assignment (e.g. a module code)
    std::optional<std::string> category;
};

/**
 * @brief Placement of one request into the calendar
 */
struct scheduled_assignment {
    /// "<parent title>: <item title>"
    std::string title;

    /// Assigned [start, end)
    time_interval interval;

    /// Focus copied from the request
    std::optional<std::string> focus;

    /// Routing tag copied from the plan context
    std::optional<std::string> category;

    /// Position of the originating request
    std::size_t position{0};
};

/**
 * @brief Outcome of a scheduling run
 */
struct schedule_result {
    /// Placements in request order
    std::vector<scheduled_assignment> scheduled;

    /// Requests that found no slot, in request order
    std::vector<unscheduled_item> unscheduled;

    [[nodiscard]] auto all_scheduled() const noexcept -> bool {
        return unscheduled.empty();
    }
};

/**
 * @brief Effective duration of a request
 *
 * Missing or non-finite estimates fall back to the configured default;
 * the result is clamped to [min_duration, max_duration].
 */
[[nodiscard]] auto resolve_duration(const std::optional<double>& estimated_hours,
                                    const scheduler_config& config)
    -> clock::duration;

/**
 * @brief Title of the calendar entry created for an item
 */
[[nodiscard]] auto derive_title(const std::string& parent_title,
                                const std::string& item_title) -> std::string;

}  // namespace studyplan::scheduling
