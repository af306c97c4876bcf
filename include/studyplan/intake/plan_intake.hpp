/**
 * @file plan_intake.hpp
 * @brief Adapting caller data into scheduler inputs and reporting results
 */

#pragma once

#include "studyplan/core/local_zone.hpp"
#include "studyplan/scheduling/schedule_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace studyplan::intake {

/**
 * @brief One item of a proposed task breakdown, as text
 */
struct proposed_item {
    /// Item title
    std::string title;

    /// Hours estimate, e.g. "1.5"
    std::optional<std::string> estimated_hours;

    /// Preferred time hint, e.g. "2026-10-21 evening"
    std::optional<std::string> planned_start;

    /// Focus or location note
    std::optional<std::string> focus;
};

/**
 * @brief An entry of the student's existing calendar
 *
 * Either timestamp may be missing in the calendar store.
 */
struct calendar_event {
    std::string title;
    std::optional<core::time_point> start;
    std::optional<core::time_point> end;
};

/**
 * @brief Turn proposed items into ordered work item requests
 *
 * Position is the item's index. Unparsable estimates and hints become
 * absent values; the scheduler supplies defaults for them.
 */
[[nodiscard]] auto make_requests(const std::vector<proposed_item>& items,
                                 const core::local_zone& zone)
    -> std::vector<scheduling::work_item_request>;

/**
 * @brief Extract busy intervals from calendar events
 *
 * Events without both timestamps, ending at or before "now", or with
 * end <= start are skipped. The result is sorted by start; events with
 * equal starts keep their input order.
 */
[[nodiscard]] auto collect_busy_intervals(const std::vector<calendar_event>& events,
                                          core::time_point now)
    -> std::vector<scheduling::busy_interval>;

/**
 * @brief User-facing summary of a scheduling run
 *
 * e.g. "Scheduled 2 subtasks into your calendar. 1 item could not be
 * scheduled due to limited availability."
 */
[[nodiscard]] auto summarize(const scheduling::schedule_result& result) -> std::string;

}  // namespace studyplan::intake
