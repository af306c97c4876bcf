/**
 * @file plan_hint_parser.hpp
 * @brief Parsing of free-text dates, time hints and duration estimates
 *
 * Proposed plans arrive as loosely formatted text. These helpers resolve
 * that text into the typed values the scheduler accepts. Anything that does
 * not parse is reported as absent rather than as an error.
 */

#pragma once

#include "studyplan/core/local_zone.hpp"

#include <optional>
#include <string_view>

namespace studyplan::intake {

/// Hour used for a due date given without a time
inline constexpr std::chrono::minutes due_time_of_day{23 * 60 + 59};

/**
 * @brief Parse a "YYYY-MM-DD" due date
 * @param text Date text
 * @param zone Zone of the date
 * @return 23:59 local time on that date, or nullopt
 */
[[nodiscard]] auto parse_due_datetime(std::string_view text, const core::local_zone& zone)
    -> std::optional<core::time_point>;

/**
 * @brief Resolve a preferred-time hint such as "2026-10-20 evening"
 *
 * A time-of-day keyword (evening 19:00, afternoon 14:00, morning 10:00,
 * night 21:00, default 09:00) selects the hour for date-only forms.
 * Accepted date forms:
 * - "2026-10-20 14:15" (time kept as given)
 * - "2026-10-20", "20 Oct 2026", "20 October 2026", "Oct 20 2026",
 *   "October 20 2026"
 * - ISO-8601 "2026-10-20T14:15[:00][Z|+01:00]"
 *
 * @param text Hint text
 * @param zone Zone used for forms without an explicit offset
 * @return Resolved instant, or nullopt
 */
[[nodiscard]] auto parse_plan_hint(std::string_view text, const core::local_zone& zone)
    -> std::optional<core::time_point>;

/**
 * @brief Parse an hours estimate such as "2.5"
 * @return The numeric value, or nullopt when empty, non-numeric or non-finite
 */
[[nodiscard]] auto parse_estimated_hours(std::string_view text) -> std::optional<double>;

}  // namespace studyplan::intake
