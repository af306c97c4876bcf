/**
 * @file schedule_types.cpp
 * @brief Helpers shared by scheduling records
 */

#include "studyplan/scheduling/schedule_types.hpp"

#include <algorithm>
#include <cmath>

namespace studyplan::scheduling {

auto resolve_duration(const std::optional<double>& estimated_hours,
                      const scheduler_config& config) -> clock::duration {
    hours_f hours = config.default_duration;
    if (estimated_hours && std::isfinite(*estimated_hours)) {
        hours = hours_f{*estimated_hours};
    }
    hours = std::clamp(hours, config.min_duration, config.max_duration);
    return std::chrono::duration_cast<clock::duration>(hours);
}

auto derive_title(const std::string& parent_title,
                  const std::string& item_title) -> std::string {
    std::string title = parent_title.empty() ? "Assignment Plan" : parent_title;
    title += ": ";
    title += item_title.empty() ? "Subtask" : item_title;
    return title;
}

}  // namespace studyplan::scheduling
