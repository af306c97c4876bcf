/**
 * @file plan_intake.cpp
 * @brief Implementation of scheduler input adaptation and run summaries
 */

#include "studyplan/intake/plan_intake.hpp"
#include "studyplan/intake/plan_hint_parser.hpp"
#include "studyplan/compat/format.hpp"
#include "studyplan/integration/logger_adapter.hpp"

#include <algorithm>
#include <utility>

namespace studyplan::intake {

using integration::logger_adapter;

namespace {

auto plural(std::size_t count, const char* noun) -> std::string {
    return compat::format("{} {}{}", count, noun, count == 1 ? "" : "s");
}

}  // namespace

auto make_requests(const std::vector<proposed_item>& items,
                   const core::local_zone& zone)
    -> std::vector<scheduling::work_item_request> {
    std::vector<scheduling::work_item_request> requests;
    requests.reserve(items.size());

    for (std::size_t index = 0; index < items.size(); ++index) {
        const auto& item = items[index];

        scheduling::work_item_request request;
        request.title = item.title;
        request.position = index;
        request.focus = item.focus;

        if (item.estimated_hours) {
            request.estimated_hours = parse_estimated_hours(*item.estimated_hours);
            if (!request.estimated_hours) {
                logger_adapter::debug("Item #{} has unusable estimate '{}'",
                                      index, *item.estimated_hours);
            }
        }
        if (item.planned_start) {
            request.preferred_start = parse_plan_hint(*item.planned_start, zone);
            if (!request.preferred_start) {
                logger_adapter::debug("Item #{} hint '{}' not understood",
                                      index, *item.planned_start);
            }
        }

        requests.push_back(std::move(request));
    }

    return requests;
}

auto collect_busy_intervals(const std::vector<calendar_event>& events,
                            core::time_point now)
    -> std::vector<scheduling::busy_interval> {
    std::vector<scheduling::busy_interval> busy;
    busy.reserve(events.size());

    for (const auto& event : events) {
        if (!event.start || !event.end || *event.end <= now) {
            continue;
        }
        auto interval = core::time_interval::create(*event.start, *event.end);
        if (interval.is_err()) {
            logger_adapter::warn("Skipping event '{}': {}", event.title,
                                 interval.error().message);
            continue;
        }
        busy.push_back(interval.value());
    }

    std::stable_sort(busy.begin(), busy.end(),
                     [](const scheduling::busy_interval& a,
                        const scheduling::busy_interval& b) {
                         return a.start < b.start;
                     });
    return busy;
}

auto summarize(const scheduling::schedule_result& result) -> std::string {
    const auto scheduled = result.scheduled.size();
    const auto unscheduled = result.unscheduled.size();

    std::string summary;
    if (scheduled > 0) {
        summary = compat::format("Scheduled {} into your calendar.",
                                 plural(scheduled, "subtask"));
    }
    if (unscheduled > 0) {
        if (!summary.empty()) {
            summary += ' ';
        }
        summary += compat::format("{} could not be scheduled due to limited availability.",
                                  plural(unscheduled, "item"));
    }
    return summary;
}

}  // namespace studyplan::intake
