/**
 * @file free_slot_generator.cpp
 * @brief Implementation of free slot generation
 */

#include "studyplan/scheduling/free_slot_generator.hpp"
#include "studyplan/scheduling/interval_subtractor.hpp"
#include "studyplan/integration/logger_adapter.hpp"

#include <algorithm>

namespace studyplan::scheduling {

using integration::logger_adapter;

free_slot_generator::free_slot_generator(const scheduler_config& config,
                                         const core::local_zone& zone)
    : config_(config)
    , zone_(zone) {}

auto free_slot_generator::working_window(std::chrono::local_days day) const
    -> time_interval {
    return {zone_.at(day, config_.work_day_start), zone_.at(day, config_.work_day_end)};
}

auto free_slot_generator::generate(const std::vector<busy_interval>& busy,
                                   time_point now) const -> std::vector<free_slot> {
    std::vector<busy_interval> ordered;
    ordered.reserve(busy.size());
    for (const auto& interval : busy) {
        if (interval.empty()) {
            logger_adapter::warn("Ignoring ill-formed busy interval {}",
                                 interval.to_string(zone_));
            continue;
        }
        ordered.push_back(interval);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const busy_interval& a, const busy_interval& b) {
                         return a.start < b.start;
                     });

    std::vector<free_slot> free_slots;
    const auto today = zone_.local_date(now);
    std::size_t days_scanned = 0;

    for (int offset = 0; offset < config_.horizon_days; ++offset) {
        const auto day = today + std::chrono::days{offset};
        auto window = working_window(day);

        if (window.end <= now) {
            continue;
        }
        if (window.start < now) {
            window.start = now;
        }
        ++days_scanned;

        std::vector<time_interval> segments{window};
        for (const auto& interval : ordered) {
            if (zone_.local_date(interval.start) != day) {
                continue;
            }
            segments = subtract_interval(segments, interval);
            if (segments.empty()) {
                break;
            }
        }

        for (const auto& segment : segments) {
            if (segment.duration() >= config_.min_slot_length) {
                free_slots.push_back(segment);
            }
        }
    }

    logger_adapter::debug("Free slot generation days={} busy={} slots={}",
                          days_scanned, ordered.size(), free_slots.size());
    return free_slots;
}

}  // namespace studyplan::scheduling
