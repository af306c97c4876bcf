/**
 * @file placement_scheduler.cpp
 * @brief Implementation of greedy work item placement
 */

#include "studyplan/scheduling/placement_scheduler.hpp"
#include "studyplan/integration/logger_adapter.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <tuple>

namespace studyplan::scheduling {

using integration::logger_adapter;

placement_scheduler::placement_scheduler(const scheduler_config& config,
                                         const core::local_zone& zone)
    : config_(config)
    , zone_(zone)
    , consumer_(config, zone) {}

// =============================================================================
// Scheduling
// =============================================================================

auto placement_scheduler::schedule(const std::vector<work_item_request>& requests,
                                   const std::vector<free_slot>& free_slots,
                                   const plan_context& context,
                                   time_point now) const -> schedule_result {
    schedule_result result;

    if (requests.empty()) {
        return result;
    }
    if (free_slots.empty()) {
        result.unscheduled = requests;
        logger_adapter::log_plan_scheduled(context.parent_title, 0,
                                           result.unscheduled.size());
        return result;
    }

    if (context.deadline) {
        auto before_deadline = std::count_if(
            free_slots.begin(), free_slots.end(),
            [&](const free_slot& slot) { return slot.start <= *context.deadline; });
        logger_adapter::debug("Deadline {} slots_before={} slots_after={}",
                              zone_.format(*context.deadline), before_deadline,
                              static_cast<std::ptrdiff_t>(free_slots.size()) -
                                  before_deadline);
    }

    slot_queue queue{free_slots};

    for (const auto& request : requests) {
        const auto duration = resolve_duration(request.estimated_hours, config_);
        const auto target =
            target_time(request, requests.size(), context.deadline, now);

        std::optional<time_interval> assigned;
        for (auto index : rank_candidates(queue, result.scheduled, target)) {
            const auto& slot = queue[index];
            if (!consumer_.has_room(slot, duration)) {
                continue;
            }

            auto tentative = consumer_.plan(slot, duration);
            if (!tentative || conflicts(tentative->assigned, result.scheduled)) {
                continue;
            }

            assigned = queue.consume(index, duration, consumer_);
            if (assigned) {
                break;
            }
        }

        if (!assigned) {
            logger_adapter::debug("Item #{} '{}' unscheduled target={}",
                                  request.position, request.title,
                                  zone_.format(target));
            result.unscheduled.push_back(request);
            continue;
        }

        logger_adapter::debug("Item #{} '{}' placed {}", request.position,
                              request.title, assigned->to_string(zone_));
        result.scheduled.push_back(scheduled_assignment{
            derive_title(context.parent_title, request.title),
            *assigned,
            request.focus,
            context.category,
            request.position});
    }

    logger_adapter::log_plan_scheduled(context.parent_title, result.scheduled.size(),
                                       result.unscheduled.size());
    return result;
}

// =============================================================================
// Policy Helpers
// =============================================================================

auto placement_scheduler::target_time(const work_item_request& request,
                                      std::size_t count,
                                      const std::optional<time_point>& deadline,
                                      time_point now) const -> time_point {
    if (request.preferred_start) {
        return *request.preferred_start;
    }

    if (deadline) {
        const clock::duration min_window = config_.min_spread_window;
        const auto window = std::max<clock::duration>(*deadline - now, min_window);
        const auto denominator = static_cast<double>(std::max<std::size_t>(count, 2) - 1);
        const auto fraction = static_cast<double>(request.position) / denominator;
        return now + std::chrono::duration_cast<clock::duration>(window * fraction);
    }

    return now + std::chrono::days{static_cast<int>(request.position)};
}

auto placement_scheduler::rank_candidates(const slot_queue& queue,
                                          const std::vector<scheduled_assignment>& placed,
                                          time_point target) const
    -> std::vector<std::size_t> {
    std::map<std::chrono::local_days, std::size_t> day_counts;
    for (const auto& assignment : placed) {
        ++day_counts[zone_.local_date(assignment.interval.start)];
    }

    auto rank_key = [&](std::size_t index) {
        const auto start = queue[index].start;
        const auto day = day_counts.find(zone_.local_date(start));
        const std::size_t load = day == day_counts.end() ? 0 : day->second;
        const auto distance = start >= target ? start - target : target - start;
        return std::make_tuple(start >= target ? 0 : 1, load, distance);
    };

    std::vector<std::size_t> indices(queue.size());
    std::iota(indices.begin(), indices.end(), std::size_t{0});
    std::stable_sort(indices.begin(), indices.end(),
                     [&](std::size_t a, std::size_t b) {
                         return rank_key(a) < rank_key(b);
                     });
    return indices;
}

auto placement_scheduler::conflicts(const time_interval& tentative,
                                    const std::vector<scheduled_assignment>& placed) const
    -> bool {
    const auto buffer = consumer_.buffer();
    return std::any_of(placed.begin(), placed.end(),
                       [&](const scheduled_assignment& existing) {
                           return tentative.start < existing.interval.end + buffer &&
                                  tentative.end + buffer > existing.interval.start;
                       });
}

}  // namespace studyplan::scheduling
