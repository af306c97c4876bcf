/**
 * @file placement_scheduler.hpp
 * @brief Greedy placement of work items into free calendar time
 */

#pragma once

#include "studyplan/core/local_zone.hpp"
#include "studyplan/scheduling/schedule_types.hpp"
#include "studyplan/scheduling/scheduler_config.hpp"
#include "studyplan/scheduling/slot_consumer.hpp"
#include "studyplan/scheduling/slot_queue.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace studyplan::scheduling {

/**
 * @brief Places work items into free slots in a single greedy pass
 *
 * Requests are handled strictly in input order. For each one a target time
 * is chosen, the current slots are ranked against it, and the first
 * candidate that fits without clashing with an earlier placement is
 * consumed. Items without a fitting candidate are reported unscheduled.
 *
 * ## Target Time
 *
 * 1. The request's preferred start, if any
 * 2. With a deadline: now + window * position / max(count - 1, 1), where
 *    window = max(deadline - now, min_spread_window)
 * 3. Otherwise: now + position days
 *
 * ## Candidate Ranking
 *
 * Ascending by, in order:
 * 1. whether the slot starts before the target (at/after is preferred)
 * 2. placements already made on the slot's local day (load balancing)
 * 3. distance between slot start and target
 *
 * Ties keep slot queue order.
 *
 * ## Overlap Defense
 *
 * A tentative placement is rejected if, with the buffer added to the end of
 * both intervals, it intersects any placement made earlier in the run.
 *
 * The scheduler holds no state between runs; schedule() is a pure function
 * of its arguments.
 */
class placement_scheduler {
public:
    placement_scheduler(const scheduler_config& config, const core::local_zone& zone);

    /**
     * @brief Schedule work items
     * @param requests Items in caller order
     * @param free_slots Free time, in any order
     * @param context Parent task title, deadline and routing tag
     * @param now Current instant
     * @return Placements and unscheduled items, both in request order
     */
    [[nodiscard]] auto schedule(const std::vector<work_item_request>& requests,
                                const std::vector<free_slot>& free_slots,
                                const plan_context& context,
                                time_point now) const -> schedule_result;

    /**
     * @brief Instant a request should be placed near
     * @param request The request
     * @param count Number of requests in the run
     * @param deadline Parent task deadline
     * @param now Current instant
     */
    [[nodiscard]] auto target_time(const work_item_request& request,
                                   std::size_t count,
                                   const std::optional<time_point>& deadline,
                                   time_point now) const -> time_point;

    /**
     * @brief Queue indices ordered by preference for a target time
     * @param queue Current slots
     * @param placed Placements made so far in the run
     * @param target Target time of the request
     */
    [[nodiscard]] auto rank_candidates(const slot_queue& queue,
                                       const std::vector<scheduled_assignment>& placed,
                                       time_point target) const
        -> std::vector<std::size_t>;

    /**
     * @brief Check a tentative interval against earlier placements
     * @return true if the buffered intervals intersect any placement
     */
    [[nodiscard]] auto conflicts(const time_interval& tentative,
                                 const std::vector<scheduled_assignment>& placed) const
        -> bool;

private:
    scheduler_config config_;
    core::local_zone zone_;
    slot_consumer consumer_;
};

}  // namespace studyplan::scheduling
