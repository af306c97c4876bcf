/**
 * @file slot_consumer.hpp
 * @brief Fitting a single work item into a free slot
 */

#pragma once

#include "studyplan/core/local_zone.hpp"
#include "studyplan/scheduling/schedule_types.hpp"
#include "studyplan/scheduling/scheduler_config.hpp"

#include <optional>

namespace studyplan::scheduling {

/**
 * @brief Result of fitting an item into a slot
 */
struct slot_consumption {
    /// Grid-aligned interval given to the item
    time_interval assigned;

    /// What is left of the slot, absent when fully used
    std::optional<free_slot> remainder;
};

/**
 * @brief Computes grid-aligned placements inside a single slot
 *
 * The start is the slot start rounded onto the grid (never earlier than the
 * slot start). The end is start + duration rounded onto the grid, or the
 * slot end truncated to the minute when rounding would overshoot it. The
 * remainder begins one buffer after the assigned end when room is left,
 * otherwise directly at the assigned end.
 *
 * plan() is side-effect free, so the same computation serves both the
 * scheduler's tentative overlap check and the actual consumption.
 */
class slot_consumer {
public:
    slot_consumer(const scheduler_config& config, const core::local_zone& zone);

    /**
     * @brief Fit an item of the given duration into a slot
     * @param slot Free slot to consume from
     * @param duration Effective item duration
     * @return Placement and remainder, or nullopt if the item does not fit
     */
    [[nodiscard]] auto plan(const free_slot& slot, clock::duration duration) const
        -> std::optional<slot_consumption>;

    /**
     * @brief Check only the size requirement (duration plus buffer)
     */
    [[nodiscard]] auto has_room(const free_slot& slot, clock::duration duration) const
        -> bool;

    [[nodiscard]] auto buffer() const noexcept -> clock::duration { return buffer_; }

private:
    clock::duration buffer_;
    core::local_zone zone_;
};

}  // namespace studyplan::scheduling
