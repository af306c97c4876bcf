/**
 * @file slot_queue.hpp
 * @brief Working set of free slots consumed during one scheduling run
 */

#pragma once

#include "studyplan/scheduling/schedule_types.hpp"
#include "studyplan/scheduling/slot_consumer.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace studyplan::scheduling {

/**
 * @brief Free slots ordered by start, shrunk in place as items are placed
 *
 * Owned by a single schedule() call and discarded afterwards. Ordering is
 * a stable sort on start, so slots sharing a start keep generator order.
 */
class slot_queue {
public:
    /**
     * @brief Build the queue from generated slots
     * @param slots Free slots in any order
     */
    explicit slot_queue(std::vector<free_slot> slots);

    [[nodiscard]] auto size() const noexcept -> std::size_t { return slots_.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return slots_.empty(); }

    [[nodiscard]] auto operator[](std::size_t index) const -> const free_slot& {
        return slots_[index];
    }

    [[nodiscard]] auto slots() const noexcept -> const std::vector<free_slot>& {
        return slots_;
    }

    /**
     * @brief Place an item into the slot at index
     *
     * On success the slot is replaced by its remainder, or removed when
     * nothing is left. On failure the queue is unchanged.
     *
     * @param index Slot position
     * @param duration Effective item duration
     * @param consumer Placement policy
     * @return Assigned interval, or nullopt if the item does not fit
     */
    auto consume(std::size_t index, clock::duration duration,
                 const slot_consumer& consumer) -> std::optional<time_interval>;

private:
    std::vector<free_slot> slots_;
};

}  // namespace studyplan::scheduling
