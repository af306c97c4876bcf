/**
 * @file slot_queue.cpp
 * @brief Implementation of the per-run slot queue
 */

#include "studyplan/scheduling/slot_queue.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace studyplan::scheduling {

slot_queue::slot_queue(std::vector<free_slot> slots)
    : slots_(std::move(slots)) {
    std::stable_sort(slots_.begin(), slots_.end(),
                     [](const free_slot& a, const free_slot& b) {
                         return a.start < b.start;
                     });
}

auto slot_queue::consume(std::size_t index, clock::duration duration,
                         const slot_consumer& consumer)
    -> std::optional<time_interval> {
    if (index >= slots_.size()) {
        return std::nullopt;
    }

    auto consumption = consumer.plan(slots_[index], duration);
    if (!consumption) {
        return std::nullopt;
    }

    if (consumption->remainder) {
        slots_[index] = *consumption->remainder;
    } else {
        slots_.erase(std::next(slots_.begin(), static_cast<std::ptrdiff_t>(index)));
    }
    return consumption->assigned;
}

}  // namespace studyplan::scheduling
