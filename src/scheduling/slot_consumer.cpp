/**
 * @file slot_consumer.cpp
 * @brief Implementation of slot consumption
 */

#include "studyplan/scheduling/slot_consumer.hpp"
#include "studyplan/scheduling/boundary_rounder.hpp"

namespace studyplan::scheduling {

slot_consumer::slot_consumer(const scheduler_config& config,
                             const core::local_zone& zone)
    : buffer_(config.buffer)
    , zone_(zone) {}

auto slot_consumer::has_room(const free_slot& slot, clock::duration duration) const
    -> bool {
    return slot.duration() >= duration + buffer_;
}

auto slot_consumer::plan(const free_slot& slot, clock::duration duration) const
    -> std::optional<slot_consumption> {
    if (!has_room(slot, duration)) {
        return std::nullopt;
    }

    auto start = round_up_to_grid(slot.start, zone_);
    if (start < slot.start) {
        start = snap_forward_to_grid(slot.start, zone_);
    }
    if (start >= slot.end) {
        return std::nullopt;
    }

    auto end = round_up_to_grid(start + duration, zone_);
    if (end > slot.end) {
        end = truncate_to_minute(slot.end);
    }
    if (end <= start) {
        return std::nullopt;
    }

    slot_consumption result{{start, end}, std::nullopt};
    if (end + buffer_ < slot.end) {
        result.remainder = free_slot{end + buffer_, slot.end};
    } else if (end < slot.end) {
        result.remainder = free_slot{end, slot.end};
    }
    return result;
}

}  // namespace studyplan::scheduling
