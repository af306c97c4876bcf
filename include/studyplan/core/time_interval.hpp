/**
 * @file time_interval.hpp
 * @brief Half-open [start, end) range of instants
 */

#pragma once

#include "studyplan/core/local_zone.hpp"
#include "studyplan/core/result.hpp"

#include <chrono>
#include <string>

namespace studyplan::core {

/**
 * @brief Half-open range of instants [start, end)
 *
 * Well-formed intervals satisfy start < end. The struct stays an aggregate
 * so that algorithms can build intermediate pieces cheaply; use create()
 * where input has not been validated yet.
 */
struct time_interval {
    /// Inclusive start
    time_point start;

    /// Exclusive end
    time_point end;

    /**
     * @brief Create a validated interval
     * @return The interval, or invalid_interval if start >= end
     */
    [[nodiscard]] static auto create(time_point start, time_point end)
        -> Result<time_interval>;

    [[nodiscard]] auto duration() const noexcept -> clock::duration {
        return end - start;
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return !(start < end); }

    /**
     * @brief Check whether the two half-open ranges share any instant
     */
    [[nodiscard]] auto overlaps(const time_interval& other) const noexcept -> bool {
        return start < other.end && other.start < end;
    }

    [[nodiscard]] auto contains(time_point tp) const noexcept -> bool {
        return start <= tp && tp < end;
    }

    /**
     * @brief Render as "YYYY-MM-DD HH:MM - YYYY-MM-DD HH:MM" in a zone
     */
    [[nodiscard]] auto to_string(const local_zone& zone) const -> std::string;

    auto operator==(const time_interval&) const noexcept -> bool = default;
};

}  // namespace studyplan::core
