/**
 * @file local_zone.hpp
 * @brief Fixed-offset local time zone used for wall-clock calculations
 *
 * The planner reasons about working hours, calendar days and half-hour grid
 * lines in the student's local time. A local_zone carries the UTC offset of
 * that time and converts between system instants and local wall-clock time.
 */

#pragma once

#include "studyplan/core/result.hpp"

#include <chrono>
#include <string>

namespace studyplan::core {

/// Clock used for every instant handled by the planner
using clock = std::chrono::system_clock;

/// Absolute instant
using time_point = clock::time_point;

/// Wall-clock time in a local_zone
using local_time_point = std::chrono::local_time<clock::duration>;

/**
 * @brief Local time zone expressed as a fixed offset from UTC
 *
 * Offsets are whole minutes within [-18h, +18h]. Daylight saving
 * transitions are not modelled; callers resolve the offset that applies
 * to the planning window before constructing the zone.
 *
 * @example
 * @code
 * auto zone = local_zone::create(std::chrono::minutes{60});
 * if (zone.is_ok()) {
 *     auto day = zone.value().local_date(now);
 *     auto nine_am = zone.value().at(day, std::chrono::hours{9});
 * }
 * @endcode
 */
class local_zone {
public:
    /// Largest accepted distance from UTC
    static constexpr std::chrono::minutes max_offset{18 * 60};

    /**
     * @brief Construct the UTC zone
     */
    constexpr local_zone() noexcept = default;

    /**
     * @brief Create a zone with the given UTC offset
     * @param utc_offset Offset of local time from UTC
     * @return The zone, or invalid_utc_offset if out of range
     */
    [[nodiscard]] static auto create(std::chrono::minutes utc_offset)
        -> Result<local_zone>;

    /**
     * @brief Zone with a zero offset
     */
    [[nodiscard]] static constexpr auto utc() noexcept -> local_zone {
        return local_zone{};
    }

    [[nodiscard]] constexpr auto utc_offset() const noexcept -> std::chrono::minutes {
        return offset_;
    }

    /**
     * @brief Convert an instant to local wall-clock time
     */
    [[nodiscard]] auto to_local(time_point tp) const noexcept -> local_time_point;

    /**
     * @brief Convert local wall-clock time back to an instant
     */
    [[nodiscard]] auto to_sys(local_time_point lt) const noexcept -> time_point;

    /**
     * @brief Local calendar day containing the instant
     */
    [[nodiscard]] auto local_date(time_point tp) const noexcept
        -> std::chrono::local_days;

    /**
     * @brief Instant at a local time of day on a local calendar day
     * @param day Local calendar day
     * @param time_of_day Offset from local midnight
     */
    [[nodiscard]] auto at(std::chrono::local_days day,
                          std::chrono::minutes time_of_day) const noexcept
        -> time_point;

    /**
     * @brief Render an instant as "YYYY-MM-DD HH:MM" local time
     */
    [[nodiscard]] auto format(time_point tp) const -> std::string;

    auto operator==(const local_zone&) const noexcept -> bool = default;

private:
    explicit constexpr local_zone(std::chrono::minutes offset) noexcept
        : offset_(offset) {}

    std::chrono::minutes offset_{0};
};

}  // namespace studyplan::core
