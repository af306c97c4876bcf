/**
 * @file local_zone.cpp
 * @brief Implementation of fixed-offset local time conversions
 */

#include "studyplan/core/local_zone.hpp"

#include "studyplan/compat/format.hpp"

namespace studyplan::core {

auto local_zone::create(std::chrono::minutes utc_offset) -> Result<local_zone> {
    if (utc_offset > max_offset || utc_offset < -max_offset) {
        return studyplan_error<local_zone>(
            error_codes::invalid_utc_offset,
            "UTC offset out of range",
            compat::format("offset_minutes={}", utc_offset.count()));
    }
    return Result<local_zone>::ok(local_zone{utc_offset});
}

auto local_zone::to_local(time_point tp) const noexcept -> local_time_point {
    return local_time_point{tp.time_since_epoch() + offset_};
}

auto local_zone::to_sys(local_time_point lt) const noexcept -> time_point {
    return time_point{lt.time_since_epoch() - offset_};
}

auto local_zone::local_date(time_point tp) const noexcept -> std::chrono::local_days {
    return std::chrono::floor<std::chrono::days>(to_local(tp));
}

auto local_zone::at(std::chrono::local_days day,
                    std::chrono::minutes time_of_day) const noexcept -> time_point {
    return to_sys(local_time_point{day.time_since_epoch() + time_of_day});
}

auto local_zone::format(time_point tp) const -> std::string {
    auto local = to_local(tp);
    auto day = std::chrono::floor<std::chrono::days>(local);
    std::chrono::year_month_day ymd{day};
    std::chrono::hh_mm_ss hms{
        std::chrono::floor<std::chrono::minutes>(local - day)};

    return compat::format("{:04}-{:02}-{:02} {:02}:{:02}",
                          static_cast<int>(ymd.year()),
                          static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day()),
                          hms.hours().count(),
                          hms.minutes().count());
}

}  // namespace studyplan::core
