/**
 * @file plan_hint_parser.cpp
 * @brief Implementation of plan text parsing
 */

#include "studyplan/intake/plan_hint_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>

namespace studyplan::intake {

namespace {

using std::chrono::minutes;

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto to_lower(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

struct time_of_day_keyword {
    std::string_view word;
    minutes time;
};

// Checked in this order; the first keyword contained in the hint wins.
constexpr std::array<time_of_day_keyword, 4> keywords{{
    {"evening", minutes{19 * 60}},
    {"afternoon", minutes{14 * 60}},
    {"morning", minutes{10 * 60}},
    {"night", minutes{21 * 60}},
}};

constexpr minutes default_hint_time{9 * 60};

/**
 * @brief Parse the whole string with a strftime-style format
 */
auto parse_exact(const std::string& text, const char* format) -> std::optional<std::tm> {
    std::tm tm_val{};
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm_val, format);
    if (iss.fail()) {
        return std::nullopt;
    }
    if (iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return tm_val;
}

auto to_local_day(const std::tm& tm_val) -> std::optional<std::chrono::local_days> {
    std::chrono::year_month_day ymd{
        std::chrono::year{tm_val.tm_year + 1900},
        std::chrono::month{static_cast<unsigned>(tm_val.tm_mon + 1)},
        std::chrono::day{static_cast<unsigned>(tm_val.tm_mday)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return std::chrono::local_days{ymd};
}

/**
 * @brief Remove a trailing " <keyword>" and anything after it
 */
auto strip_time_of_day(std::string_view value) -> std::string {
    std::string result(value);
    for (const auto& keyword : keywords) {
        auto lower = to_lower(result);
        auto pos = lower.find(" " + std::string(keyword.word));
        if (pos != std::string::npos) {
            result.erase(pos);
        }
    }
    return std::string(trim(result));
}

/**
 * @brief Parse "YYYY-MM-DDTHH:MM[:SS][Z|+HH:MM|-HH:MM]"
 */
auto parse_iso8601(std::string_view value, const core::local_zone& zone)
    -> std::optional<core::time_point> {
    std::string text(value);
    std::optional<minutes> offset;

    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
        offset = minutes{0};
        text.pop_back();
    } else if (text.size() > 6) {
        auto sign_pos = text.size() - 6;
        char sign = text[sign_pos];
        if ((sign == '+' || sign == '-') && text[sign_pos + 3] == ':') {
            auto tz = parse_exact(text.substr(sign_pos + 1), "%H:%M");
            if (!tz) {
                return std::nullopt;
            }
            minutes magnitude{tz->tm_hour * 60 + tz->tm_min};
            offset = sign == '-' ? -magnitude : magnitude;
            text.erase(sign_pos);
        }
    }

    auto parsed = parse_exact(text, "%Y-%m-%dT%H:%M:%S");
    if (!parsed) {
        parsed = parse_exact(text, "%Y-%m-%dT%H:%M");
    }
    if (!parsed) {
        return std::nullopt;
    }

    auto day = to_local_day(*parsed);
    if (!day) {
        return std::nullopt;
    }
    auto local = core::local_time_point{day->time_since_epoch()} +
                 std::chrono::hours{parsed->tm_hour} + minutes{parsed->tm_min} +
                 std::chrono::seconds{parsed->tm_sec};

    if (offset) {
        return core::time_point{local.time_since_epoch() - *offset};
    }
    return zone.to_sys(local);
}

}  // namespace

auto parse_due_datetime(std::string_view text, const core::local_zone& zone)
    -> std::optional<core::time_point> {
    auto value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    auto parsed = parse_exact(std::string(value), "%Y-%m-%d");
    if (!parsed) {
        return std::nullopt;
    }
    auto day = to_local_day(*parsed);
    if (!day) {
        return std::nullopt;
    }
    return zone.at(*day, due_time_of_day);
}

auto parse_plan_hint(std::string_view text, const core::local_zone& zone)
    -> std::optional<core::time_point> {
    auto value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }

    auto lower = to_lower(value);
    auto time_of_day = default_hint_time;
    for (const auto& keyword : keywords) {
        if (lower.find(keyword.word) != std::string::npos) {
            time_of_day = keyword.time;
            break;
        }
    }

    auto date_text = strip_time_of_day(value);

    if (auto parsed = parse_exact(date_text, "%Y-%m-%d %H:%M")) {
        if (auto day = to_local_day(*parsed)) {
            return zone.at(*day, std::chrono::hours{parsed->tm_hour} + minutes{parsed->tm_min});
        }
        return std::nullopt;
    }

    // %b and %B both accept abbreviated and full month names.
    for (const char* format : {"%Y-%m-%d", "%d %b %Y", "%b %d %Y"}) {
        if (auto parsed = parse_exact(date_text, format)) {
            if (auto day = to_local_day(*parsed)) {
                return zone.at(*day, time_of_day);
            }
            return std::nullopt;
        }
    }

    return parse_iso8601(value, zone);
}

auto parse_estimated_hours(std::string_view text) -> std::optional<double> {
    auto value = std::string(trim(text));
    if (value.empty()) {
        return std::nullopt;
    }

    double hours = 0.0;
    std::size_t consumed = 0;
    try {
        hours = std::stod(value, &consumed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    if (consumed != value.size() || !std::isfinite(hours)) {
        return std::nullopt;
    }
    return hours;
}

}  // namespace studyplan::intake
