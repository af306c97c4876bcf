/**
 * @file interval_subtractor.cpp
 * @brief Implementation of busy interval subtraction
 */

#include "studyplan/scheduling/interval_subtractor.hpp"

namespace studyplan::scheduling {

auto subtract_interval(const std::vector<core::time_interval>& segments,
                       const core::time_interval& busy)
    -> std::vector<core::time_interval> {
    std::vector<core::time_interval> result;
    result.reserve(segments.size() + 1);

    auto keep = [&result](core::time_interval piece) {
        if (!piece.empty()) {
            result.push_back(piece);
        }
    };

    for (const auto& segment : segments) {
        if (busy.end <= segment.start || busy.start >= segment.end) {
            keep(segment);
            continue;
        }
        if (busy.start > segment.start) {
            keep({segment.start, busy.start});
        }
        if (busy.end < segment.end) {
            keep({busy.end, segment.end});
        }
    }

    return result;
}

}  // namespace studyplan::scheduling
