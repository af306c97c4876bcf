/**
 * @file interval_subtractor.hpp
 * @brief Removal of a busy interval from a set of free segments
 */

#pragma once

#include "studyplan/core/time_interval.hpp"

#include <vector>

namespace studyplan::scheduling {

/**
 * @brief Subtract a busy interval from every segment
 *
 * Segments the busy interval does not touch are kept as is. An overlapped
 * segment contributes its head [segment.start, busy.start) and/or its tail
 * [busy.end, segment.end); pieces with non-positive duration are dropped.
 * Output follows input order, with a segment's head before its tail. No
 * merging or de-duplication takes place.
 *
 * @param segments Free segments
 * @param busy Interval to remove
 * @return Remaining pieces
 */
[[nodiscard]] auto subtract_interval(const std::vector<core::time_interval>& segments,
                                     const core::time_interval& busy)
    -> std::vector<core::time_interval>;

}  // namespace studyplan::scheduling
