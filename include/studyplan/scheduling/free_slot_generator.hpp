/**
 * @file free_slot_generator.hpp
 * @brief Construction of free time slots from a busy calendar
 */

#pragma once

#include "studyplan/core/local_zone.hpp"
#include "studyplan/scheduling/schedule_types.hpp"
#include "studyplan/scheduling/scheduler_config.hpp"

#include <vector>

namespace studyplan::scheduling {

/**
 * @brief Builds the free slots of a planning horizon
 *
 * For each local calendar day from today through horizon_days - 1:
 * - the working window [work_day_start, work_day_end) is built
 * - a window that has fully elapsed is skipped, one containing "now" is
 *   clipped to start at "now"
 * - every busy interval starting on that local day is subtracted
 * - remaining segments of at least min_slot_length are kept
 *
 * Output is the concatenation of each day's segments in day order. It is
 * not sorted globally; the placement scheduler orders slots itself.
 *
 * @example
 * @code
 * free_slot_generator generator{scheduler_config{}, zone};
 * auto slots = generator.generate(busy, std::chrono::system_clock::now());
 * @endcode
 */
class free_slot_generator {
public:
    free_slot_generator(const scheduler_config& config, const core::local_zone& zone);

    /**
     * @brief Generate free slots
     * @param busy Existing calendar intervals; ill-formed ones are ignored
     * @param now Current instant
     * @return Free slots grouped by day
     */
    [[nodiscard]] auto generate(const std::vector<busy_interval>& busy,
                                time_point now) const -> std::vector<free_slot>;

    /**
     * @brief Working window of a local calendar day, before clipping
     */
    [[nodiscard]] auto working_window(std::chrono::local_days day) const -> time_interval;

private:
    scheduler_config config_;
    core::local_zone zone_;
};

}  // namespace studyplan::scheduling
