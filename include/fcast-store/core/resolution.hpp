#pragma once

#include "fcast-store/core/time_types.hpp"

#include <cstddef>
#include <vector>

namespace fcaststore::core {

/**
 * @brief Infers the uniform sampling resolution of a timestamp sequence.
 *
 * The single distinct difference between consecutive timestamps is expressed in the
 * largest unit that divides it evenly, trying days, hours, minutes and seconds in turn.
 *
 * @param timestamps Ordered timestamps, at least two.
 * @throws std::invalid_argument If fewer than two timestamps are given.
 * @throws DataFormatError If the differences are not uniform or not a whole number of seconds.
 */
Period inferResolution(const std::vector<TimePoint> &timestamps);

/**
 * @brief Expresses @p difference in the largest of day, hour, minute, second dividing it evenly.
 * @throws DataFormatError If the difference is not a whole number of seconds.
 */
Period toLargestUnit(Duration difference);

/**
 * @brief Returns the first timestamp of the sequence.
 * @throws std::invalid_argument If the sequence is empty.
 */
TimePoint initialTimestamp(const std::vector<TimePoint> &timestamps);

/**
 * @brief Span from the initial timestamp to the last timestep of the last window.
 */
Duration totalPeriod(const TimePoint &initial_timestamp, std::size_t count, Duration interval,
                     std::size_t horizon, const Period &resolution);

} // namespace fcaststore::core
