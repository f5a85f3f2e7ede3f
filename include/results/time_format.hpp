/**
 * @file time_format.hpp
 * @brief Human-readable elapsed time for estimation reports
 */

#ifndef BEKK_RESULTS_TIME_FORMAT_HPP
#define BEKK_RESULTS_TIME_FORMAT_HPP

#include <string>

namespace bekk
{
    namespace results
    {

        /**
         * @brief Format a duration with one decimal and an adaptive unit
         * @param seconds Elapsed time in seconds
         * @return e.g. "2.5 min", "12.3 s", "4.0 ms", "7.1 us", "15.0 ns"
         * @throws std::invalid_argument if seconds is negative or not finite
         *
         * Unit selection:
         * - 0 or above 60 s: minutes
         * - above 1 s: seconds
         * - above 1 ms: milliseconds
         * - above 1 us: microseconds
         * - otherwise nanoseconds
         */
        std::string format_time(double seconds);

    } // namespace results
} // namespace bekk

#endif // BEKK_RESULTS_TIME_FORMAT_HPP
