/**
 * @file time_format.cpp
 * @brief Implementation of elapsed time formatting
 */

#include "results/time_format.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bekk
{
    namespace results
    {

        std::string format_time(double seconds)
        {
            if (!std::isfinite(seconds) || seconds < 0.0)
            {
                throw std::invalid_argument(
                    "Elapsed time must be finite and non-negative, got: " + std::to_string(seconds));
            }

            double value = seconds;
            std::string units;

            if (seconds > 60.0 || seconds == 0.0)
            {
                units = "min";
                value = seconds / 60.0;
            }
            else if (seconds > 1.0)
            {
                units = "s";
            }
            else if (seconds > 1e-3)
            {
                units = "ms";
                value = seconds * 1e3;
            }
            else if (seconds > 1e-6)
            {
                units = "us";
                value = seconds * 1e6;
            }
            else
            {
                units = "ns";
                value = seconds * 1e9;
            }

            std::ostringstream out;
            out << std::fixed << std::setprecision(1) << value << " " << units;
            return out.str();
        }

    } // namespace results
} // namespace bekk
