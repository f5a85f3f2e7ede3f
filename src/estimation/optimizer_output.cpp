/**
 * @file optimizer_output.cpp
 * @brief Implementation of optimizer output helpers
 */

#include "estimation/optimizer_output.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

namespace bekk
{
    namespace estimation
    {

        OptimizerOutput::OptimizerOutput()
            : fun(0.0),
              success(false)
        {
        }

        bool OptimizerOutput::is_valid() const
        {
            if (!success)
                return false;
            if (x.size() == 0)
                return false;
            if (!x.allFinite())
                return false;
            if (!std::isfinite(fun))
                return false;

            return true;
        }

        void OptimizerOutput::print_summary() const
        {
            std::cout << "\n=== Optimizer Output ===\n";
            std::cout << "Status: " << (success ? "SUCCESS" : "FAILED") << "\n";
            std::cout << "Message: " << message << "\n";
            std::cout << "Iterations: ";
            if (nit)
            {
                std::cout << *nit << "\n";
            }
            else
            {
                std::cout << "NA\n";
            }
            std::cout << "Parameters: " << num_params() << "\n";
            std::cout << "Objective: " << std::fixed << std::setprecision(6) << fun << "\n";
            std::cout << "========================\n"
                      << std::endl;
        }

    } // namespace estimation
} // namespace bekk
