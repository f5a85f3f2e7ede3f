/**
 * @file optimizer_output.hpp
 * @brief Output of the numerical optimizer used in BEKK estimation
 *
 * The estimation step minimizes the penalized negative log-likelihood and
 * hands the optimizer's final state to the results layer. Only the fields
 * read downstream are modelled here.
 */

#pragma once

#include <Eigen/Dense>
#include <optional>
#include <string>

namespace bekk
{
    namespace estimation
    {

        /**
         * @struct OptimizerOutput
         * @brief Final state reported by the optimizer
         */
        struct OptimizerOutput
        {
            Eigen::VectorXd x;      ///< Final parameter vector
            double fun;             ///< Final objective (penalized negative log-likelihood)
            bool success;           ///< Optimizer reported convergence
            std::string message;    ///< Status message
            std::optional<int> nit; ///< Iteration count, if the method reports one

            /**
             * @brief Default constructor
             */
            OptimizerOutput();

            /**
             * @brief Number of estimated parameters
             */
            int num_params() const { return static_cast<int>(x.size()); }

            /**
             * @brief Check if output is usable
             * @return true if converged with finite parameters and objective
             */
            bool is_valid() const;

            /**
             * @brief Print summary of the optimizer state
             */
            void print_summary() const;
        };

    } // namespace estimation
} // namespace bekk
