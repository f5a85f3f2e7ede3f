/**
 * @file parameter_set.hpp
 * @brief Abstract interface for estimated model parameters
 *
 * The results layer does not depend on a concrete parameterization. It
 * stores parameter sets produced by the estimation step and needs only
 * two capabilities from them: the penalty term added to the objective
 * during optimization, and a text form for reports.
 *
 * Thread Safety: Implementations are expected to be immutable after
 * construction and therefore safe for concurrent reads.
 */

#pragma once

#include <string>

namespace bekk
{
    namespace model
    {

        /**
         * @class ParameterSet
         * @brief Abstract base class for a set of estimated parameters
         *
         * Usage Example:
         * @code
         * std::shared_ptr<const ParameterSet> params =
         *     std::make_shared<BEKKParams>(BEKKParams::from_abc(a, b, c));
         * double loglik = -objective + params->penalty();
         * @endcode
         */
        class ParameterSet
        {
        public:
            virtual ~ParameterSet() = default;

            /**
             * @brief Constraint penalty included in the optimized objective
             * @return Non-negative penalty, zero when all constraints hold
             */
            virtual double penalty() const = 0;

            /**
             * @brief Text block used in result reports
             */
            virtual std::string to_string() const = 0;

            /**
             * @brief Get the name of the parameterization
             */
            virtual std::string get_name() const = 0;
        };

    } // namespace model
} // namespace bekk
