/**
 * @file estimation_settings.hpp
 * @brief Configuration of a BEKK estimation run
 *
 * Describes the model specification an estimation was run with and the
 * weighting scheme used for portfolio diagnostics. Settings are read from
 * JSON:
 *
 * @code{.json}
 * {
 *   "model": "standard",
 *   "restriction": "full",
 *   "use_target": true,
 *   "cfree": false,
 *   "method": "SLSQP",
 *   "weights": "minvar"
 * }
 * @endcode
 *
 * Every field is optional; missing fields take the defaults shown in the
 * struct below.
 */

#pragma once

#include "model/model_types.hpp"
#include "results/weight_kind.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace bekk
{
    namespace estimation
    {

        /**
         * @struct EstimationSettings
         * @brief Model specification and diagnostic options of a run
         */
        struct EstimationSettings
        {
            model::ModelType model_type = model::ModelType::STANDARD;   ///< Model family
            model::Restriction restriction = model::Restriction::FULL;  ///< Restriction on A and B
            bool use_target = true;                                     ///< Variance targeting
            bool cfree = false;                                         ///< C is a free lower triangular matrix
            std::string method = "SLSQP";                               ///< Optimization method name
            results::WeightKind weights = results::WeightKind::EQUAL;   ///< Diagnostic weighting scheme, see BEKKResults::configured_weights

            /**
             * @brief Create settings from JSON
             * @param j JSON object with settings
             * @return Parsed and validated settings
             * @throws std::invalid_argument if an enumerated value is unknown
             * @throws nlohmann::json::exception if a field has the wrong type
             */
            static EstimationSettings from_json(const nlohmann::json &j);

            /**
             * @brief Load settings from a JSON file
             * @param filepath Path to the JSON file
             * @return Parsed and validated settings
             * @throws std::runtime_error if the file cannot be opened or parsed
             * @throws std::invalid_argument if an enumerated value is unknown
             */
            static EstimationSettings from_file(const std::string &filepath);

            /**
             * @brief Convert settings to JSON
             */
            nlohmann::json to_json() const;

            /**
             * @brief Validate settings
             * @throws std::invalid_argument if method is empty
             *
             * Warns on std::cerr when cfree is combined with variance
             * targeting, since C is then derived from the target.
             */
            void validate() const;
        };

    } // namespace estimation
} // namespace bekk
