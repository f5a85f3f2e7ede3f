/**
 * @file model_types.hpp
 * @brief Enumerations describing a BEKK model specification
 *
 * A BEKK estimation is characterized by the model family and by the
 * restriction imposed on the A and B matrices. Both are carried through
 * configuration as lowercase strings and parsed here into typed values.
 */

#pragma once

#include <string>

namespace bekk
{
    namespace model
    {

        /**
         * @enum ModelType
         * @brief Family of BEKK model
         */
        enum class ModelType
        {
            STANDARD, ///< Standard BEKK
            SPATIAL   ///< Spatial BEKK (weights matrices shared across assets)
        };

        /**
         * @enum Restriction
         * @brief Restriction on the A and B parameter matrices
         */
        enum class Restriction
        {
            FULL,     ///< Unrestricted N x N matrices
            DIAGONAL, ///< Diagonal matrices
            SCALAR    ///< Scalar multiples of the identity
        };

        /**
         * @brief Parse model type from string
         * @param name "standard" or "spatial" (case-insensitive)
         * @return Parsed model type
         * @throws std::invalid_argument if name is unknown
         */
        ModelType parse_model_type(const std::string &name);

        /**
         * @brief Parse restriction from string
         * @param name "full", "diagonal" or "scalar" (case-insensitive)
         * @return Parsed restriction
         * @throws std::invalid_argument if name is unknown
         */
        Restriction parse_restriction(const std::string &name);

        std::string to_string(ModelType type);
        std::string to_string(Restriction restriction);

        /**
         * @brief Lowercase and strip surrounding whitespace
         */
        std::string normalize_name(const std::string &name);

    } // namespace model
} // namespace bekk
