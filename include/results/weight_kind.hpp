/**
 * @file weight_kind.hpp
 * @brief Portfolio weighting schemes used in BEKK diagnostics
 */

#ifndef BEKK_RESULTS_WEIGHT_KIND_HPP
#define BEKK_RESULTS_WEIGHT_KIND_HPP

#include <string>

namespace bekk
{
    namespace results
    {

        /**
         * @enum WeightKind
         * @brief Scheme used to form portfolio weights per observation
         */
        enum class WeightKind
        {
            EQUAL, ///< 1/N in every asset
            MINVAR ///< Minimum variance under the filtered covariance
        };

        /**
         * @brief Parse weighting scheme from string
         * @param kind "equal" or "minvar" (case-insensitive)
         * @return Parsed weighting scheme
         * @throws std::invalid_argument if kind is not supported
         */
        WeightKind parse_weight_kind(const std::string &kind);

        /**
         * @brief Canonical lowercase name of a weighting scheme
         */
        std::string to_string(WeightKind kind);

    } // namespace results
} // namespace bekk

#endif // BEKK_RESULTS_WEIGHT_KIND_HPP
