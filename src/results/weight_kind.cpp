/**
 * @file weight_kind.cpp
 * @brief Parsing of portfolio weighting schemes
 */

#include "results/weight_kind.hpp"
#include "model/model_types.hpp"
#include <stdexcept>

namespace bekk
{
    namespace results
    {

        WeightKind parse_weight_kind(const std::string &kind)
        {
            std::string normalized = model::normalize_name(kind);

            if (normalized == "equal")
            {
                return WeightKind::EQUAL;
            }
            else if (normalized == "minvar")
            {
                return WeightKind::MINVAR;
            }
            else
            {
                throw std::invalid_argument(
                    "Weight choice is not supported: '" + kind + "'. Valid options: equal, minvar");
            }
        }

        std::string to_string(WeightKind kind)
        {
            switch (kind)
            {
            case WeightKind::EQUAL:
                return "equal";
            case WeightKind::MINVAR:
                return "minvar";
            }
            throw std::invalid_argument("Unmapped weight kind value");
        }

    } // namespace results
} // namespace bekk
