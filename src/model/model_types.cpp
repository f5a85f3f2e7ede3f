/**
 * @file model_types.cpp
 * @brief Parsing and naming of BEKK model enumerations
 */

#include "model/model_types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace bekk
{
    namespace model
    {

        std::string normalize_name(const std::string &name)
        {
            auto first = std::find_if_not(name.begin(), name.end(), [](unsigned char c)
                                          { return std::isspace(c); });
            auto last = std::find_if_not(name.rbegin(), name.rend(), [](unsigned char c)
                                         { return std::isspace(c); })
                            .base();

            std::string normalized = (first < last) ? std::string(first, last) : std::string();

            // Convert to lowercase
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            return normalized;
        }

        ModelType parse_model_type(const std::string &name)
        {
            std::string normalized = normalize_name(name);

            if (normalized == "standard")
            {
                return ModelType::STANDARD;
            }
            else if (normalized == "spatial")
            {
                return ModelType::SPATIAL;
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown model type: '" + name + "'. Valid options: standard, spatial");
            }
        }

        Restriction parse_restriction(const std::string &name)
        {
            std::string normalized = normalize_name(name);

            if (normalized == "full")
            {
                return Restriction::FULL;
            }
            else if (normalized == "diagonal")
            {
                return Restriction::DIAGONAL;
            }
            else if (normalized == "scalar")
            {
                return Restriction::SCALAR;
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown restriction: '" + name + "'. Valid options: full, diagonal, scalar");
            }
        }

        std::string to_string(ModelType type)
        {
            switch (type)
            {
            case ModelType::STANDARD:
                return "standard";
            case ModelType::SPATIAL:
                return "spatial";
            }
            throw std::invalid_argument("Unmapped model type value");
        }

        std::string to_string(Restriction restriction)
        {
            switch (restriction)
            {
            case Restriction::FULL:
                return "full";
            case Restriction::DIAGONAL:
                return "diagonal";
            case Restriction::SCALAR:
                return "scalar";
            }
            throw std::invalid_argument("Unmapped restriction value");
        }

    } // namespace model
} // namespace bekk
