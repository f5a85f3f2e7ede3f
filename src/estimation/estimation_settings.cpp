/**
 * @file estimation_settings.cpp
 * @brief Implementation of estimation settings I/O
 */

#include "estimation/estimation_settings.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace bekk
{
    namespace estimation
    {

        EstimationSettings EstimationSettings::from_json(const nlohmann::json &doc)
        {
            EstimationSettings settings;

            if (doc.contains("model"))
            {
                settings.model_type = model::parse_model_type(doc["model"].get<std::string>());
            }

            if (doc.contains("restriction"))
            {
                settings.restriction = model::parse_restriction(doc["restriction"].get<std::string>());
            }

            if (doc.contains("use_target"))
            {
                settings.use_target = doc["use_target"].get<bool>();
            }

            if (doc.contains("cfree"))
            {
                settings.cfree = doc["cfree"].get<bool>();
            }

            if (doc.contains("method"))
            {
                settings.method = doc["method"].get<std::string>();
            }

            if (doc.contains("weights"))
            {
                settings.weights = results::parse_weight_kind(doc["weights"].get<std::string>());
            }

            settings.validate();
            return settings;
        }

        EstimationSettings EstimationSettings::from_file(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            return from_json(j);
        }

        nlohmann::json EstimationSettings::to_json() const
        {
            return nlohmann::json{
                {"model", model::to_string(model_type)},
                {"restriction", model::to_string(restriction)},
                {"use_target", use_target},
                {"cfree", cfree},
                {"method", method},
                {"weights", results::to_string(weights)}};
        }

        void EstimationSettings::validate() const
        {
            if (method.empty())
            {
                throw std::invalid_argument("Optimization method must not be empty");
            }

            if (use_target && cfree)
            {
                std::cerr << "Warning: cfree has no effect with variance targeting\n";
            }
        }

    } // namespace estimation
} // namespace bekk
