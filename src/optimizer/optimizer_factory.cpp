/**
 * @file optimizer_factory.cpp
 * @brief Implementation of the engine factory
 */

#include "optimizer/optimizer_factory.hpp"
#include "optimizer/bat_algorithm.hpp"
#include "optimizer/genetic_algorithm.hpp"
#include "optimizer/grey_wolf.hpp"
#include "optimizer/particle_swarm.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace natopt
{
    namespace optimizer
    {

        std::string OptimizerFactory::normalize_type(const std::string &type)
        {
            size_t start = type.find_first_not_of(" \t");
            if (start == std::string::npos)
            {
                return "";
            }
            size_t end = type.find_last_not_of(" \t");
            std::string normalized = type.substr(start, end - start + 1);

            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c)
                           { return std::tolower(c); });
            return normalized;
        }

        std::unique_ptr<MetaheuristicOptimizer> OptimizerFactory::create(
            const std::string &type,
            const nlohmann::json &params)
        {
            if (!params.is_null() && !params.is_object())
            {
                throw std::invalid_argument(
                    "Parameters for engine '" + type + "' must be a JSON object");
            }

            const nlohmann::json &p = params.is_null() ? nlohmann::json::object() : params;
            std::string normalized = normalize_type(type);

            if (normalized == "bat" || normalized == "bat_algorithm")
            {
                return std::make_unique<BatAlgorithm>(BatParameters::from_json(p));
            }
            else if (normalized == "genetic" || normalized == "ga")
            {
                return std::make_unique<GeneticAlgorithm>(GeneticParameters::from_json(p));
            }
            else if (normalized == "pso" || normalized == "particle_swarm")
            {
                return std::make_unique<ParticleSwarm>(SwarmParameters::from_json(p));
            }
            else if (normalized == "grey_wolf" || normalized == "gwo")
            {
                return std::make_unique<GreyWolf>(GreyWolfParameters::from_json(p));
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown optimizer type: '" + type + "'. "
                    "Valid options: bat, genetic, pso, grey_wolf");
            }
        }

        std::unique_ptr<MetaheuristicOptimizer> OptimizerFactory::create(const EngineConfig &config)
        {
            return create(config.type, config.params);
        }

        std::vector<std::string> OptimizerFactory::get_supported_types()
        {
            return {
                "bat",
                "bat_algorithm",
                "genetic",
                "ga",
                "pso",
                "particle_swarm",
                "grey_wolf",
                "gwo"};
        }

    } // namespace optimizer
} // namespace natopt
