/**
 * @file optimizer_factory.hpp
 * @brief Factory for creating metaheuristic engines from configuration
 *
 * Example configuration entry:
 * @code{.json}
 * {
 *   "type": "bat",
 *   "population_size": 30,
 *   "generations": 100,
 *   "params": { "freq_max": 5.0, "loudness_decay": 0.95 }
 * }
 * @endcode
 */

#pragma once

#include "data/data_loader.hpp"
#include "optimizer/metaheuristic_optimizer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace natopt
{
    namespace optimizer
    {

        /**
         * @class OptimizerFactory
         * @brief Creates engines by name
         *
         * Supported types (case-insensitive):
         * - "bat" or "bat_algorithm": BatAlgorithm
         * - "genetic" or "ga": GeneticAlgorithm
         * - "pso" or "particle_swarm": ParticleSwarm
         * - "grey_wolf" or "gwo": GreyWolf
         *
         * Usage Pattern:
         * @code
         * auto engine = OptimizerFactory::create("gwo", nlohmann::json::object());
         * auto result = engine->run(objective, 30, 100, rng);
         * @endcode
         */
        class OptimizerFactory
        {
        public:
            /**
             * @brief Create engine from type string and parameter JSON
             * @param type Engine type
             * @param params Engine parameters; missing keys take defaults
             * @return Unique pointer to the created engine
             * @throws std::invalid_argument if type is unknown or a
             *         parameter is out of range
             */
            static std::unique_ptr<MetaheuristicOptimizer> create(
                const std::string &type,
                const nlohmann::json &params);

            /**
             * @brief Create engine from a configuration entry
             */
            static std::unique_ptr<MetaheuristicOptimizer> create(const EngineConfig &config);

            /**
             * @brief Get list of supported engine types
             */
            static std::vector<std::string> get_supported_types();

        private:
            /**
             * @brief Lowercase and trim a type string
             */
            static std::string normalize_type(const std::string &type);
        };

    } // namespace optimizer
} // namespace natopt
