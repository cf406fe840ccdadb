/**
 * @file particle_swarm.hpp
 * @brief Particle swarm portfolio optimizer
 *
 * Per generation and particle:
 *
 *     v = w * v + r1 * (pbest - x) + r2 * (gbest - x),   r1, r2 ~ U[0, 1)
 *     x = project(x + v)
 *
 * The personal best is replaced on strict improvement only; the global best
 * is then compared against and replaced by a copy of the particle.
 */

#pragma once

#include "optimizer/metaheuristic_optimizer.hpp"

namespace natopt
{
    namespace optimizer
    {

        /**
         * @struct SwarmParameters
         * @brief Velocity update settings
         */
        struct SwarmParameters
        {
            double inertia = 0.5; ///< Weight of the previous velocity

            /**
             * @throws std::invalid_argument if inertia is negative or not finite
             */
            void validate() const;

            static SwarmParameters from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @class ParticleSwarm
         * @brief Particle swarm optimization over the probability simplex
         */
        class ParticleSwarm : public MetaheuristicOptimizer
        {
        public:
            explicit ParticleSwarm(const SwarmParameters &params = SwarmParameters());

            HeuristicResult run_from(const SharpeObjective &objective,
                                     Population initial,
                                     int generations,
                                     RandomEngine &rng,
                                     const GenerationObserver &observer = GenerationObserver()) const override;

            std::string get_name() const override { return "ParticleSwarm"; }
            nlohmann::json get_parameters() const override;

            const SwarmParameters &parameters() const { return params_; }

        private:
            SwarmParameters params_;
        };

    } // namespace optimizer
} // namespace natopt
