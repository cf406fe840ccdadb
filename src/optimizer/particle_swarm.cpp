/**
 * @file particle_swarm.cpp
 * @brief Implementation of particle swarm optimization
 */

#include "optimizer/particle_swarm.hpp"
#include "optimizer/simplex.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace natopt
{
    namespace optimizer
    {

        void SwarmParameters::validate() const
        {
            if (!(inertia >= 0.0) || !std::isfinite(inertia))
            {
                throw std::invalid_argument(
                    "inertia must be non-negative, got: " + std::to_string(inertia));
            }
        }

        SwarmParameters SwarmParameters::from_json(const nlohmann::json &j)
        {
            SwarmParameters params;
            params.inertia = j.value("inertia", params.inertia);

            params.validate();
            return params;
        }

        nlohmann::json SwarmParameters::to_json() const
        {
            return nlohmann::json{{"inertia", inertia}};
        }

        ParticleSwarm::ParticleSwarm(const SwarmParameters &params)
            : params_(params)
        {
            params_.validate();
        }

        nlohmann::json ParticleSwarm::get_parameters() const
        {
            nlohmann::json j = params_.to_json();
            j["type"] = "pso";
            return j;
        }

        HeuristicResult ParticleSwarm::run_from(const SharpeObjective &objective,
                                                Population swarm,
                                                int generations,
                                                RandomEngine &rng,
                                                const GenerationObserver &observer) const
        {
            prepare(objective, swarm, generations);

            const Eigen::Index n = swarm.size();
            const Eigen::Index dim = swarm.dimension();

            std::uniform_real_distribution<double> uniform(0.0, 1.0);

            Eigen::MatrixXd velocity = Eigen::MatrixXd::Zero(n, dim);
            Eigen::MatrixXd personal_best = swarm.positions;
            Eigen::VectorXd personal_best_fitness = swarm.fitness;

            Eigen::VectorXd global_best =
                personal_best.row(best_index(personal_best_fitness)).transpose();

            std::vector<double> history;
            history.reserve(static_cast<size_t>(generations));

            for (int iter = 0; iter < generations; ++iter)
            {
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    double r1 = uniform(rng);
                    double r2 = uniform(rng);

                    // Inertia plus pulls toward personal and global bests
                    velocity.row(i) = params_.inertia * velocity.row(i) +
                                      r1 * (personal_best.row(i) - swarm.positions.row(i)) +
                                      r2 * (global_best.transpose() - swarm.positions.row(i));

                    Eigen::VectorXd moved = project_to_simplex(
                        (swarm.positions.row(i) + velocity.row(i)).transpose());
                    swarm.positions.row(i) = moved.transpose();

                    double score = objective.fitness(moved);
                    swarm.fitness(i) = score;

                    // Strict improvement only
                    if (improves(score, personal_best_fitness(i)))
                    {
                        personal_best.row(i) = moved.transpose();
                        personal_best_fitness(i) = score;

                        // Fresh evaluation of the global best on every comparison
                        if (improves(score, objective.fitness(global_best)))
                        {
                            global_best = moved;
                        }
                    }
                }

                double best_sharpe = -objective.fitness(global_best);
                history.push_back(best_sharpe);

                if (observer)
                {
                    observer(iter, swarm, best_sharpe);
                }
            }

            return make_result(objective, global_best, std::move(history), generations);
        }

    } // namespace optimizer
} // namespace natopt
