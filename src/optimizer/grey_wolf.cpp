/**
 * @file grey_wolf.cpp
 * @brief Implementation of the grey wolf optimizer
 */

#include "optimizer/grey_wolf.hpp"
#include "optimizer/simplex.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace natopt
{
    namespace optimizer
    {

        void GreyWolfParameters::validate() const
        {
            if (!(a_initial >= 0.0) || !std::isfinite(a_initial))
            {
                throw std::invalid_argument(
                    "a_initial must be non-negative, got: " + std::to_string(a_initial));
            }
        }

        GreyWolfParameters GreyWolfParameters::from_json(const nlohmann::json &j)
        {
            GreyWolfParameters params;
            params.a_initial = j.value("a_initial", params.a_initial);

            params.validate();
            return params;
        }

        nlohmann::json GreyWolfParameters::to_json() const
        {
            return nlohmann::json{{"a_initial", a_initial}};
        }

        std::array<Eigen::Index, 3> select_leaders(const Eigen::VectorXd &fitness)
        {
            if (fitness.size() < 3)
            {
                throw std::invalid_argument(
                    "Grey wolf pack needs at least 3 wolves, got: " + std::to_string(fitness.size()));
            }

            std::vector<Eigen::Index> order = MetaheuristicOptimizer::rank_by_fitness(fitness);
            return {order[0], order[1], order[2]};
        }

        GreyWolf::GreyWolf(const GreyWolfParameters &params)
            : params_(params)
        {
            params_.validate();
        }

        nlohmann::json GreyWolf::get_parameters() const
        {
            nlohmann::json j = params_.to_json();
            j["type"] = "grey_wolf";
            return j;
        }

        HeuristicResult GreyWolf::run_from(const SharpeObjective &objective,
                                           Population pack,
                                           int generations,
                                           RandomEngine &rng,
                                           const GenerationObserver &observer) const
        {
            // Validate, project initial rows and evaluate them
            prepare(objective, pack, generations);

            const Eigen::Index n = pack.size();
            const Eigen::Index dim = pack.dimension();

            std::uniform_real_distribution<double> uniform(0.0, 1.0);

            std::array<Eigen::Index, 3> leaders = select_leaders(pack.fitness);
            Eigen::VectorXd best = pack.positions.row(leaders[0]).transpose();
            double best_fitness = pack.fitness(leaders[0]);

            std::vector<double> history;
            history.reserve(static_cast<size_t>(generations));

            std::array<Eigen::VectorXd, 3> leader_positions;
            Eigen::VectorXd wolf(dim);
            Eigen::VectorXd pull(dim);

            for (int t = 0; t < generations; ++t)
            {
                // Exploration coefficient decreases linearly to zero
                const double a = params_.a_initial *
                                 (1.0 - static_cast<double>(t) / static_cast<double>(generations));

                // Leaders are frozen for the whole generation
                for (size_t k = 0; k < leaders.size(); ++k)
                {
                    leader_positions[k] = pack.positions.row(leaders[k]).transpose();
                }

                for (Eigen::Index i = 0; i < n; ++i)
                {
                    wolf = pack.positions.row(i).transpose();
                    pull.setZero();

                    for (const Eigen::VectorXd &leader : leader_positions)
                    {
                        Eigen::VectorXd coef_a(dim);
                        Eigen::VectorXd coef_c(dim);
                        for (Eigen::Index d = 0; d < dim; ++d)
                        {
                            coef_a(d) = a * (2.0 * uniform(rng) - 1.0);
                        }
                        for (Eigen::Index d = 0; d < dim; ++d)
                        {
                            coef_c(d) = 2.0 * uniform(rng);
                        }

                        // D = |C * L - x|, X_L = L - A * D
                        Eigen::VectorXd distance = (coef_c.cwiseProduct(leader) - wolf).cwiseAbs();
                        pull += leader - coef_a.cwiseProduct(distance);
                    }

                    // Average of the three leader-guided positions
                    pack.positions.row(i) = project_to_simplex(pull / 3.0).transpose();
                }

                // Synchronous update: re-evaluate the whole pack, then re-rank
                evaluate(objective, pack);
                leaders = select_leaders(pack.fitness);

                // Alpha may be worse than an earlier generation's best
                if (improves(pack.fitness(leaders[0]), best_fitness))
                {
                    best = pack.positions.row(leaders[0]).transpose();
                    best_fitness = pack.fitness(leaders[0]);
                }

                history.push_back(-best_fitness);

                if (observer)
                {
                    observer(t, pack, -best_fitness);
                }
            }

            return make_result(objective, best, std::move(history), generations);
        }

    } // namespace optimizer
} // namespace natopt
