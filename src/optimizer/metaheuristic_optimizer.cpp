/**
 * @file metaheuristic_optimizer.cpp
 * @brief Shared run contract of the population-based engines
 */

#include "optimizer/metaheuristic_optimizer.hpp"
#include "optimizer/simplex.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace natopt
{
    namespace optimizer
    {

        // ============================================================================
        // Population
        // ============================================================================

        bool Population::is_feasible(double tolerance) const
        {
            for (Eigen::Index i = 0; i < positions.rows(); ++i)
            {
                if (!is_on_simplex(positions.row(i).transpose(), tolerance))
                {
                    return false;
                }
            }
            return true;
        }

        // ============================================================================
        // HeuristicResult
        // ============================================================================

        HeuristicResult::HeuristicResult()
            : sharpe_ratio(std::numeric_limits<double>::quiet_NaN()),
              fitness(std::numeric_limits<double>::quiet_NaN()),
              expected_return(0.0),
              volatility(0.0),
              generations(0)
        {
        }

        bool HeuristicResult::is_valid() const
        {
            if (weights.size() == 0)
                return false;
            if (!std::isfinite(sharpe_ratio))
                return false;
            if (!is_on_simplex(weights, 1e-6))
                return false;

            return true;
        }

        void HeuristicResult::print_summary() const
        {
            std::cout << "\n=== " << engine << " ===\n";
            std::cout << "Status: " << (is_valid() ? "VALID" : "DEGENERATE") << "\n";
            std::cout << "Generations: " << generations << "\n";
            std::cout << std::string(50, '-') << "\n";

            std::cout << "  Sharpe Ratio:     " << std::fixed << std::setprecision(4)
                      << sharpe_ratio << "\n";
            std::cout << "  Expected Return:  " << expected_return * 100 << "%\n";
            std::cout << "  Volatility:       " << volatility * 100 << "%\n";

            if (weights.size() > 0)
            {
                int non_zero = 0;
                for (Eigen::Index i = 0; i < weights.size(); ++i)
                {
                    if (weights(i) > 1e-6)
                    {
                        ++non_zero;
                    }
                }
                std::cout << "  Max weight:       " << weights.maxCoeff() << "\n";
                std::cout << "  Non-zero positions: " << non_zero << "/" << weights.size() << "\n";
            }

            if (!history.empty())
            {
                std::cout << "  Convergence:      " << history.front() << " -> "
                          << history.back() << "\n";
            }

            std::cout << std::string(50, '=') << "\n";
        }

        nlohmann::json HeuristicResult::to_json() const
        {
            std::vector<double> w(weights.data(), weights.data() + weights.size());

            // nlohmann::json serializes NaN as null
            return nlohmann::json{
                {"engine", engine},
                {"sharpe_ratio", sharpe_ratio},
                {"fitness", fitness},
                {"expected_return", expected_return},
                {"volatility", volatility},
                {"generations", generations},
                {"weights", w},
                {"history", history}};
        }

        // ============================================================================
        // MetaheuristicOptimizer
        // ============================================================================

        HeuristicResult MetaheuristicOptimizer::run(const SharpeObjective &objective,
                                                    int population_size,
                                                    int generations,
                                                    RandomEngine &rng,
                                                    const GenerationObserver &observer) const
        {
            if (population_size < min_population_size())
            {
                throw std::invalid_argument(
                    get_name() + " requires a population of at least " +
                    std::to_string(min_population_size()) + ", got: " +
                    std::to_string(population_size));
            }

            Population initial;
            initial.positions = sample_dirichlet(population_size, objective.num_assets(), rng);
            return run_from(objective, std::move(initial), generations, rng, observer);
        }

        bool MetaheuristicOptimizer::fitness_less(double a, double b)
        {
            if (std::isnan(a))
                return false;
            if (std::isnan(b))
                return true;
            return a < b;
        }

        Eigen::Index MetaheuristicOptimizer::best_index(const Eigen::VectorXd &fitness)
        {
            if (fitness.size() == 0)
            {
                throw std::invalid_argument("Cannot select the best member of an empty population");
            }

            Eigen::Index best = 0;
            for (Eigen::Index i = 1; i < fitness.size(); ++i)
            {
                if (fitness_less(fitness(i), fitness(best)))
                {
                    best = i;
                }
            }
            return best;
        }

        std::vector<Eigen::Index> MetaheuristicOptimizer::rank_by_fitness(const Eigen::VectorXd &fitness)
        {
            std::vector<Eigen::Index> order(static_cast<size_t>(fitness.size()));
            std::iota(order.begin(), order.end(), Eigen::Index(0));
            std::stable_sort(order.begin(), order.end(),
                             [&fitness](Eigen::Index a, Eigen::Index b)
                             { return fitness_less(fitness(a), fitness(b)); });
            return order;
        }

        void MetaheuristicOptimizer::prepare(const SharpeObjective &objective,
                                             Population &population,
                                             int generations) const
        {
            if (generations < 0)
            {
                throw std::invalid_argument(
                    "Number of generations must be non-negative, got: " +
                    std::to_string(generations));
            }

            if (population.size() < min_population_size())
            {
                throw std::invalid_argument(
                    get_name() + " requires a population of at least " +
                    std::to_string(min_population_size()) + ", got: " +
                    std::to_string(population.size()));
            }

            if (population.dimension() != objective.num_assets())
            {
                throw std::invalid_argument(
                    "Population dimension (" + std::to_string(population.dimension()) +
                    ") does not match number of assets (" +
                    std::to_string(objective.num_assets()) + ")");
            }

            for (Eigen::Index i = 0; i < population.size(); ++i)
            {
                population.positions.row(i) =
                    project_to_simplex(population.positions.row(i).transpose()).transpose();
            }

            evaluate(objective, population);
        }

        void MetaheuristicOptimizer::evaluate(const SharpeObjective &objective, Population &population)
        {
            population.fitness.resize(population.size());
            for (Eigen::Index i = 0; i < population.size(); ++i)
            {
                population.fitness(i) = objective.fitness(population.positions.row(i).transpose());
            }
        }

        bool MetaheuristicOptimizer::improves(double candidate, double incumbent)
        {
            if (std::isnan(incumbent))
                return !std::isnan(candidate);
            return candidate < incumbent;
        }

        bool MetaheuristicOptimizer::improves_or_ties(double candidate, double incumbent)
        {
            if (std::isnan(incumbent))
                return !std::isnan(candidate);
            return candidate <= incumbent;
        }

        HeuristicResult MetaheuristicOptimizer::make_result(const SharpeObjective &objective,
                                                            const Eigen::VectorXd &best_weights,
                                                            std::vector<double> history,
                                                            int generations) const
        {
            HeuristicResult result;
            result.engine = get_name();
            result.weights = best_weights;
            result.fitness = objective.fitness(best_weights);
            result.sharpe_ratio = -result.fitness;
            result.expected_return = objective.expected_return(best_weights);
            result.volatility = objective.volatility(best_weights);
            result.history = std::move(history);
            result.generations = generations;
            return result;
        }

    } // namespace optimizer
} // namespace natopt
