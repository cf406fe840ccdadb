/**
 * @file metaheuristic_optimizer.hpp
 * @brief Abstract interface for population-based Sharpe ratio optimizers
 *
 * Every engine searches the probability simplex for the weight vector with
 * the lowest SharpeObjective fitness and reports its result through the
 * same HeuristicResult contract:
 *
 * - a feasible initial population (Dirichlet(1) samples or supplied rows),
 * - exactly `generations` iterations of the engine rule,
 * - every candidate projected back onto the simplex after each move,
 * - one best-so-far Sharpe ratio appended to the history per generation.
 *
 * Engines are immutable configuration objects. All population state lives
 * inside a single run() call and all randomness comes from the RandomEngine
 * passed in, so a fixed seed reproduces a run exactly.
 */

#pragma once

#include "optimizer/random_source.hpp"
#include "optimizer/sharpe_objective.hpp"
#include <Eigen/Dense>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace natopt
{
    namespace optimizer
    {

        /**
         * @struct Population
         * @brief Candidate weight vectors (one per row) and their fitness
         */
        struct Population
        {
            Eigen::MatrixXd positions; ///< size() x dimension()
            Eigen::VectorXd fitness;   ///< Fitness of each row, NaN if degenerate

            Eigen::Index size() const { return positions.rows(); }
            Eigen::Index dimension() const { return positions.cols(); }

            /**
             * @brief Check that every row lies on the simplex
             */
            bool is_feasible(double tolerance = 1e-9) const;
        };

        /**
         * @struct HeuristicResult
         * @brief Outcome of one engine run
         */
        struct HeuristicResult
        {
            Eigen::VectorXd weights;     ///< Best weights found
            double sharpe_ratio;         ///< Sharpe ratio of weights (positive oriented)
            double fitness;              ///< Objective value of weights (= -sharpe_ratio)
            double expected_return;      ///< Per-period portfolio return
            double volatility;           ///< Per-period portfolio volatility
            std::vector<double> history; ///< Best-so-far Sharpe ratio per generation
            int generations;             ///< Generations executed
            std::string engine;          ///< Engine name

            HeuristicResult();

            /**
             * @brief True when weights are feasible and the ratio is finite
             */
            bool is_valid() const;

            void print_summary() const;

            nlohmann::json to_json() const;
        };

        /**
         * @brief Callback invoked after every completed generation
         *
         * Arguments: zero-based generation index, the population after the
         * generation, and the best-so-far Sharpe ratio.
         */
        using GenerationObserver =
            std::function<void(int generation, const Population &population, double best_sharpe)>;

        /**
         * @class MetaheuristicOptimizer
         * @brief Abstract base class for the nature-inspired engines
         *
         * Usage Example:
         * @code
         * BatAlgorithm bat;
         * RandomEngine rng(42);
         * auto result = bat.run(objective, 30, 100, rng);
         * result.print_summary();
         * @endcode
         *
         * Thread Safety: run() is const; distinct runs with distinct random
         * engines may execute concurrently on the same instance.
         */
        class MetaheuristicOptimizer
        {
        public:
            virtual ~MetaheuristicOptimizer() = default;

            /**
             * @brief Optimize from a Dirichlet(1) initial population
             * @param objective Fitness function (shared, read-only)
             * @param population_size Number of candidates
             * @param generations Number of generations (>= 0)
             * @param rng Random engine consumed by this run
             * @param observer Optional per-generation callback
             * @return Best weights, Sharpe ratio and convergence history
             * @throws std::invalid_argument if population_size is below
             *         min_population_size() or generations is negative
             */
            HeuristicResult run(const SharpeObjective &objective,
                                int population_size,
                                int generations,
                                RandomEngine &rng,
                                const GenerationObserver &observer = GenerationObserver()) const;

            /**
             * @brief Optimize from a caller-supplied initial population
             *
             * Rows are projected onto the simplex and re-evaluated before the
             * first generation; any supplied fitness values are ignored.
             *
             * @throws std::invalid_argument if the population is too small,
             *         its dimension does not match the objective or
             *         generations is negative
             */
            virtual HeuristicResult run_from(const SharpeObjective &objective,
                                             Population initial,
                                             int generations,
                                             RandomEngine &rng,
                                             const GenerationObserver &observer = GenerationObserver()) const = 0;

            /**
             * @brief Get engine name
             */
            virtual std::string get_name() const = 0;

            /**
             * @brief Get engine parameters as JSON
             */
            virtual nlohmann::json get_parameters() const = 0;

            /**
             * @brief Smallest population the engine rule can work with
             */
            virtual Eigen::Index min_population_size() const { return 1; }

            /**
             * @brief Strict weak ordering on fitness with NaN last
             */
            static bool fitness_less(double a, double b);

            /**
             * @brief Index of the lowest finite fitness
             *
             * Ties resolve to the lowest index. Returns 0 when every entry
             * is NaN.
             * @throws std::invalid_argument if fitness is empty
             */
            static Eigen::Index best_index(const Eigen::VectorXd &fitness);

            /**
             * @brief Member indices ordered best first
             *
             * Stable: members with equal fitness keep their relative order.
             * NaN entries are placed last.
             */
            static std::vector<Eigen::Index> rank_by_fitness(const Eigen::VectorXd &fitness);

            /**
             * @brief candidate < incumbent, where a NaN incumbent loses to
             *        any finite candidate and a NaN candidate never wins
             */
            static bool improves(double candidate, double incumbent);

            /**
             * @brief candidate <= incumbent with the same NaN handling
             */
            static bool improves_or_ties(double candidate, double incumbent);

        protected:
            /**
             * @brief Validate arguments, project rows and evaluate fitness
             */
            void prepare(const SharpeObjective &objective,
                         Population &population,
                         int generations) const;

            /**
             * @brief Recompute fitness for every row
             */
            static void evaluate(const SharpeObjective &objective, Population &population);

            /**
             * @brief Assemble the result for the best weights of a run
             */
            HeuristicResult make_result(const SharpeObjective &objective,
                                        const Eigen::VectorXd &best_weights,
                                        std::vector<double> history,
                                        int generations) const;
        };

    } // namespace optimizer
} // namespace natopt
