/**
 * @file genetic_algorithm.hpp
 * @brief Elitist genetic algorithm portfolio optimizer
 *
 * Per generation the population is ranked by fitness and the best
 * floor(P/2) members survive unchanged (the elite). The remaining slots are
 * filled with offspring:
 *
 * - two parents drawn independently and uniformly from the elite
 *   (a member may be paired with itself),
 * - uniform crossover: each gene comes from parent 1 with probability
 *   crossover_bias, otherwise from parent 2,
 * - with probability mutation_rate the whole child is perturbed by
 *   N(0, mutation_sigma^2) per gene,
 * - the child is projected back onto the simplex.
 */

#pragma once

#include "optimizer/metaheuristic_optimizer.hpp"
#include <utility>

namespace natopt
{
    namespace optimizer
    {

        /**
         * @struct GeneticParameters
         * @brief Mutation and crossover settings
         */
        struct GeneticParameters
        {
            double mutation_rate = 0.1;  ///< Probability that a child is mutated
            double mutation_sigma = 0.1; ///< Std. dev. of the Gaussian mutation
            double crossover_bias = 0.5; ///< Probability a gene comes from parent 1

            /**
             * @throws std::invalid_argument if a value is out of range
             */
            void validate() const;

            static GeneticParameters from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @brief Draw two parent indices uniformly from [0, elite_count)
         *
         * The draws are independent, so both indices may be equal. With
         * elite_count == 1 both are always 0.
         *
         * @throws std::invalid_argument if elite_count <= 0
         */
        std::pair<Eigen::Index, Eigen::Index> select_parent_indices(RandomEngine &rng,
                                                                    Eigen::Index elite_count);

        /**
         * @brief Per-gene uniform crossover
         * @param parent1 Gene source when the mask draw is below bias
         * @param parent2 Gene source otherwise
         * @param rng Random engine
         * @param bias Probability of taking a gene from parent1
         * @throws std::invalid_argument if the parents differ in length
         */
        Eigen::VectorXd uniform_crossover(const Eigen::VectorXd &parent1,
                                          const Eigen::VectorXd &parent2,
                                          RandomEngine &rng,
                                          double bias = 0.5);

        /**
         * @class GeneticAlgorithm
         * @brief Genetic algorithm over the probability simplex
         *
         * The population size stays fixed: each generation produces
         * P - floor(P/2) offspring. Ranking uses a stable sort, so members
         * with equal fitness keep their previous order.
         */
        class GeneticAlgorithm : public MetaheuristicOptimizer
        {
        public:
            /**
             * @throws std::invalid_argument if parameters are invalid
             */
            explicit GeneticAlgorithm(const GeneticParameters &params = GeneticParameters());

            HeuristicResult run_from(const SharpeObjective &objective,
                                     Population initial,
                                     int generations,
                                     RandomEngine &rng,
                                     const GenerationObserver &observer = GenerationObserver()) const override;

            std::string get_name() const override { return "GeneticAlgorithm"; }
            nlohmann::json get_parameters() const override;

            /**
             * @brief Two members are needed for a non-empty elite
             */
            Eigen::Index min_population_size() const override { return 2; }

            const GeneticParameters &parameters() const { return params_; }

        private:
            /**
             * @brief Reorder rows best first
             */
            static void sort_population(Population &population);

            GeneticParameters params_;
        };

    } // namespace optimizer
} // namespace natopt
