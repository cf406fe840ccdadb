/**
 * @file genetic_algorithm.cpp
 * @brief Implementation of the elitist genetic algorithm
 */

#include "optimizer/genetic_algorithm.hpp"
#include "optimizer/simplex.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace natopt
{
    namespace optimizer
    {

        void GeneticParameters::validate() const
        {
            if (!(mutation_rate >= 0.0 && mutation_rate <= 1.0))
            {
                throw std::invalid_argument(
                    "mutation_rate must be in [0, 1], got: " + std::to_string(mutation_rate));
            }

            if (!(mutation_sigma > 0.0) || !std::isfinite(mutation_sigma))
            {
                throw std::invalid_argument(
                    "mutation_sigma must be positive, got: " + std::to_string(mutation_sigma));
            }

            if (!(crossover_bias >= 0.0 && crossover_bias <= 1.0))
            {
                throw std::invalid_argument(
                    "crossover_bias must be in [0, 1], got: " + std::to_string(crossover_bias));
            }
        }

        GeneticParameters GeneticParameters::from_json(const nlohmann::json &j)
        {
            GeneticParameters params;
            params.mutation_rate = j.value("mutation_rate", params.mutation_rate);
            params.mutation_sigma = j.value("mutation_sigma", params.mutation_sigma);
            params.crossover_bias = j.value("crossover_bias", params.crossover_bias);

            params.validate();
            return params;
        }

        nlohmann::json GeneticParameters::to_json() const
        {
            return nlohmann::json{
                {"mutation_rate", mutation_rate},
                {"mutation_sigma", mutation_sigma},
                {"crossover_bias", crossover_bias}};
        }

        std::pair<Eigen::Index, Eigen::Index> select_parent_indices(RandomEngine &rng,
                                                                    Eigen::Index elite_count)
        {
            if (elite_count <= 0)
            {
                throw std::invalid_argument(
                    "Elite must contain at least one member, got: " + std::to_string(elite_count));
            }

            std::uniform_int_distribution<Eigen::Index> pick(0, elite_count - 1);
            Eigen::Index first = pick(rng);
            Eigen::Index second = pick(rng);
            return {first, second};
        }

        Eigen::VectorXd uniform_crossover(const Eigen::VectorXd &parent1,
                                          const Eigen::VectorXd &parent2,
                                          RandomEngine &rng,
                                          double bias)
        {
            if (parent1.size() != parent2.size())
            {
                throw std::invalid_argument(
                    "Parents differ in length: " + std::to_string(parent1.size()) +
                    " vs " + std::to_string(parent2.size()));
            }

            std::uniform_real_distribution<double> uniform(0.0, 1.0);
            Eigen::VectorXd child(parent1.size());
            for (Eigen::Index g = 0; g < child.size(); ++g)
            {
                child(g) = uniform(rng) < bias ? parent1(g) : parent2(g);
            }
            return child;
        }

        GeneticAlgorithm::GeneticAlgorithm(const GeneticParameters &params)
            : params_(params)
        {
            params_.validate();
        }

        nlohmann::json GeneticAlgorithm::get_parameters() const
        {
            nlohmann::json j = params_.to_json();
            j["type"] = "genetic";
            return j;
        }

        void GeneticAlgorithm::sort_population(Population &population)
        {
            std::vector<Eigen::Index> order = rank_by_fitness(population.fitness);

            Population sorted;
            sorted.positions.resize(population.size(), population.dimension());
            sorted.fitness.resize(population.size());
            for (size_t k = 0; k < order.size(); ++k)
            {
                Eigen::Index row = static_cast<Eigen::Index>(k);
                sorted.positions.row(row) = population.positions.row(order[k]);
                sorted.fitness(row) = population.fitness(order[k]);
            }

            population = std::move(sorted);
        }

        HeuristicResult GeneticAlgorithm::run_from(const SharpeObjective &objective,
                                                   Population population,
                                                   int generations,
                                                   RandomEngine &rng,
                                                   const GenerationObserver &observer) const
        {
            // Validate, evaluate and rank the initial population
            prepare(objective, population, generations);
            sort_population(population);

            const Eigen::Index size = population.size();
            const Eigen::Index dim = population.dimension();
            const Eigen::Index elite_count = size / 2;

            std::uniform_real_distribution<double> uniform(0.0, 1.0);
            std::normal_distribution<double> mutation(0.0, params_.mutation_sigma);

            Eigen::VectorXd best = population.positions.row(0).transpose();
            double best_fitness = population.fitness(0);

            std::vector<double> history;
            history.reserve(static_cast<size_t>(generations));

            Population next;
            next.positions.resize(size, dim);
            next.fitness.resize(size);

            for (int gen = 0; gen < generations; ++gen)
            {
                // Elite half survives unchanged
                next.positions.topRows(elite_count) = population.positions.topRows(elite_count);
                next.fitness.head(elite_count) = population.fitness.head(elite_count);

                // Remaining slots are filled with offspring of the elite
                for (Eigen::Index k = elite_count; k < size; ++k)
                {
                    std::pair<Eigen::Index, Eigen::Index> parents = select_parent_indices(rng, elite_count);

                    Eigen::VectorXd child = uniform_crossover(
                        population.positions.row(parents.first).transpose(),
                        population.positions.row(parents.second).transpose(),
                        rng, params_.crossover_bias);

                    // Gaussian mutation of every gene
                    if (uniform(rng) < params_.mutation_rate)
                    {
                        for (Eigen::Index g = 0; g < dim; ++g)
                        {
                            child(g) += mutation(rng);
                        }
                    }

                    child = project_to_simplex(child);
                    next.positions.row(k) = child.transpose();
                    next.fitness(k) = objective.fitness(child);
                }

                std::swap(population, next);
                sort_population(population);

                if (improves(population.fitness(0), best_fitness))
                {
                    best = population.positions.row(0).transpose();
                    best_fitness = population.fitness(0);
                }

                history.push_back(-best_fitness);

                if (observer)
                {
                    observer(gen, population, -best_fitness);
                }
            }

            return make_result(objective, best, std::move(history), generations);
        }

    } // namespace optimizer
} // namespace natopt
