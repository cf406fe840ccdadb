/**
 * @file bat_algorithm.cpp
 * @brief Implementation of the bat algorithm
 */

#include "optimizer/bat_algorithm.hpp"
#include "optimizer/simplex.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace natopt
{
    namespace optimizer
    {

        void BatParameters::validate() const
        {
            if (!std::isfinite(freq_min) || !std::isfinite(freq_max) || freq_min > freq_max)
            {
                throw std::invalid_argument(
                    "Invalid frequency range [" + std::to_string(freq_min) + ", " +
                    std::to_string(freq_max) + "]");
            }

            if (!(local_walk_sigma >= 0.0) || !std::isfinite(local_walk_sigma))
            {
                throw std::invalid_argument(
                    "local_walk_sigma must be non-negative, got: " +
                    std::to_string(local_walk_sigma));
            }

            if (!(loudness_decay > 0.0 && loudness_decay <= 1.0))
            {
                throw std::invalid_argument(
                    "loudness_decay must be in (0, 1], got: " +
                    std::to_string(loudness_decay));
            }

            if (!(pulse_rate_gamma >= 0.0) || !std::isfinite(pulse_rate_gamma))
            {
                throw std::invalid_argument(
                    "pulse_rate_gamma must be non-negative, got: " +
                    std::to_string(pulse_rate_gamma));
            }
        }

        BatParameters BatParameters::from_json(const nlohmann::json &j)
        {
            BatParameters params;
            params.freq_min = j.value("freq_min", params.freq_min);
            params.freq_max = j.value("freq_max", params.freq_max);
            params.local_walk_sigma = j.value("local_walk_sigma", params.local_walk_sigma);
            params.loudness_decay = j.value("loudness_decay", params.loudness_decay);
            params.pulse_rate_gamma = j.value("pulse_rate_gamma", params.pulse_rate_gamma);

            params.validate();
            return params;
        }

        nlohmann::json BatParameters::to_json() const
        {
            return nlohmann::json{
                {"freq_min", freq_min},
                {"freq_max", freq_max},
                {"local_walk_sigma", local_walk_sigma},
                {"loudness_decay", loudness_decay},
                {"pulse_rate_gamma", pulse_rate_gamma}};
        }

        BatAlgorithm::BatAlgorithm(const BatParameters &params)
            : params_(params)
        {
            params_.validate();
        }

        nlohmann::json BatAlgorithm::get_parameters() const
        {
            nlohmann::json j = params_.to_json();
            j["type"] = "bat";
            return j;
        }

        HeuristicResult BatAlgorithm::run_from(const SharpeObjective &objective,
                                               Population population,
                                               int generations,
                                               RandomEngine &rng,
                                               const GenerationObserver &observer) const
        {
            // Validate, project initial rows and evaluate them
            prepare(objective, population, generations);

            const Eigen::Index n = population.size();
            const Eigen::Index dim = population.dimension();

            std::uniform_real_distribution<double> uniform(0.0, 1.0);
            std::normal_distribution<double> walk(0.0, 1.0);

            // Loudness and pulse rate start uniform in [0, 1)
            Eigen::VectorXd loudness(n);
            Eigen::VectorXd pulse_rate(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                loudness(i) = uniform(rng);
            }
            for (Eigen::Index i = 0; i < n; ++i)
            {
                pulse_rate(i) = uniform(rng);
            }

            Eigen::MatrixXd velocity = Eigen::MatrixXd::Zero(n, dim);

            Eigen::Index best_idx = best_index(population.fitness);
            Eigen::VectorXd best = population.positions.row(best_idx).transpose();
            double best_fitness = population.fitness(best_idx);

            std::vector<double> history;
            history.reserve(static_cast<size_t>(generations));

            Eigen::VectorXd candidate(dim);
            Eigen::VectorXd noise(dim);

            for (int t = 0; t < generations; ++t)
            {
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    // Global move: frequency-scaled pull relative to the best bat
                    double frequency = params_.freq_min +
                                       (params_.freq_max - params_.freq_min) * uniform(rng);

                    velocity.row(i) += (population.positions.row(i) - best.transpose()) * frequency;
                    candidate = project_to_simplex(
                        (population.positions.row(i) + velocity.row(i)).transpose());

                    // Local walk around the best with probability 1 - pulse rate
                    if (uniform(rng) > pulse_rate(i))
                    {
                        for (Eigen::Index d = 0; d < dim; ++d)
                        {
                            noise(d) = params_.local_walk_sigma * walk(rng);
                        }
                        candidate = project_to_simplex(best + noise);
                    }

                    double candidate_fitness = objective.fitness(candidate);

                    // Loudness is only drawn once the fitness test has passed
                    if (improves_or_ties(candidate_fitness, population.fitness(i)) &&
                        uniform(rng) < loudness(i))
                    {
                        population.positions.row(i) = candidate.transpose();
                        population.fitness(i) = candidate_fitness;
                        // Accepted bats get quieter; pulse rate scales by 1 - exp(-gamma t)
                        loudness(i) *= params_.loudness_decay;
                        pulse_rate(i) *= 1.0 - std::exp(-params_.pulse_rate_gamma * t);

                        if (improves_or_ties(candidate_fitness, best_fitness))
                        {
                            best = candidate;
                            best_fitness = candidate_fitness;
                        }
                    }
                }

                // Record best-so-far Sharpe ratio for this generation
                history.push_back(-best_fitness);

                if (observer)
                {
                    observer(t, population, -best_fitness);
                }
            }

            return make_result(objective, best, std::move(history), generations);
        }

    } // namespace optimizer
} // namespace natopt
