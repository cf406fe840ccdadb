/**
 * @file bat_algorithm.hpp
 * @brief Bat algorithm (echolocation-inspired) portfolio optimizer
 *
 * Each bat carries a position, a velocity, a loudness A and a pulse rate r.
 * Per generation t and bat i:
 *
 *     f   = f_min + (f_max - f_min) * U
 *     v_i = v_i + (x_i - best) * f
 *     S   = project(x_i + v_i)
 *     if U > r_i:  S = project(best + N(0, sigma^2))     (local walk)
 *
 * S replaces x_i when F(S) <= F(x_i) and U < A_i; an accepted move lowers
 * the loudness (A_i *= alpha) and the pulse rate
 * (r_i *= 1 - exp(-gamma * t)).
 *
 * Reference: Yang, X.-S. (2010), "A New Metaheuristic Bat-Inspired
 * Algorithm".
 */

#pragma once

#include "optimizer/metaheuristic_optimizer.hpp"

namespace natopt
{
    namespace optimizer
    {

        /**
         * @struct BatParameters
         * @brief Frequency range, local walk width and decay constants
         */
        struct BatParameters
        {
            double freq_min = 0.0;         ///< Lower frequency bound
            double freq_max = 5.0;         ///< Upper frequency bound
            double local_walk_sigma = 0.05; ///< Std. dev. of the walk around the best
            double loudness_decay = 0.95;  ///< alpha, applied on acceptance
            double pulse_rate_gamma = 0.1; ///< gamma in r *= 1 - exp(-gamma * t)

            /**
             * @throws std::invalid_argument if a value is out of range
             */
            void validate() const;

            static BatParameters from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @class BatAlgorithm
         * @brief Bat algorithm over the probability simplex
         *
         * Ties are accepted: a candidate equal to the incumbent fitness
         * passes the F(S) <= F(x_i) test, and the global best is replaced
         * on F(S) <= F(best).
         */
        class BatAlgorithm : public MetaheuristicOptimizer
        {
        public:
            /**
             * @throws std::invalid_argument if parameters are invalid
             */
            explicit BatAlgorithm(const BatParameters &params = BatParameters());

            HeuristicResult run_from(const SharpeObjective &objective,
                                     Population initial,
                                     int generations,
                                     RandomEngine &rng,
                                     const GenerationObserver &observer = GenerationObserver()) const override;

            std::string get_name() const override { return "BatAlgorithm"; }
            nlohmann::json get_parameters() const override;

            const BatParameters &parameters() const { return params_; }

        private:
            BatParameters params_;
        };

    } // namespace optimizer
} // namespace natopt
