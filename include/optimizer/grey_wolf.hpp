/**
 * @file grey_wolf.hpp
 * @brief Grey wolf optimizer for portfolio weights
 *
 * The three fittest wolves (alpha, beta, delta) lead the hunt. With
 * a = a0 * (1 - t / T) decreasing linearly to zero, every wolf x moves
 * towards each leader L:
 *
 *     A = a * (2 * U - 1),  C = 2 * U          (per dimension)
 *     D = |C * L - x|
 *     X_L = L - A * D
 *
 * and takes the projected mean of X_alpha, X_beta and X_delta. Leaders are
 * frozen while the pack moves and re-selected afterwards.
 *
 * Reference: Mirjalili, S., Mirjalili, S. M., Lewis, A. (2014),
 * "Grey Wolf Optimizer".
 */

#pragma once

#include "optimizer/metaheuristic_optimizer.hpp"
#include <array>

namespace natopt
{
    namespace optimizer
    {

        /**
         * @struct GreyWolfParameters
         * @brief Exploration schedule
         */
        struct GreyWolfParameters
        {
            double a_initial = 2.0; ///< Value of a at the first generation

            /**
             * @throws std::invalid_argument if a_initial is negative or not finite
             */
            void validate() const;

            static GreyWolfParameters from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * @brief Indices of the alpha, beta and delta wolves
         *
         * Ranking is stable with NaN last, so equal fitness keeps the lower
         * index first.
         *
         * @throws std::invalid_argument if fewer than three wolves
         */
        std::array<Eigen::Index, 3> select_leaders(const Eigen::VectorXd &fitness);

        /**
         * @class GreyWolf
         * @brief Grey wolf optimization over the probability simplex
         *
         * The pack update is synchronous. The reported best is tracked
         * across the whole run, so it never regresses when a new alpha is
         * worse than an earlier one.
         */
        class GreyWolf : public MetaheuristicOptimizer
        {
        public:
            explicit GreyWolf(const GreyWolfParameters &params = GreyWolfParameters());

            HeuristicResult run_from(const SharpeObjective &objective,
                                     Population initial,
                                     int generations,
                                     RandomEngine &rng,
                                     const GenerationObserver &observer = GenerationObserver()) const override;

            std::string get_name() const override { return "GreyWolf"; }
            nlohmann::json get_parameters() const override;

            Eigen::Index min_population_size() const override { return 3; }

            const GreyWolfParameters &parameters() const { return params_; }

        private:
            GreyWolfParameters params_;
        };

    } // namespace optimizer
} // namespace natopt
