/**
 * @file sharpe_objective.hpp
 * @brief Minimization-oriented Sharpe ratio objective
 *
 * All engines minimize
 *
 *     F(w) = -(w^T mu - r_f) / sqrt(w^T Sigma w)
 *
 * so a lower fitness is a higher Sharpe ratio. Reported results negate it
 * back.
 */

#pragma once

#include <Eigen/Dense>

namespace natopt
{
    namespace risk
    {
        class RiskModel;
    }

    namespace optimizer
    {

        /**
         * @brief Raw negative Sharpe ratio
         *
         * No guards: a zero variance divides by zero and a negative one
         * (possible with an indefinite covariance) takes the square root of
         * a negative number, both yielding a non-finite result. Weights need
         * not lie on the simplex.
         *
         * @param weights Portfolio weights (N)
         * @param mean Mean returns (N)
         * @param covariance Covariance matrix (N x N)
         */
        double sharpe_fitness(const Eigen::VectorXd &weights,
                              const Eigen::VectorXd &mean,
                              const Eigen::MatrixXd &covariance);

        /**
         * @class SharpeObjective
         * @brief Mean vector and covariance shared read-only by every engine
         *
         * Dimensions and finiteness are checked once at construction; the
         * per-candidate calls only check the weight length.
         *
         * Degenerate portfolios: when w^T Sigma w is not strictly positive
         * (or not finite) fitness() returns quiet NaN. Engines compare
         * fitness with < and <=, which are false for NaN, so such
         * candidates are never accepted.
         *
         * Usage Example:
         * @code
         * auto objective = SharpeObjective::from_returns(returns.values());
         * double f = objective.fitness(weights);
         * @endcode
         *
         * Thread Safety: Immutable after construction
         */
        class SharpeObjective
        {
        public:
            /**
             * @brief Construct from precomputed moments
             * @param mean Mean returns (N)
             * @param covariance Covariance matrix (N x N), symmetric
             * @param risk_free_rate Per-period rate subtracted from return
             * @throws std::invalid_argument on empty input, dimension
             *         mismatch, NaN/Inf entries or an asymmetric covariance
             */
            SharpeObjective(const Eigen::VectorXd &mean,
                            const Eigen::MatrixXd &covariance,
                            double risk_free_rate = 0.0);

            /**
             * @brief Derive mean and covariance from a return matrix
             * @param returns Returns (T x N) without missing values
             * @param risk_model Covariance estimator
             * @param risk_free_rate Per-period rate subtracted from return
             */
            static SharpeObjective from_returns(const Eigen::MatrixXd &returns,
                                                const risk::RiskModel &risk_model,
                                                double risk_free_rate = 0.0);

            /**
             * @brief Same as above with a bias-corrected sample covariance
             */
            static SharpeObjective from_returns(const Eigen::MatrixXd &returns,
                                                double risk_free_rate = 0.0);

            /**
             * @brief Negative Sharpe ratio, NaN for degenerate variance
             * @throws std::invalid_argument if weights has the wrong length
             */
            double fitness(const Eigen::VectorXd &weights) const;

            double sharpe_ratio(const Eigen::VectorXd &weights) const
            {
                return -fitness(weights);
            }

            double expected_return(const Eigen::VectorXd &weights) const;
            double volatility(const Eigen::VectorXd &weights) const;

            /**
             * @brief Smallest covariance eigenvalue
             *
             * Non-positive values flag a singular or indefinite covariance
             * for which some candidates evaluate to NaN.
             */
            double min_eigenvalue() const;

            Eigen::Index num_assets() const { return mean_.size(); }
            const Eigen::VectorXd &mean() const { return mean_; }
            const Eigen::MatrixXd &covariance() const { return covariance_; }
            double risk_free_rate() const { return risk_free_rate_; }

        private:
            void check_weights(const Eigen::VectorXd &weights) const;

            Eigen::VectorXd mean_;
            Eigen::MatrixXd covariance_;
            double risk_free_rate_;
        };

    } // namespace optimizer
} // namespace natopt
