/**
 * @file risk_model.hpp
 * @brief Estimation of the return moments the Sharpe objective consumes
 *
 * The metaheuristic engines never touch raw returns: they see a mean vector
 * and a covariance matrix estimated once per session. RiskModel is the seam
 * where that estimator is chosen.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace natopt
{
    namespace risk
    {

        /**
         * @struct MomentEstimate
         * @brief First and second moments of a return sample
         */
        struct MomentEstimate
        {
            Eigen::VectorXd mean;       ///< Per-asset mean return
            Eigen::MatrixXd covariance; ///< Exactly symmetric, N x N
            Eigen::Index periods = 0;   ///< Sample length the moments came from
        };

        /**
         * @class RiskModel
         * @brief Abstract base class for moment estimators
         *
         * Usage Example:
         * @code
         * SampleCovariance estimator(true);
         * MomentEstimate moments = estimator.estimate(returns.values());
         * SharpeObjective objective(moments.mean, moments.covariance);
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Covariance of the asset columns
             * @param returns Returns (rows = periods, cols = assets)
             * @return Exactly symmetric N x N matrix; may be singular when
             *         assets outnumber periods
             * @throws std::invalid_argument if returns is empty, has fewer
             *         than 2 periods or contains NaN/Inf
             */
            virtual Eigen::MatrixXd estimate_covariance(const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Arithmetic mean of every asset column
             * @throws std::invalid_argument under the same conditions as
             *         estimate_covariance
             */
            virtual Eigen::VectorXd estimate_mean(const Eigen::MatrixXd &returns) const;

            /**
             * @brief Mean and covariance in one pass over the validation
             */
            MomentEstimate estimate(const Eigen::MatrixXd &returns) const;

            virtual std::string get_name() const = 0;

            /**
             * @brief D^-1 * Sigma * D^-1 with D = diag(sqrt(Sigma_ii)),
             *        off-diagonal entries clamped to [-1, 1]
             * @throws std::runtime_error if Sigma is not square or a variance
             *         is not positive
             */
            static Eigen::MatrixXd covariance_to_correlation(const Eigen::MatrixXd &covariance);

        protected:
            /**
             * @throws std::invalid_argument if returns cannot be estimated from
             */
            static void validate_returns(const Eigen::MatrixXd &returns);
        };

    } // namespace risk
} // namespace natopt
