/**
 * @file risk_model.cpp
 * @brief Shared parts of the RiskModel base class
 */

#include "risk/risk_model.hpp"
#include <stdexcept>

namespace natopt
{
    namespace risk
    {

        Eigen::VectorXd RiskModel::estimate_mean(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);
            return returns.colwise().mean().transpose();
        }

        MomentEstimate RiskModel::estimate(const Eigen::MatrixXd &returns) const
        {
            MomentEstimate moments;
            moments.covariance = estimate_covariance(returns);
            moments.mean = estimate_mean(returns);
            moments.periods = returns.rows();
            return moments;
        }

        void RiskModel::validate_returns(const Eigen::MatrixXd &returns)
        {
            if (returns.rows() == 0 || returns.cols() == 0)
            {
                throw std::invalid_argument("Returns matrix cannot be empty");
            }

            if (returns.rows() < 2)
            {
                throw std::invalid_argument(
                    "Moment estimation needs at least 2 return periods, got: " +
                    std::to_string(returns.rows()));
            }

            if (!returns.allFinite())
            {
                throw std::invalid_argument("Returns matrix contains NaN or Inf values");
            }
        }

        Eigen::MatrixXd RiskModel::covariance_to_correlation(const Eigen::MatrixXd &covariance)
        {
            if (covariance.rows() == 0 || covariance.rows() != covariance.cols())
            {
                throw std::runtime_error(
                    "Covariance matrix must be square and non-empty, got " +
                    std::to_string(covariance.rows()) + "x" + std::to_string(covariance.cols()));
            }

            Eigen::Index degenerate = 0;
            if (!(covariance.diagonal().minCoeff(&degenerate) > 0.0))
            {
                throw std::runtime_error(
                    "Asset " + std::to_string(degenerate) + " has non-positive variance " +
                    std::to_string(covariance(degenerate, degenerate)));
            }

            Eigen::VectorXd inv_vol = covariance.diagonal().cwiseSqrt().cwiseInverse();
            Eigen::MatrixXd correlation =
                (inv_vol.asDiagonal() * covariance * inv_vol.asDiagonal()).cwiseMax(-1.0).cwiseMin(1.0);
            correlation.diagonal().setOnes();
            return correlation;
        }

    } // namespace risk
} // namespace natopt
