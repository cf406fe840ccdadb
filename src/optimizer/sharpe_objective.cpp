/**
 * @file sharpe_objective.cpp
 * @brief Implementation of the Sharpe ratio objective
 */

#include "optimizer/sharpe_objective.hpp"
#include "risk/sample_covariance.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace natopt
{
    namespace optimizer
    {

        double sharpe_fitness(const Eigen::VectorXd &weights,
                              const Eigen::VectorXd &mean,
                              const Eigen::MatrixXd &covariance)
        {
            double portfolio_return = weights.dot(mean);
            double portfolio_std = std::sqrt(weights.dot(covariance * weights));
            return -portfolio_return / portfolio_std;
        }

        SharpeObjective::SharpeObjective(const Eigen::VectorXd &mean,
                                         const Eigen::MatrixXd &covariance,
                                         double risk_free_rate)
            : mean_(mean), covariance_(covariance), risk_free_rate_(risk_free_rate)
        {
            if (mean_.size() == 0)
            {
                throw std::invalid_argument("Mean return vector is empty");
            }

            if (covariance_.rows() != mean_.size() || covariance_.cols() != mean_.size())
            {
                throw std::invalid_argument(
                    "Dimension mismatch: mean return size (" +
                    std::to_string(mean_.size()) +
                    ") does not match covariance dimensions (" +
                    std::to_string(covariance_.rows()) + "x" +
                    std::to_string(covariance_.cols()) + ")");
            }

            if (!mean_.allFinite())
            {
                throw std::invalid_argument("Mean returns contain NaN or Inf values");
            }

            if (!covariance_.allFinite())
            {
                throw std::invalid_argument("Covariance matrix contains NaN or Inf values");
            }

            if (!std::isfinite(risk_free_rate_))
            {
                throw std::invalid_argument("Risk-free rate must be finite");
            }

            double asymmetry = (covariance_ - covariance_.transpose()).cwiseAbs().maxCoeff();
            if (asymmetry > 1e-8)
            {
                throw std::invalid_argument(
                    "Covariance matrix is not symmetric (max asymmetry: " +
                    std::to_string(asymmetry) + ")");
            }
        }

        SharpeObjective SharpeObjective::from_returns(const Eigen::MatrixXd &returns,
                                                      const risk::RiskModel &risk_model,
                                                      double risk_free_rate)
        {
            risk::MomentEstimate moments = risk_model.estimate(returns);
            return SharpeObjective(moments.mean, moments.covariance, risk_free_rate);
        }

        SharpeObjective SharpeObjective::from_returns(const Eigen::MatrixXd &returns,
                                                      double risk_free_rate)
        {
            risk::SampleCovariance sample(true);
            return from_returns(returns, sample, risk_free_rate);
        }

        double SharpeObjective::fitness(const Eigen::VectorXd &weights) const
        {
            check_weights(weights);

            double variance = weights.dot(covariance_ * weights);
            if (!(variance > 0.0) || !std::isfinite(variance))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            return -(weights.dot(mean_) - risk_free_rate_) / std::sqrt(variance);
        }

        double SharpeObjective::expected_return(const Eigen::VectorXd &weights) const
        {
            check_weights(weights);
            return weights.dot(mean_);
        }

        double SharpeObjective::volatility(const Eigen::VectorXd &weights) const
        {
            check_weights(weights);
            return std::sqrt(weights.dot(covariance_ * weights));
        }

        double SharpeObjective::min_eigenvalue() const
        {
            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance_, Eigen::EigenvaluesOnly);
            return solver.eigenvalues().minCoeff();
        }

        void SharpeObjective::check_weights(const Eigen::VectorXd &weights) const
        {
            if (weights.size() != mean_.size())
            {
                throw std::invalid_argument(
                    "Weight vector has " + std::to_string(weights.size()) +
                    " entries, expected " + std::to_string(mean_.size()));
            }
        }

    } // namespace optimizer
} // namespace natopt
