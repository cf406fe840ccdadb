/**
 * @file sample_covariance.cpp
 * @brief Implementation of the sample covariance estimator
 */

#include "risk/sample_covariance.hpp"

namespace natopt
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction)
            : bias_correction_(bias_correction)
        {
        }

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            const Eigen::Index periods = returns.rows();
            const Eigen::Index assets = returns.cols();

            Eigen::MatrixXd centered = returns.rowwise() - returns.colwise().mean();

            // Only the lower triangle is accumulated; the copy mirrors it
            Eigen::MatrixXd scatter = Eigen::MatrixXd::Zero(assets, assets);
            scatter.selfadjointView<Eigen::Lower>().rankUpdate(centered.transpose());

            const double divisor = static_cast<double>(bias_correction_ ? periods - 1 : periods);
            Eigen::MatrixXd covariance = scatter.selfadjointView<Eigen::Lower>();
            return covariance / divisor;
        }

    } // namespace risk
} // namespace natopt
