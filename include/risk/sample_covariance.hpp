/**
 * @file sample_covariance.hpp
 * @brief Classical sample covariance estimator
 *
 *     Cov = (X - mean(X))^T (X - mean(X)) / (T - 1)
 *
 * With bias correction (the default) the result matches pandas
 * DataFrame.cov(), the estimator the Sharpe objective is calibrated on.
 */

#pragma once

#include "risk/risk_model.hpp"

namespace natopt
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Sample covariance with optional Bessel's correction
         *
         * Positive semi-definite up to rounding; singular when assets
         * outnumber periods or two assets are collinear.
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /**
             * @param bias_correction Divide by T-1 instead of T
             */
            explicit SampleCovariance(bool bias_correction = true);

            Eigen::MatrixXd estimate_covariance(const Eigen::MatrixXd &returns) const override;

            std::string get_name() const override { return "SampleCovariance"; }

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_;
        };

    } // namespace risk
} // namespace natopt
