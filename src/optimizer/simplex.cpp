/**
 * @file simplex.cpp
 * @brief Simplex projection and Dirichlet sampling
 */

#include "optimizer/simplex.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace natopt
{
    namespace optimizer
    {

        Eigen::VectorXd project_to_simplex(const Eigen::VectorXd &v)
        {
            if (v.size() == 0)
            {
                throw std::invalid_argument("Cannot project an empty vector onto the simplex");
            }

            // (x > 0) is false for NaN, so NaN entries are clamped as well
            Eigen::VectorXd clamped = v.unaryExpr([](double x)
                                                  { return x > 0.0 ? x : 0.0; });

            double total = clamped.sum();
            if (total == 0.0)
            {
                return uniform_weights(v.size());
            }

            return clamped / total;
        }

        bool is_on_simplex(const Eigen::VectorXd &w, double tolerance)
        {
            if (w.size() == 0 || !w.allFinite())
            {
                return false;
            }
            if (w.minCoeff() < -tolerance)
            {
                return false;
            }
            return std::abs(w.sum() - 1.0) <= tolerance;
        }

        Eigen::VectorXd uniform_weights(Eigen::Index n)
        {
            return Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
        }

        Eigen::MatrixXd sample_dirichlet(Eigen::Index n, Eigen::Index dim, RandomEngine &rng)
        {
            if (n < 0)
            {
                throw std::invalid_argument(
                    "Sample count must be non-negative, got: " + std::to_string(n));
            }
            if (dim <= 0)
            {
                throw std::invalid_argument(
                    "Dirichlet dimension must be positive, got: " + std::to_string(dim));
            }

            std::gamma_distribution<double> gamma(1.0, 1.0);
            Eigen::MatrixXd samples(n, dim);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                double total = 0.0;
                for (Eigen::Index j = 0; j < dim; ++j)
                {
                    samples(i, j) = gamma(rng);
                    total += samples(i, j);
                }

                if (total > 0.0)
                {
                    samples.row(i) /= total;
                }
                else
                {
                    // Every draw underflowed to zero; fall back to the centre
                    samples.row(i) = uniform_weights(dim).transpose();
                }
            }

            return samples;
        }

    } // namespace optimizer
} // namespace natopt
