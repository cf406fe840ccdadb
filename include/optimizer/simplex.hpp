/**
 * @file simplex.hpp
 * @brief Feasibility gate and feasible sampling on the probability simplex
 *
 * The feasible region of every engine is
 *
 *     { w : w_i >= 0, sum(w) = 1 }
 *
 * Candidates leave it through velocity steps, mutation and leader
 * attraction; project_to_simplex() brings every one of them back.
 */

#pragma once

#include "optimizer/random_source.hpp"
#include <Eigen/Dense>

namespace natopt
{
    namespace optimizer
    {

        /**
         * @brief Clamp negatives to zero and renormalize
         *
         * When nothing positive remains (all entries <= 0) the result is the
         * uniform vector 1/N instead of a division by zero.
         *
         * @note This is a clamp-and-rescale map, not the Euclidean
         *       projection: [-3, -1, -2] maps to the uniform vector.
         * @throws std::invalid_argument if v is empty
         */
        Eigen::VectorXd project_to_simplex(const Eigen::VectorXd &v);

        /**
         * @brief Check w_i >= -tolerance and |sum(w) - 1| <= tolerance
         */
        bool is_on_simplex(const Eigen::VectorXd &w, double tolerance = 1e-9);

        /**
         * @brief The uniform portfolio 1/N
         */
        Eigen::VectorXd uniform_weights(Eigen::Index n);

        /**
         * @brief Draw points uniformly from the simplex
         *
         * Each row is a symmetric Dirichlet(1) sample obtained by
         * normalizing dim independent Gamma(1, 1) draws.
         *
         * @param n Number of points (rows)
         * @param dim Dimension of each point (columns)
         * @param rng Random engine
         * @return n x dim matrix whose rows lie on the simplex
         * @throws std::invalid_argument if n < 0 or dim <= 0
         */
        Eigen::MatrixXd sample_dirichlet(Eigen::Index n, Eigen::Index dim, RandomEngine &rng);

    } // namespace optimizer
} // namespace natopt
