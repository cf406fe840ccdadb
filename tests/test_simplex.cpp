/**
 * @file test_simplex.cpp
 * @brief Unit tests for simplex projection and Dirichlet sampling
 */

#include <catch2/catch.hpp>
#include "optimizer/simplex.hpp"
#include <cmath>
#include <limits>

using namespace natopt::optimizer;
using Catch::Matchers::WithinAbs;

TEST_CASE("project_to_simplex clamps and renormalizes", "[Simplex]")
{
    SECTION("Vector already on the simplex is unchanged")
    {
        Eigen::VectorXd w(3);
        w << 0.2, 0.3, 0.5;
        Eigen::VectorXd p = project_to_simplex(w);
        REQUIRE_THAT((p - w).cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-15));
    }

    SECTION("Negative entries are clamped to zero")
    {
        Eigen::VectorXd v(3);
        v << -0.5, 1.0, 3.0;
        Eigen::VectorXd p = project_to_simplex(v);

        REQUIRE(p(0) == 0.0);
        REQUIRE_THAT(p(1), WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(p(2), WithinAbs(0.75, 1e-12));
        REQUIRE(is_on_simplex(p));
    }

    SECTION("Positive vector is rescaled to unit sum")
    {
        Eigen::VectorXd v(4);
        v << 2.0, 2.0, 4.0, 8.0;
        Eigen::VectorXd p = project_to_simplex(v);

        REQUIRE_THAT(p.sum(), WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(p(3), WithinAbs(0.5, 1e-12));
    }

    SECTION("All non-positive input falls back to uniform weights")
    {
        Eigen::VectorXd v(3);
        v << -3.0, -1.0, -2.0;
        Eigen::VectorXd p = project_to_simplex(v);

        for (int i = 0; i < 3; ++i)
        {
            REQUIRE_THAT(p(i), WithinAbs(1.0 / 3.0, 1e-15));
        }
    }

    SECTION("All-zero input falls back to uniform weights")
    {
        Eigen::VectorXd p = project_to_simplex(Eigen::VectorXd::Zero(4));
        REQUIRE_THAT((p - Eigen::VectorXd::Constant(4, 0.25)).cwiseAbs().maxCoeff(),
                     WithinAbs(0.0, 1e-15));
    }

    SECTION("NaN entries are treated as zero")
    {
        Eigen::VectorXd v(3);
        v << std::numeric_limits<double>::quiet_NaN(), 1.0, 1.0;
        Eigen::VectorXd p = project_to_simplex(v);

        REQUIRE(p(0) == 0.0);
        REQUIRE_THAT(p(1), WithinAbs(0.5, 1e-12));
    }

    SECTION("Single asset always maps to [1.0]")
    {
        Eigen::VectorXd v(1);
        v << 0.37;
        REQUIRE(project_to_simplex(v)(0) == 1.0);

        v << -2.0;
        REQUIRE(project_to_simplex(v)(0) == 1.0);
    }

    SECTION("Empty vector throws")
    {
        REQUIRE_THROWS_AS(project_to_simplex(Eigen::VectorXd()), std::invalid_argument);
    }
}

TEST_CASE("project_to_simplex output is always feasible", "[Simplex]")
{
    RandomEngine rng(7);
    std::normal_distribution<double> normal(0.0, 5.0);

    for (int trial = 0; trial < 200; ++trial)
    {
        Eigen::VectorXd v(6);
        for (int i = 0; i < 6; ++i)
        {
            v(i) = normal(rng);
        }

        Eigen::VectorXd p = project_to_simplex(v);
        REQUIRE(p.minCoeff() >= 0.0);
        REQUIRE_THAT(p.sum(), WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("is_on_simplex checks sign and sum", "[Simplex]")
{
    Eigen::VectorXd w(2);

    w << 0.5, 0.5;
    REQUIRE(is_on_simplex(w));

    w << 0.6, 0.5;
    REQUIRE_FALSE(is_on_simplex(w));

    w << 1.1, -0.1;
    REQUIRE_FALSE(is_on_simplex(w));

    w << 0.5 + 1e-12, 0.5;
    REQUIRE(is_on_simplex(w));

    REQUIRE_FALSE(is_on_simplex(Eigen::VectorXd()));
}

TEST_CASE("sample_dirichlet draws feasible points", "[Simplex][Dirichlet]")
{
    RandomEngine rng(42);

    SECTION("Every row lies on the simplex")
    {
        Eigen::MatrixXd samples = sample_dirichlet(500, 5, rng);

        REQUIRE(samples.rows() == 500);
        REQUIRE(samples.cols() == 5);
        for (Eigen::Index i = 0; i < samples.rows(); ++i)
        {
            REQUIRE(is_on_simplex(samples.row(i).transpose(), 1e-12));
        }
    }

    SECTION("Component means approach 1/dim")
    {
        Eigen::MatrixXd samples = sample_dirichlet(4000, 4, rng);
        Eigen::VectorXd means = samples.colwise().mean().transpose();

        for (int j = 0; j < 4; ++j)
        {
            REQUIRE_THAT(means(j), WithinAbs(0.25, 0.02));
        }
    }

    SECTION("One dimension gives all ones")
    {
        Eigen::MatrixXd samples = sample_dirichlet(10, 1, rng);
        REQUIRE((samples.array() == 1.0).all());
    }

    SECTION("Zero samples is allowed")
    {
        Eigen::MatrixXd samples = sample_dirichlet(0, 3, rng);
        REQUIRE(samples.rows() == 0);
    }

    SECTION("Same seed reproduces the draws")
    {
        RandomEngine a(99);
        RandomEngine b(99);
        REQUIRE(sample_dirichlet(20, 3, a) == sample_dirichlet(20, 3, b));
    }

    SECTION("Invalid sizes throw")
    {
        REQUIRE_THROWS_AS(sample_dirichlet(-1, 3, rng), std::invalid_argument);
        REQUIRE_THROWS_AS(sample_dirichlet(5, 0, rng), std::invalid_argument);
    }
}
