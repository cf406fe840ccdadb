/**
 * @file test_sharpe_objective.cpp
 * @brief Unit tests for the Sharpe ratio objective
 */

#include <catch2/catch.hpp>
#include "optimizer/sharpe_objective.hpp"
#include "risk/sample_covariance.hpp"
#include <cmath>
#include <limits>

using namespace natopt;
using namespace natopt::optimizer;
using Catch::Matchers::WithinAbs;

class SharpeObjectiveFixture
{
protected:
    Eigen::VectorXd mu_;
    Eigen::MatrixXd cov_;

    SharpeObjectiveFixture()
    {
        mu_ = Eigen::VectorXd(2);
        mu_ << 0.01, 0.02;

        cov_ = Eigen::MatrixXd(2, 2);
        cov_ << 0.0004, 0.0,
            0.0, 0.0009;
    }
};

TEST_CASE_METHOD(SharpeObjectiveFixture, "sharpe_fitness matches the textbook formula", "[SharpeObjective]")
{
    SECTION("Single asset 2 portfolio")
    {
        Eigen::VectorXd w(2);
        w << 0.0, 1.0;
        // -(0.02) / sqrt(0.0009) = -0.6667
        REQUIRE_THAT(sharpe_fitness(w, mu_, cov_), WithinAbs(-2.0 / 3.0, 1e-12));
    }

    SECTION("Equal weights")
    {
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        double expected = -0.015 / std::sqrt(0.25 * 0.0004 + 0.25 * 0.0009);
        REQUIRE_THAT(sharpe_fitness(w, mu_, cov_), WithinAbs(expected, 1e-12));
    }

    SECTION("Zero variance is unguarded")
    {
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        Eigen::MatrixXd zero = Eigen::MatrixXd::Zero(2, 2);
        REQUIRE_FALSE(std::isfinite(sharpe_fitness(w, mu_, zero)));
    }
}

TEST_CASE_METHOD(SharpeObjectiveFixture, "SharpeObjective evaluation", "[SharpeObjective]")
{
    SharpeObjective objective(mu_, cov_);

    SECTION("Fitness is the negated Sharpe ratio")
    {
        Eigen::VectorXd w(2);
        w << 0.3, 0.7;

        double ratio = w.dot(mu_) / std::sqrt(w.dot(cov_ * w));
        REQUIRE_THAT(objective.fitness(w), WithinAbs(-ratio, 1e-12));
        REQUIRE_THAT(objective.sharpe_ratio(w), WithinAbs(ratio, 1e-12));
        REQUIRE_THAT(objective.fitness(w), WithinAbs(sharpe_fitness(w, mu_, cov_), 1e-15));
    }

    SECTION("Higher Sharpe ratio means lower fitness")
    {
        Eigen::VectorXd tangency(2);
        tangency << 0.5294, 0.4706;
        Eigen::VectorXd corner(2);
        corner << 1.0, 0.0;

        REQUIRE(objective.fitness(tangency) < objective.fitness(corner));
    }

    SECTION("Expected return and volatility")
    {
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        REQUIRE_THAT(objective.expected_return(w), WithinAbs(0.015, 1e-15));
        REQUIRE_THAT(objective.volatility(w), WithinAbs(std::sqrt(0.000325), 1e-15));
    }

    SECTION("Risk-free rate is subtracted from the return")
    {
        SharpeObjective with_rf(mu_, cov_, 0.005);
        Eigen::VectorXd w(2);
        w << 0.0, 1.0;
        REQUIRE_THAT(with_rf.sharpe_ratio(w), WithinAbs(0.015 / 0.03, 1e-12));
    }

    SECTION("Wrong weight length throws")
    {
        Eigen::VectorXd w(3);
        w << 0.2, 0.3, 0.5;
        REQUIRE_THROWS_AS(objective.fitness(w), std::invalid_argument);
    }

    SECTION("Minimum eigenvalue of a diagonal covariance")
    {
        REQUIRE_THAT(objective.min_eigenvalue(), WithinAbs(0.0004, 1e-12));
    }
}

TEST_CASE("SharpeObjective degenerate variance yields NaN", "[SharpeObjective][EdgeCase]")
{
    Eigen::VectorXd mu(2);
    mu << 0.01, 0.02;

    SECTION("Zero covariance")
    {
        SharpeObjective objective(mu, Eigen::MatrixXd::Zero(2, 2));
        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        REQUIRE(std::isnan(objective.fitness(w)));
    }

    SECTION("Indefinite covariance")
    {
        Eigen::MatrixXd cov(2, 2);
        cov << 0.0001, 0.0010,
            0.0010, 0.0001;
        SharpeObjective objective(mu, cov);

        Eigen::VectorXd w(2);
        w << 0.5, 0.5;
        REQUIRE(objective.fitness(w) < 0.0);

        // Negative variance along (1, -1)
        w << 1.0, -1.0;
        REQUIRE(std::isnan(objective.fitness(w)));
        REQUIRE(objective.min_eigenvalue() < 0.0);
    }
}

TEST_CASE("SharpeObjective construction validation", "[SharpeObjective][Validation]")
{
    Eigen::VectorXd mu(2);
    mu << 0.01, 0.02;
    Eigen::MatrixXd cov = Eigen::MatrixXd::Identity(2, 2) * 0.0004;

    SECTION("Empty mean")
    {
        REQUIRE_THROWS_AS(SharpeObjective(Eigen::VectorXd(), Eigen::MatrixXd()), std::invalid_argument);
    }

    SECTION("Dimension mismatch")
    {
        Eigen::MatrixXd cov3 = Eigen::MatrixXd::Identity(3, 3);
        REQUIRE_THROWS_AS(SharpeObjective(mu, cov3), std::invalid_argument);
    }

    SECTION("Non-finite entries")
    {
        Eigen::VectorXd bad = mu;
        bad(0) = std::nan("");
        REQUIRE_THROWS_AS(SharpeObjective(bad, cov), std::invalid_argument);

        Eigen::MatrixXd bad_cov = cov;
        bad_cov(1, 1) = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(SharpeObjective(mu, bad_cov), std::invalid_argument);
    }

    SECTION("Asymmetric covariance")
    {
        Eigen::MatrixXd asym = cov;
        asym(0, 1) = 0.0001;
        REQUIRE_THROWS_AS(SharpeObjective(mu, asym), std::invalid_argument);
    }
}

TEST_CASE("SharpeObjective from returns", "[SharpeObjective]")
{
    Eigen::MatrixXd returns(4, 2);
    returns << 0.01, 0.03,
        0.02, -0.01,
        -0.01, 0.02,
        0.02, 0.00;

    SharpeObjective objective = SharpeObjective::from_returns(returns);

    REQUIRE_THAT(objective.mean()(0), WithinAbs(0.01, 1e-15));
    REQUIRE_THAT(objective.mean()(1), WithinAbs(0.01, 1e-15));

    risk::SampleCovariance sample(true);
    Eigen::MatrixXd expected = sample.estimate_covariance(returns);
    REQUIRE_THAT((objective.covariance() - expected).cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-15));
    REQUIRE(objective.num_assets() == 2);
}
