/**
 * @file test_bat_algorithm.cpp
 * @brief Unit tests for the bat algorithm engine
 */

#include <catch2/catch.hpp>
#include "optimizer/bat_algorithm.hpp"
#include <cmath>
#include <limits>

using namespace natopt::optimizer;
using Catch::Matchers::WithinAbs;

class BatAlgorithmFixture
{
protected:
    Eigen::VectorXd mu_;
    Eigen::MatrixXd uncorrelated_;
    Eigen::MatrixXd correlated_;

    BatAlgorithmFixture()
    {
        mu_ = Eigen::VectorXd(2);
        mu_ << 0.01, 0.02;

        uncorrelated_ = Eigen::MatrixXd(2, 2);
        uncorrelated_ << 0.0004, 0.0,
            0.0, 0.0009;

        correlated_ = Eigen::MatrixXd(2, 2);
        correlated_ << 0.0004, 0.00054,
            0.00054, 0.0009;
    }
};

TEST_CASE_METHOD(BatAlgorithmFixture, "BatAlgorithm finds the two-asset tangency portfolio", "[BatAlgorithm]")
{
    SharpeObjective objective(mu_, uncorrelated_);
    BatAlgorithm bat;
    RandomEngine rng(42);

    auto result = bat.run(objective, 30, 100, rng);

    REQUIRE(result.is_valid());
    REQUIRE(result.engine == "BatAlgorithm");
    REQUIRE(result.generations == 100);
    REQUIRE_THAT(result.weights.sum(), WithinAbs(1.0, 1e-9));

    // Analytic optimum w = (0.5294, 0.4706), Sharpe 0.8333
    REQUIRE(result.sharpe_ratio >= 0.82);
    REQUIRE(result.sharpe_ratio <= 0.8334);
    REQUIRE_THAT(result.weights(1), WithinAbs(0.4706, 0.12));
}

TEST_CASE_METHOD(BatAlgorithmFixture, "BatAlgorithm moves to the corner for correlated assets", "[BatAlgorithm]")
{
    // Off-diagonal 0.00054 makes asset 2 alone the best portfolio
    SharpeObjective objective(mu_, correlated_);
    BatAlgorithm bat;
    RandomEngine rng(7);

    auto result = bat.run(objective, 30, 100, rng);

    REQUIRE(result.is_valid());
    REQUIRE(result.weights(1) > 0.75);
    REQUIRE(result.sharpe_ratio > 0.65);
    REQUIRE(result.sharpe_ratio <= 2.0 / 3.0 + 1e-12);
}

TEST_CASE_METHOD(BatAlgorithmFixture, "BatAlgorithm run contract", "[BatAlgorithm]")
{
    SharpeObjective objective(mu_, uncorrelated_);
    BatAlgorithm bat;

    SECTION("History has one non-decreasing entry per generation")
    {
        RandomEngine rng(1);
        auto result = bat.run(objective, 20, 60, rng);

        REQUIRE(result.history.size() == 60);
        for (size_t t = 1; t < result.history.size(); ++t)
        {
            REQUIRE(result.history[t] >= result.history[t - 1]);
        }
        REQUIRE_THAT(result.history.back(), WithinAbs(result.sharpe_ratio, 1e-15));
    }

    SECTION("Every bat stays on the simplex")
    {
        RandomEngine rng(2);
        int calls = 0;
        bool feasible = true;

        bat.run(objective, 15, 40, rng,
                [&](int generation, const Population &population, double)
                {
                    feasible = feasible && population.is_feasible();
                    REQUIRE(generation == calls);
                    ++calls;
                });

        REQUIRE(calls == 40);
        REQUIRE(feasible);
    }

    SECTION("Same seed reproduces the run")
    {
        RandomEngine a(1234);
        RandomEngine b(1234);

        auto first = bat.run(objective, 20, 50, a);
        auto second = bat.run(objective, 20, 50, b);

        REQUIRE(first.weights == second.weights);
        REQUIRE(first.history == second.history);
    }
}

TEST_CASE("BatAlgorithm with a single asset", "[BatAlgorithm][EdgeCase]")
{
    Eigen::VectorXd mu(1);
    mu << 0.01;
    Eigen::MatrixXd cov(1, 1);
    cov << 0.0004;

    SharpeObjective objective(mu, cov);
    BatAlgorithm bat;
    RandomEngine rng(3);

    auto result = bat.run(objective, 10, 20, rng);

    REQUIRE(result.weights.size() == 1);
    REQUIRE(result.weights(0) == 1.0);
    REQUIRE_THAT(result.sharpe_ratio, WithinAbs(0.5, 1e-12));
}

TEST_CASE("BatParameters validation", "[BatAlgorithm][Validation]")
{
    SECTION("Defaults are valid")
    {
        BatParameters params;
        REQUIRE_NOTHROW(params.validate());
        REQUIRE(params.freq_max == 5.0);
        REQUIRE(params.loudness_decay == 0.95);
    }

    SECTION("Inverted frequency range")
    {
        BatParameters params;
        params.freq_min = 2.0;
        params.freq_max = 1.0;
        REQUIRE_THROWS_AS(BatAlgorithm(params), std::invalid_argument);
    }

    SECTION("Loudness decay outside (0, 1]")
    {
        BatParameters params;
        params.loudness_decay = 0.0;
        REQUIRE_THROWS_AS(params.validate(), std::invalid_argument);

        params.loudness_decay = 1.5;
        REQUIRE_THROWS_AS(params.validate(), std::invalid_argument);
    }

    SECTION("Negative walk width and gamma")
    {
        BatParameters params;
        params.local_walk_sigma = -0.01;
        REQUIRE_THROWS_AS(params.validate(), std::invalid_argument);

        params = BatParameters();
        params.pulse_rate_gamma = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(params.validate(), std::invalid_argument);
    }

    SECTION("JSON overrides and defaults")
    {
        auto params = BatParameters::from_json({{"freq_max", 2.0}, {"loudness_decay", 0.9}});
        REQUIRE(params.freq_max == 2.0);
        REQUIRE(params.loudness_decay == 0.9);
        REQUIRE(params.local_walk_sigma == 0.05);

        BatAlgorithm bat(params);
        REQUIRE(bat.get_parameters()["freq_max"] == 2.0);
        REQUIRE(bat.get_parameters()["type"] == "bat");
    }
}
