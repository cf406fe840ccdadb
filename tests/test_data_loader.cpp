/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader, MarketData and ReturnMatrix
 */

#include <catch2/catch.hpp>
#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/return_matrix.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>

using namespace natopt;
using Catch::Matchers::WithinAbs;

namespace
{
    const double NaN = std::numeric_limits<double>::quiet_NaN();

    std::string write_temp_file(const std::string &name, const std::string &contents)
    {
        std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << contents;
        return path.string();
    }
}

TEST_CASE("MarketData construction", "[MarketData]") {

    SECTION("Constructor with data") {
        Eigen::MatrixXd prices(3, 2);
        prices << 100.0, 150.0,
                  101.0, 151.5,
                  102.0, 152.0;

        std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03"};
        std::vector<std::string> tickers = {"AAPL", "MSFT"};

        MarketData data(prices, dates, tickers);

        REQUIRE(data.num_dates() == 3);
        REQUIRE(data.num_assets() == 2);
        REQUIRE(data.get_dates() == dates);
        REQUIRE(data.get_tickers() == tickers);
        REQUIRE_THAT(data.get_prices("MSFT")(1), WithinAbs(151.5, 1e-12));
    }

    SECTION("Unordered dates and duplicate tickers throw") {
        Eigen::MatrixXd prices(2, 2);
        prices << 1.0, 2.0, 3.0, 4.0;
        REQUIRE_THROWS_AS(MarketData(prices, {"2020-01-02", "2020-01-01"}, {"A", "B"}), std::invalid_argument);
        REQUIRE_THROWS_AS(MarketData(prices, {"2020-01-01", "2020-01-02"}, {"A", "A"}), std::invalid_argument);
    }

    SECTION("Mismatched labels throw") {
        Eigen::MatrixXd prices(2, 2);
        prices << 1.0, 2.0, 3.0, 4.0;
        REQUIRE_THROWS_AS(MarketData(prices, {"2020-01-01"}, {"A", "B"}), std::invalid_argument);
        REQUIRE_THROWS_AS(MarketData(prices, {"2020-01-01", "2020-01-02"}, {"A"}), std::invalid_argument);
    }
}

TEST_CASE("Return calculations", "[MarketData]") {
    Eigen::MatrixXd prices(4, 2);
    prices << 100.0, 200.0,
              110.0, 210.0,
              105.0, NaN,
              115.0, 215.0;

    std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-04"};
    std::vector<std::string> tickers = {"AAPL", "MSFT"};

    MarketData data(prices, dates, tickers);

    SECTION("Simple returns") {
        auto returns = data.calculate_returns(ReturnType::SIMPLE);

        REQUIRE(returns.rows() == 3);
        REQUIRE(returns.cols() == 2);

        // First return for AAPL: (110-100)/100 = 0.10
        REQUIRE_THAT(returns(0, 0), WithinAbs(0.10, 1e-12));

        // First return for MSFT: (210-200)/200 = 0.05
        REQUIRE_THAT(returns(0, 1), WithinAbs(0.05, 1e-12));
    }

    SECTION("Missing price gives missing returns on both sides") {
        auto returns = data.calculate_returns(ReturnType::SIMPLE);
        REQUIRE(std::isnan(returns(1, 1)));
        REQUIRE(std::isnan(returns(2, 1)));
        REQUIRE_FALSE(std::isnan(returns(1, 0)));
    }

    SECTION("Log returns") {
        auto returns = data.calculate_returns(ReturnType::LOG);
        REQUIRE_THAT(returns(0, 0), WithinAbs(std::log(1.1), 1e-12));
    }
}

TEST_CASE("Forward filling and missing values", "[MarketData]") {
    Eigen::MatrixXd prices(4, 2);
    prices << NaN, 10.0,
              5.0, NaN,
              NaN, NaN,
              6.0, 12.0;

    MarketData data(prices, {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-04"}, {"A", "B"});
    REQUIRE(data.count_missing() == 4);

    MarketData filled = data.forward_fill();

    SECTION("Gaps take the last observed price") {
        REQUIRE(filled.get_prices()(1, 1) == 10.0);
        REQUIRE(filled.get_prices()(2, 1) == 10.0);
        REQUIRE(filled.get_prices()(2, 0) == 5.0);
    }

    SECTION("Leading missing values stay missing") {
        REQUIRE(std::isnan(filled.get_prices()(0, 0)));
        REQUIRE(filled.count_missing() == 1);
    }
}

TEST_CASE("Coverage and sparse assets", "[MarketData]") {
    Eigen::MatrixXd prices(4, 3);
    prices << 10.0, NaN, 5.0,
              11.0, NaN, 5.5,
              12.0, 20.0, NaN,
              13.0, 21.0, 6.0;

    MarketData data(prices, {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-04"},
                    {"FULL", "LATE", "GAP"});

    Eigen::VectorXd share = data.coverage();
    REQUIRE(share(0) == 1.0);
    REQUIRE(share(1) == 0.5);
    REQUIRE(share(2) == 0.75);

    SECTION("Threshold keeps the well quoted tickers") {
        MarketData kept = data.drop_sparse_assets(0.75);
        REQUIRE(kept.get_tickers() == std::vector<std::string>{"FULL", "GAP"});
    }

    SECTION("Zero threshold keeps everything") {
        REQUIRE(data.drop_sparse_assets(0.0).num_assets() == 3);
    }

    SECTION("Invalid or unreachable threshold throws") {
        REQUIRE_THROWS_AS(data.drop_sparse_assets(1.5), std::invalid_argument);

        Eigen::MatrixXd empty_prices = Eigen::MatrixXd::Constant(2, 1, NaN);
        MarketData unquoted(empty_prices, {"2020-01-01", "2020-01-02"}, {"X"});
        REQUIRE_THROWS_AS(unquoted.drop_sparse_assets(0.1), std::invalid_argument);
    }
}

TEST_CASE("Data filtering", "[MarketData]") {
    Eigen::MatrixXd prices(5, 2);
    prices << 100.0, 200.0,
              110.0, 210.0,
              105.0, 220.0,
              115.0, 215.0,
              120.0, 225.0;

    std::vector<std::string> dates = {"2020-01-01", "2020-01-02", "2020-01-03",
                                      "2020-01-04", "2020-01-05"};
    std::vector<std::string> tickers = {"AAPL", "MSFT"};

    MarketData data(prices, dates, tickers);

    SECTION("Filter by date range") {
        auto filtered = data.filter_by_date("2020-01-02", "2020-01-04");

        REQUIRE(filtered.num_dates() == 3);
        REQUIRE(filtered.get_dates()[0] == "2020-01-02");
        REQUIRE(filtered.get_dates()[2] == "2020-01-04");
    }

    SECTION("Bounds need not be trading dates") {
        auto filtered = data.filter_by_date("2019-12-25", "2020-01-02");
        REQUIRE(filtered.num_dates() == 2);

        auto open_end = data.filter_by_date("2020-01-03", "");
        REQUIRE(open_end.num_dates() == 3);
        REQUIRE(open_end.get_dates().back() == "2020-01-05");
    }

    SECTION("Reversed or empty range throws") {
        REQUIRE_THROWS_AS(data.filter_by_date("2020-01-04", "2020-01-02"), std::invalid_argument);
        REQUIRE_THROWS_AS(data.filter_by_date("2021-01-01", "2021-12-31"), std::invalid_argument);
    }

    SECTION("Select specific asset") {
        std::vector<std::string> selected = {"MSFT"};
        auto filtered = data.select_assets(selected);

        REQUIRE(filtered.num_assets() == 1);
        REQUIRE(filtered.get_tickers()[0] == "MSFT");
    }
}

TEST_CASE("ReturnMatrix from prices", "[ReturnMatrix]") {
    // C is missing on the first day only, D has a gap that forward filling closes
    Eigen::MatrixXd prices(4, 3);
    prices << 100.0, NaN, 50.0,
              110.0, 20.0, NaN,
              121.0, 22.0, 55.0,
              121.0, 11.0, 55.0;

    MarketData data(prices, {"2020-01-01", "2020-01-02", "2020-01-03", "2020-01-04"},
                    {"A", "C", "D"});

    ReturnMatrix returns = ReturnMatrix::from_prices(data);

    SECTION("Periods with a missing return are dropped") {
        // Period 1 has no return for C (no prior price)
        REQUIRE(returns.num_periods() == 2);
        REQUIRE(returns.num_assets() == 3);
        REQUIRE(returns.values().allFinite());
    }

    SECTION("Periods are labelled with their end date") {
        REQUIRE(returns.get_dates()[0] == "2020-01-03");
        REQUIRE(returns.get_dates()[1] == "2020-01-04");
    }

    SECTION("Forward-filled gap gives a full period return later") {
        // D: 50 -> 50 (filled) -> 55 -> 55
        REQUIRE_THAT(returns.values()(0, 2), WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(returns.values()(1, 2), WithinAbs(0.0, 1e-12));
    }

    SECTION("Mean returns") {
        Eigen::VectorXd means = returns.mean_returns();
        REQUIRE_THAT(means(0), WithinAbs(0.05, 1e-12));
        REQUIRE_THAT(means(1), WithinAbs(-0.2, 1e-12));
    }
}

TEST_CASE("ReturnMatrix top-N selection", "[ReturnMatrix]") {
    Eigen::MatrixXd values(2, 4);
    values << 0.01, 0.02, -0.01, 0.02,
              0.01, 0.02, -0.01, 0.02;

    ReturnMatrix returns(values, {"d1", "d2"}, {"LOW", "MID", "NEG", "TOP"});

    SECTION("Highest mean return first") {
        ReturnMatrix top = returns.select_top_by_mean(2);
        REQUIRE(top.num_assets() == 2);
        REQUIRE(top.get_tickers()[0] == "MID");
        REQUIRE(top.get_tickers()[1] == "TOP");
        REQUIRE(top.values().col(0) == values.col(1));
    }

    SECTION("Ties keep the original column order") {
        // MID and TOP both average 0.02
        ReturnMatrix top = returns.select_top_by_mean(3);
        REQUIRE(top.get_tickers() == std::vector<std::string>{"MID", "TOP", "LOW"});
    }

    SECTION("N larger than the universe keeps every asset") {
        REQUIRE(returns.select_top_by_mean(50).num_assets() == 4);
    }

    SECTION("Non-positive N throws") {
        REQUIRE_THROWS_AS(returns.select_top_by_mean(0), std::invalid_argument);
        REQUIRE_THROWS_AS(returns.select_top_by_mean(-3), std::invalid_argument);
    }

    SECTION("Construction rejects missing values") {
        Eigen::MatrixXd bad = values;
        bad(0, 0) = NaN;
        REQUIRE_THROWS_AS(ReturnMatrix(bad, {"d1", "d2"}, {"LOW", "MID", "NEG", "TOP"}),
                          std::invalid_argument);
    }
}

TEST_CASE("DataLoader long-format CSV", "[DataLoader]") {
    const std::string csv =
        "date,open,high,low,close,volume,Name\n"
        "2013-02-08,15.07,15.12,14.63,14.75,8407500,AAL\n"
        "2013-02-08,67.71,68.40,66.89,67.85,158168416,AAPL\n"
        "2013-02-11,14.89,15.01,14.26,14.46,8882000,AAL\n"
        "2013-02-12,14.45,14.51,14.10,14.27,8126000,AAL\n"
        "2013-02-12,68.50,68.91,66.82,66.84,129029425,AAPL\n";
    std::string path = write_temp_file("natopt_long_prices.csv", csv);

    SECTION("Pivot to dates x tickers") {
        MarketData data = DataLoader::load_csv_long(path);

        REQUIRE(data.num_dates() == 3);
        REQUIRE(data.num_assets() == 2);
        REQUIRE(data.get_tickers() == std::vector<std::string>{"AAL", "AAPL"});
        REQUIRE(data.get_dates()[1] == "2013-02-11");
        REQUIRE_THAT(data.get_prices()(0, 1), WithinAbs(67.85, 1e-12));
        REQUIRE(std::isnan(data.get_prices()(1, 1)));
    }

    SECTION("Ticker filter") {
        MarketData data = DataLoader::load_csv_long(path, "date", "Name", "close", {"AAPL"});
        REQUIRE(data.num_assets() == 1);
        REQUIRE(data.num_dates() == 2);
    }

    SECTION("Alternative price column") {
        MarketData data = DataLoader::load_csv_long(path, "date", "Name", "open");
        REQUIRE_THAT(data.get_prices()(0, 0), WithinAbs(15.07, 1e-12));
    }

    SECTION("Unknown column throws") {
        REQUIRE_THROWS_AS(DataLoader::load_csv_long(path, "date", "Symbol", "close"), std::runtime_error);
    }

    SECTION("Auto detection picks the long layout") {
        DataConfig config = DataConfig::from_json(nlohmann::json{{"data_file", path}});
        MarketData data = DataLoader::load_csv(config);
        REQUIRE(data.num_assets() == 2);
    }

    SECTION("Full pipeline to returns") {
        ReturnMatrix returns = ReturnMatrix::from_prices(DataLoader::load_csv_long(path));
        // 2013-02-11 is forward filled for AAPL
        REQUIRE(returns.num_periods() == 2);
        REQUIRE_THAT(returns.values()(0, 1), WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("DataLoader wide-format CSV", "[DataLoader]") {
    std::string path = write_temp_file("natopt_wide_prices.csv",
                                       "date,AAA,BBB\n"
                                       "2020-01-01,10.0,20.0\n"
                                       "2020-01-02,11.0,19.0\n");

    DataConfig config = DataConfig::from_json(nlohmann::json{{"data_file", path}});
    MarketData data = DataLoader::load_csv(config);

    REQUIRE(data.num_dates() == 2);
    REQUIRE(data.get_tickers() == std::vector<std::string>{"AAA", "BBB"});
    REQUIRE_THAT(data.get_prices()(1, 1), WithinAbs(19.0, 1e-12));

    REQUIRE_THROWS_AS(DataLoader::load_csv_wide("does_not_exist.csv"), std::runtime_error);
}

TEST_CASE("DataLoader synthetic data", "[DataLoader]") {
    std::vector<std::string> tickers = {"AAPL", "MSFT", "GOOGL"};

    auto data = DataLoader::generate_synthetic_data(tickers, 100, "2020-01-01");

    REQUIRE(data.num_dates() == 100);
    REQUIRE(data.num_assets() == 3);
    REQUIRE(data.is_valid());
    REQUIRE(data.count_missing() == 0);
    REQUIRE((data.get_prices().array() > 0.0).all());

    SECTION("Same seed gives the same prices") {
        auto again = DataLoader::generate_synthetic_data(tickers, 100, "2020-01-01");
        REQUIRE(again.get_prices() == data.get_prices());
    }

    SECTION("Long-format file loads back") {
        std::string path = (std::filesystem::temp_directory_path() / "natopt_synthetic.csv").string();
        DataLoader::save_csv_long(data, path);

        MarketData loaded = DataLoader::load_csv_long(path);
        REQUIRE(loaded.num_dates() == 100);
        REQUIRE(loaded.get_tickers() == std::vector<std::string>{"AAPL", "GOOGL", "MSFT"});
        REQUIRE_THAT(loaded.get_prices("MSFT")(10), WithinAbs(data.get_prices("MSFT")(10), 1e-5));
    }
}

TEST_CASE("JSON configuration loading", "[DataLoader][Config]") {
    SECTION("Missing file throws") {
        REQUIRE_THROWS(DataLoader::load_config("nonexistent_config.json"));
    }

    SECTION("Defaults reproduce the four engine setup") {
        RunConfig config = RunConfig::defaults();

        REQUIRE(config.data.top_n_assets == 10);
        REQUIRE(config.data.ticker_column == "Name");
        REQUIRE(config.data.min_coverage == 0.0);
        REQUIRE(config.risk.bias_correction);
        REQUIRE(config.selector.num_runs == 5);
        REQUIRE_FALSE(config.selector.has_seed);
        REQUIRE(config.optimizers.size() == 4);
        REQUIRE(config.optimizers[0].type == "bat");
        REQUIRE(config.optimizers[1].population_size == 50);
        REQUIRE(config.optimizers[3].generations == 100);
    }

    SECTION("Partial file keeps defaults for the rest") {
        std::string path = write_temp_file("natopt_config.json", R"({
            "data": { "top_n_assets": 4, "min_coverage": 0.9 },
            "selector": { "num_runs": 2, "seed": 7 },
            "optimizers": [ { "type": "gwo", "population_size": 12,
                              "params": { "a_initial": 1.5 } } ]
        })");

        RunConfig config = DataLoader::load_config(path);

        REQUIRE(config.data.top_n_assets == 4);
        REQUIRE(config.data.min_coverage == 0.9);
        REQUIRE(config.data.data_file == "data/market/all_stocks_5yr.csv");
        REQUIRE(config.selector.has_seed);
        REQUIRE(config.selector.seed == 7);
        REQUIRE(config.optimizers.size() == 1);
        REQUIRE(config.optimizers[0].generations == 100);
        REQUIRE(config.optimizers[0].params["a_initial"].get<double>() == 1.5);
        REQUIRE(config.output.export_results);
    }

    SECTION("Negative or fractional seed is rejected") {
        REQUIRE_THROWS_AS(SelectorConfig::from_json(nlohmann::json{{"seed", -1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(SelectorConfig::from_json(nlohmann::json{{"seed", 1.5}}), std::invalid_argument);

        SelectorConfig config = SelectorConfig::from_json(nlohmann::json{{"seed", 7}});
        REQUIRE(config.has_seed);
        REQUIRE(config.seed == 7u);
    }

    SECTION("Engine entry without a type is rejected") {
        REQUIRE_THROWS_AS(EngineConfig::from_json(nlohmann::json{{"population_size", 10}}),
                          std::invalid_argument);
    }

    SECTION("Malformed JSON is reported as runtime_error") {
        std::string path = write_temp_file("natopt_bad_config.json", "{ \"data\": ");
        REQUIRE_THROWS_AS(DataLoader::load_config(path), std::runtime_error);
    }
}
