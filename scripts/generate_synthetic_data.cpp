/**
 * @file generate_synthetic_data.cpp
 * @brief Generate a synthetic long-format price table for the optimizer
 *
 * Output has the layout of the five-year S&P 500 dataset the optimizer is
 * usually pointed at (date,close,Name), so it can be loaded with the
 * default data configuration.
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/return_matrix.hpp"
#include "risk/sample_covariance.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>

using namespace natopt;

int main(int argc, char *argv[])
{
    std::cout << "\n=== Synthetic Data Generator ===\n"
              << std::endl;

    std::vector<std::string> tickers = {
        "AAPL", "MSFT", "AMZN", "NVDA", "JPM",
        "JNJ", "XOM", "WMT", "GOOGL", "BAC",
        "PFE", "CVX", "NFLX", "ADBE", "COST"};

    // Five years of trading days
    size_t num_days = 1259;
    std::string start_date = "2013-02-08";

    std::string output_file = "data/market/all_stocks_5yr.csv";
    double base_volatility = 0.015;
    double base_drift = 0.0004;
    std::uint64_t seed = 42;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "--output" && i + 1 < argc)
            {
                output_file = argv[++i];
            }
            else if (arg == "--volatility" && i + 1 < argc)
            {
                base_volatility = std::stod(argv[++i]);
            }
            else if (arg == "--drift" && i + 1 < argc)
            {
                base_drift = std::stod(argv[++i]);
            }
            else if (arg == "--days" && i + 1 < argc)
            {
                num_days = static_cast<size_t>(std::stoul(argv[++i]));
            }
            else if (arg == "--seed" && i + 1 < argc)
            {
                seed = std::stoull(argv[++i]);
            }
            else if (arg == "--help")
            {
                std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                          << "Options:\n"
                          << "  --output FILE      Output CSV file (default: data/market/all_stocks_5yr.csv)\n"
                          << "  --volatility VAL   Base daily volatility (default: 0.015)\n"
                          << "  --drift VAL        Base daily drift (default: 0.0004)\n"
                          << "  --days N           Trading days (default: 1259)\n"
                          << "  --seed S           Random seed (default: 42)\n"
                          << "  --help             Show this help\n";
                return 0;
            }
        }

        std::cout << "Generating " << num_days << " days for " << tickers.size()
                  << " assets starting " << start_date << "..." << std::endl;

        MarketData data = DataLoader::generate_synthetic_data(
            tickers, num_days, start_date, base_volatility, base_drift, seed);

        std::cout << "Saving to " << output_file << "..." << std::endl;
        DataLoader::save_csv_long(data, output_file);

        ReturnMatrix returns = ReturnMatrix::from_prices(data);
        risk::SampleCovariance sample;
        risk::MomentEstimate moments = sample.estimate(returns.values());
        const Eigen::VectorXd &means = moments.mean;
        const Eigen::MatrixXd &cov = moments.covariance;

        std::cout << "\n=== Generated Data Summary ===\n";
        std::cout << "Dates: " << data.num_dates() << " ("
                  << data.get_dates().front() << " to "
                  << data.get_dates().back() << ")\n";
        std::cout << "Assets: " << data.num_assets() << "\n";
        std::cout << "Return periods: " << moments.periods << "\n";

        std::cout << "\nAsset Statistics (Daily):\n";
        std::cout << std::string(48, '-') << "\n";
        std::cout << std::setw(8) << "Ticker"
                  << std::setw(14) << "Mean Return"
                  << std::setw(14) << "Volatility"
                  << std::setw(12) << "Sharpe" << "\n";
        std::cout << std::string(48, '-') << "\n";

        for (Eigen::Index i = 0; i < returns.num_assets(); ++i)
        {
            double vol = std::sqrt(cov(i, i));
            std::cout << std::setw(8) << returns.get_tickers()[static_cast<size_t>(i)]
                      << std::setw(13) << std::fixed << std::setprecision(4)
                      << means(i) * 100 << "%"
                      << std::setw(13) << vol * 100 << "%"
                      << std::setw(12) << means(i) / vol << "\n";
        }
        std::cout << std::string(48, '-') << "\n";

        std::cout << "\nYou can now run:\n";
        std::cout << "  ./build/natopt_portfolio --config data/config/metaheuristic_config.json --verbose\n";
        std::cout << std::endl;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
