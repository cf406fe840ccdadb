/**
 * @file main.cpp
 * @brief Main entry point for the Nature-Inspired Portfolio Optimizer
 *
 * Command-line application that loads configuration and price data, keeps
 * the assets with the highest mean return, runs every configured
 * metaheuristic several times and reports the best Sharpe ratio portfolio
 * found by each engine.
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "data/return_matrix.hpp"
#include "optimizer/multi_run_selector.hpp"
#include "optimizer/optimizer_factory.hpp"
#include "optimizer/random_source.hpp"
#include "optimizer/sharpe_objective.hpp"
#include "risk/sample_covariance.hpp"
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

using namespace natopt;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Nature-Inspired Portfolio Optimizer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required unless --synthetic)\n"
              << "  --top-n N             Number of assets kept by mean return\n"
              << "  --runs N              Independent runs per engine\n"
              << "  --seed S              Base random seed (default: random_device)\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --synthetic           Use generated prices instead of the data file\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/metaheuristic_config.json --top-n 10\n"
              << "  " << program_name << " --synthetic --seed 42 --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Nature-Inspired Portfolio Optimizer v1.0.0              \n"
              << "       Bat / Genetic / Particle Swarm / Grey Wolf              \n"
              << "       Maximum Sharpe Ratio on the Simplex                     \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir;
    int top_n = -1;
    int num_runs = -1;
    bool has_seed = false;
    std::uint64_t seed = 0;
    bool synthetic = false;
    bool verbose = false;
    bool show_help = false;

    /**
     * @throws std::invalid_argument or std::out_of_range on a malformed number
     */
    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--top-n" && i + 1 < argc)
            {
                args.top_n = std::stoi(argv[++i]);
            }
            else if (arg == "--runs" && i + 1 < argc)
            {
                args.num_runs = std::stoi(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc)
            {
                args.seed = optimizer::parse_seed(argv[++i]);
                args.has_seed = true;
            }
            else if (arg == "--synthetic")
            {
                args.synthetic = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && (!config_path.empty() || synthetic);
    }
};

/**
 * @brief Apply command-line overrides on top of the file configuration
 */
void apply_overrides(const CommandLineArgs &args, RunConfig &config)
{
    if (args.top_n > 0)
    {
        config.data.top_n_assets = args.top_n;
    }
    if (args.num_runs > 0)
    {
        config.selector.num_runs = args.num_runs;
    }
    if (args.has_seed)
    {
        config.selector.has_seed = true;
        config.selector.seed = args.seed;
    }
    if (!args.output_dir.empty())
    {
        config.output.directory = args.output_dir;
    }
}

/**
 * @brief Generated universe used by --synthetic
 */
MarketData make_synthetic_market(const RunConfig &config)
{
    std::vector<std::string> tickers = config.data.universe;
    if (tickers.empty())
    {
        for (int i = 1; i <= 20; ++i)
        {
            std::string suffix = (i < 10 ? "0" : "") + std::to_string(i);
            tickers.push_back("SYN" + suffix);
        }
    }

    std::uint64_t seed = config.selector.has_seed ? config.selector.seed : 42;
    return DataLoader::generate_synthetic_data(tickers, 1260, "2013-02-08", 0.02, 0.0005, seed);
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/5] Loading configuration..." << std::endl;

        RunConfig config = args.config_path.empty()
                               ? RunConfig::defaults()
                               : DataLoader::load_config(args.config_path);
        apply_overrides(args, config);

        if (!config.selector.has_seed)
        {
            config.selector.seed = optimizer::seed_from_device();
            config.selector.has_seed = true;
        }

        if (args.verbose)
        {
            std::cout << "  - Data file: " << (args.synthetic ? "<synthetic>" : config.data.data_file) << "\n";
            std::cout << "  - Top assets: " << config.data.top_n_assets << "\n";
            std::cout << "  - Runs per engine: " << config.selector.num_runs << "\n";
            std::cout << "  - Base seed: " << config.selector.seed << "\n";
            std::cout << "  - Engines:";
            for (const auto &engine : config.optimizers)
            {
                std::cout << " " << engine.type;
            }
            std::cout << "\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/5] Loading market data..." << std::endl;

        MarketData data = args.synthetic ? make_synthetic_market(config)
                                         : DataLoader::load_csv(config.data);

        if (!config.data.start_date.empty() || !config.data.end_date.empty())
        {
            data = data.filter_by_date(config.data.start_date, config.data.end_date);
        }

        if (config.data.min_coverage > 0.0)
        {
            size_t before = data.num_assets();
            data = data.drop_sparse_assets(config.data.min_coverage);
            if (args.verbose)
            {
                std::cout << "  - Dropped " << (before - data.num_assets())
                          << " assets quoted on less than " << config.data.min_coverage * 100.0
                          << "% of dates\n";
            }
        }

        std::cout << "  - Loaded " << data.num_dates() << " dates, "
                  << data.num_assets() << " assets" << std::endl;

        if (args.verbose)
        {
            data.print_summary();
        }

        // ====================================================================
        // 3. Prepare Returns
        // ====================================================================
        std::cout << "[3/5] Calculating returns..." << std::endl;

        ReturnMatrix all_returns = ReturnMatrix::from_prices(data);
        ReturnMatrix returns = all_returns.select_top_by_mean(config.data.top_n_assets);
        const std::vector<std::string> &tickers = returns.get_tickers();

        std::cout << "  - " << returns.num_periods() << " return periods, keeping top "
                  << returns.num_assets() << " of " << all_returns.num_assets()
                  << " assets by mean return" << std::endl;

        if (args.verbose)
        {
            Eigen::VectorXd means = returns.mean_returns();

            std::cout << "\n  Selected Assets (Daily):\n";
            std::cout << "  " << std::string(30, '-') << "\n";
            for (size_t i = 0; i < tickers.size(); ++i)
            {
                std::cout << "  " << std::setw(8) << std::left << tickers[i]
                          << std::right << std::setw(11) << std::fixed << std::setprecision(4)
                          << means(static_cast<Eigen::Index>(i)) * 100 << "%\n";
            }
            std::cout << "  " << std::string(30, '-') << "\n";
        }

        // ====================================================================
        // 4. Risk Model Estimation
        // ====================================================================
        std::cout << "[4/5] Estimating risk model..." << std::endl;

        risk::SampleCovariance risk_model(config.risk.bias_correction);
        optimizer::SharpeObjective objective = optimizer::SharpeObjective::from_returns(
            returns.values(), risk_model, config.risk.risk_free_rate);

        double min_eigenvalue = objective.min_eigenvalue();
        if (min_eigenvalue <= 0.0)
        {
            std::cerr << "Warning: covariance matrix is singular or indefinite (min eigenvalue: "
                      << std::scientific << std::setprecision(3) << min_eigenvalue
                      << "); degenerate portfolios will be skipped" << std::endl;
        }

        if (args.verbose)
        {
            std::cout << "  - Risk model: " << risk_model.get_name() << "\n";
            std::cout << "  - Covariance matrix: " << objective.covariance().rows()
                      << "x" << objective.covariance().cols() << "\n";
            std::cout << "  - Min eigenvalue: " << std::scientific
                      << std::setprecision(3) << min_eigenvalue << "\n";

            // Correlation needs every asset to have positive variance
            const Eigen::MatrixXd &covariance = objective.covariance();
            if (covariance.rows() > 1 && covariance.diagonal().minCoeff() > 0.0)
            {
                Eigen::MatrixXd correlation = risk::RiskModel::covariance_to_correlation(covariance);
                const Eigen::Index n = correlation.rows();

                Eigen::Index top_i = 0;
                Eigen::Index top_j = 1;
                double pair_sum = 0.0;
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    for (Eigen::Index j = i + 1; j < n; ++j)
                    {
                        pair_sum += correlation(i, j);
                        if (correlation(i, j) > correlation(top_i, top_j))
                        {
                            top_i = i;
                            top_j = j;
                        }
                    }
                }

                const auto &tickers = returns.get_tickers();
                std::cout << "  - Mean pairwise correlation: " << std::fixed << std::setprecision(3)
                          << pair_sum / static_cast<double>(n * (n - 1) / 2) << "\n";
                std::cout << "  - Most correlated pair: " << tickers[static_cast<size_t>(top_i)]
                          << "/" << tickers[static_cast<size_t>(top_j)] << " ("
                          << correlation(top_i, top_j) << ")\n";
            }
        }

        // ====================================================================
        // 5. Metaheuristic Optimization
        // ====================================================================
        std::cout << "[5/5] Running metaheuristic optimizers..." << std::endl;

        optimizer::MultiRunSelector selector(config.selector.num_runs, config.selector.seed);
        for (const auto &engine : config.optimizers)
        {
            selector.add_engine(optimizer::OptimizerFactory::create(engine),
                                engine.population_size,
                                engine.generations);
        }

        optimizer::SelectionReport report = selector.run(objective, args.verbose);
        report.print_summary(tickers);

        if (config.output.export_results)
        {
            std::string history_file = config.output.directory + "/convergence_history.csv";
            std::string weights_file = config.output.directory + "/best_weights.csv";
            std::string report_file = config.output.directory + "/selection_report.json";

            report.export_histories_csv(history_file);
            report.export_weights_csv(weights_file, tickers);
            report.save_json(report_file, tickers);

            std::cout << "\n  Convergence history exported to: " << history_file << "\n";
            std::cout << "  Best weights exported to: " << weights_file << "\n";
            std::cout << "  Report exported to: " << report_file << "\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Optimization completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
