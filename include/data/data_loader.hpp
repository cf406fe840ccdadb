/**
 * @file data_loader.hpp
 * @brief Price loading and run configuration
 *
 * Loads historical prices from CSV files and the run configuration from
 * JSON. Both long tables (one row per date and ticker, as in the public
 * S&P 500 five-year dataset) and wide tables (one column per ticker) are
 * supported.
 */

#ifndef NATOPT_DATA_DATA_LOADER_HPP
#define NATOPT_DATA_DATA_LOADER_HPP

#include "market_data.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace natopt
{

    /**
     * @struct DataConfig
     * @brief Where the prices come from and which assets are kept
     */
    struct DataConfig
    {
        std::string data_file;             ///< Path to price CSV
        std::string format;                ///< "auto", "long" or "wide"
        std::string date_column;           ///< Long format: date column name
        std::string ticker_column;         ///< Long format: ticker column name
        std::string price_column;          ///< Long format: price column name
        std::string start_date;            ///< Optional inclusive start date
        std::string end_date;              ///< Optional inclusive end date
        std::vector<std::string> universe; ///< Tickers to load (all if empty)
        double min_coverage;               ///< Drop tickers quoted on fewer dates
        int top_n_assets;                  ///< Assets kept by mean return

        static DataConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct RiskConfig
     * @brief Covariance estimation and Sharpe ratio settings
     */
    struct RiskConfig
    {
        bool bias_correction; ///< Bessel's correction for the covariance
        double risk_free_rate; ///< Per-period risk-free rate subtracted from return

        static RiskConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct EngineConfig
     * @brief One optimizer engine to run
     *
     * params is forwarded untouched to OptimizerFactory, which validates it
     * for the engine type.
     */
    struct EngineConfig
    {
        std::string type;       ///< bat, genetic, pso, grey_wolf
        int population_size;    ///< Members per population
        int generations;        ///< Fixed iteration budget
        nlohmann::json params;  ///< Engine-specific parameters

        static EngineConfig from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    /**
     * @struct SelectorConfig
     * @brief Repetition settings of the multi-run selector
     */
    struct SelectorConfig
    {
        int num_runs;        ///< Independent runs per engine
        bool has_seed;       ///< false: seed from std::random_device
        std::uint64_t seed;  ///< Base seed when has_seed

        static SelectorConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct OutputConfig
     * @brief Report export settings
     */
    struct OutputConfig
    {
        std::string directory; ///< Export directory
        bool export_results;   ///< Write CSV/JSON files

        static OutputConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct RunConfig
     * @brief Complete configuration of one optimization session
     */
    struct RunConfig
    {
        DataConfig data;
        RiskConfig risk;
        std::vector<EngineConfig> optimizers;
        SelectorConfig selector;
        OutputConfig output;

        /**
         * @brief Configuration with every section at its default
         */
        static RunConfig defaults();

        /**
         * @brief The four engines with their customary population sizes
         *
         * Bat 30, genetic 50, particle swarm 30, grey wolf 30, each for
         * 100 generations.
         */
        static std::vector<EngineConfig> default_engines();

        static RunConfig from_json(const nlohmann::json &j);
    };

    /**
     * @class DataLoader
     * @brief Loads prices and configuration
     */
    class DataLoader
    {
    public:
        // ========================================================================
        // CSV Loading
        // ========================================================================

        /**
         * @brief Load a long price table and pivot it to dates x tickers
         *
         * Expected format (column order free, located by header name):
         * date,open,high,low,close,volume,Name
         * 2013-02-08,15.07,15.12,14.63,14.75,8407500,AAL
         *
         * Dates and tickers are sorted; (date, ticker) pairs absent from the
         * file become NaN.
         *
         * @param filepath Path to CSV file
         * @param date_column Header of the date column
         * @param ticker_column Header of the ticker column
         * @param price_column Header of the price column
         * @param tickers Optional list of tickers to keep (all if empty)
         * @throws std::runtime_error if the file cannot be read, a column is
         *         missing or no valid row is found
         */
        static MarketData load_csv_long(const std::string &filepath,
                                        const std::string &date_column = "date",
                                        const std::string &ticker_column = "Name",
                                        const std::string &price_column = "close",
                                        const std::vector<std::string> &tickers = {});

        /**
         * @brief Load a wide price table
         *
         * Expected format:
         * date,AAPL,MSFT,JPM,...
         * 2020-01-01,150.0,200.0,120.0,...
         *
         * @throws std::runtime_error if file cannot be loaded
         */
        static MarketData load_csv_wide(const std::string &filepath,
                                        const std::vector<std::string> &tickers = {});

        /**
         * @brief Load prices as described by a DataConfig
         *
         * format "auto" picks the long layout when the header contains the
         * configured ticker and price columns, the wide layout otherwise.
         */
        static MarketData load_csv(const DataConfig &config);

        // ========================================================================
        // Configuration Loading
        // ========================================================================

        /**
         * @brief Load JSON file
         * @throws std::runtime_error if file cannot be opened or parsed
         */
        static nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load complete run configuration
         */
        static RunConfig load_config(const std::string &config_path);

        // ========================================================================
        // Synthetic Data
        // ========================================================================

        /**
         * @brief Generate geometric random-walk prices
         *
         * Each ticker draws its own drift in [0.5, 1.5] x drift and its own
         * volatility in [0.75, 1.25] x volatility so that assets differ in
         * mean return.
         *
         * @param tickers List of ticker symbols
         * @param num_days Number of trading days
         * @param start_date First date (YYYY-MM-DD)
         * @param volatility Base daily volatility
         * @param drift Base daily drift
         * @param seed Random seed
         */
        static MarketData generate_synthetic_data(
            const std::vector<std::string> &tickers,
            size_t num_days,
            const std::string &start_date = "2020-01-01",
            double volatility = 0.02,
            double drift = 0.0005,
            std::uint64_t seed = 42);

        /**
         * @brief Save market data as a long table (date,close,Name)
         * @throws std::runtime_error if the file cannot be written
         */
        static void save_csv_long(const MarketData &data, const std::string &filepath);
    };

} // namespace natopt

#endif // NATOPT_DATA_DATA_LOADER_HPP
