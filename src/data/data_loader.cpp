/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader and configuration structures
 */

#include "data/data_loader.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace natopt
{

    // ==========================================
    // Anonymous namespace: CSV and date helpers
    // ==========================================

    namespace
    {

        /**
         * @brief One (date, ticker, price) row of a long table
         */
        struct PriceQuote
        {
            std::string date;
            std::string ticker;
            double price;
        };

        std::string strip(const std::string &text)
        {
            auto is_space = [](unsigned char c)
            { return std::isspace(c) != 0; };

            auto first = std::find_if_not(text.begin(), text.end(), is_space);
            auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
            return first < last ? std::string(first, last) : std::string();
        }

        /**
         * @brief Stripped fields of one CSV record
         *
         * Commas inside double quotes do not split, and a doubled quote
         * inside a quoted field is a literal quote.
         */
        std::vector<std::string> split_record(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string current;
            bool quoted = false;

            for (size_t i = 0; i < line.size(); ++i)
            {
                const char c = line[i];
                if (c == '"')
                {
                    if (quoted && i + 1 < line.size() && line[i + 1] == '"')
                    {
                        current += '"';
                        ++i;
                    }
                    else
                    {
                        quoted = !quoted;
                    }
                }
                else if (c == ',' && !quoted)
                {
                    fields.push_back(strip(current));
                    current.clear();
                }
                else
                {
                    current += c;
                }
            }

            fields.push_back(strip(current));
            return fields;
        }

        std::ifstream open_csv(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }
            return file;
        }

        std::vector<std::string> read_header(std::istream &in, const std::string &filepath)
        {
            std::string line;
            if (!std::getline(in, line) || strip(line).empty())
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }
            return split_record(line);
        }

        size_t column_index(const std::vector<std::string> &header,
                            const std::string &name,
                            const std::string &filepath)
        {
            auto it = std::find(header.begin(), header.end(), name);
            if (it == header.end())
            {
                throw std::runtime_error("Column '" + name + "' not found in " + filepath);
            }
            return static_cast<size_t>(it - header.begin());
        }

        // YYYY-MM-DD
        bool is_iso_date(const std::string &text)
        {
            static const std::string layout = "dddd-dd-dd";
            if (text.size() != layout.size())
                return false;

            for (size_t i = 0; i < layout.size(); ++i)
            {
                const bool ok = layout[i] == 'd' ? std::isdigit(static_cast<unsigned char>(text[i])) != 0
                                                 : text[i] == layout[i];
                if (!ok)
                    return false;
            }
            return true;
        }

        /**
         * @brief Price of a CSV field, NaN when empty, malformed or not finite
         */
        double parse_price(const std::string &field)
        {
            if (field.empty())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            char *end = nullptr;
            const double value = std::strtod(field.c_str(), &end);
            if (end != field.c_str() + field.size() || !std::isfinite(value))
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }

        void sort_unique(std::vector<std::string> &values)
        {
            std::sort(values.begin(), values.end());
            values.erase(std::unique(values.begin(), values.end()), values.end());
        }

        std::unordered_map<std::string, Eigen::Index> positions(const std::vector<std::string> &keys)
        {
            std::unordered_map<std::string, Eigen::Index> index;
            index.reserve(keys.size());
            for (size_t k = 0; k < keys.size(); ++k)
            {
                index.emplace(keys[k], static_cast<Eigen::Index>(k));
            }
            return index;
        }

        /**
         * @brief The first count calendar days from start_date, as YYYY-MM-DD
         * @throws std::invalid_argument if start_date is not YYYY-MM-DD
         */
        std::vector<std::string> calendar_dates(const std::string &start_date, size_t count)
        {
            std::tm day = {};
            std::istringstream in(start_date);
            in >> std::get_time(&day, "%Y-%m-%d");
            if (in.fail() || !is_iso_date(start_date))
            {
                throw std::invalid_argument("Invalid start date: " + start_date);
            }

            // Noon keeps mktime clear of daylight saving transitions
            day.tm_hour = 12;
            day.tm_isdst = -1;

            std::vector<std::string> dates;
            dates.reserve(count);
            char buffer[11];
            for (size_t i = 0; i < count; ++i)
            {
                std::mktime(&day);
                std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &day);
                dates.emplace_back(buffer);
                ++day.tm_mday;
            }
            return dates;
        }

    } // namespace

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.data_file = j.value("data_file", "data/market/all_stocks_5yr.csv");
        config.format = j.value("format", "auto");
        config.date_column = j.value("date_column", "date");
        config.ticker_column = j.value("ticker_column", "Name");
        config.price_column = j.value("price_column", "close");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");
        config.universe = j.value("universe", std::vector<std::string>{});
        config.min_coverage = j.value("min_coverage", 0.0);
        config.top_n_assets = j.value("top_n_assets", 10);
        return config;
    }

    RiskConfig RiskConfig::from_json(const nlohmann::json &j)
    {
        RiskConfig config;
        config.bias_correction = j.value("bias_correction", true);
        config.risk_free_rate = j.value("risk_free_rate", 0.0);
        return config;
    }

    EngineConfig EngineConfig::from_json(const nlohmann::json &j)
    {
        if (!j.contains("type") || !j["type"].is_string())
        {
            throw std::invalid_argument("Optimizer configuration must specify 'type'");
        }

        EngineConfig config;
        config.type = j["type"].get<std::string>();
        config.population_size = j.value("population_size", 30);
        config.generations = j.value("generations", 100);
        config.params = j.value("params", nlohmann::json::object());
        return config;
    }

    nlohmann::json EngineConfig::to_json() const
    {
        return nlohmann::json{
            {"type", type},
            {"population_size", population_size},
            {"generations", generations},
            {"params", params}};
    }

    SelectorConfig SelectorConfig::from_json(const nlohmann::json &j)
    {
        SelectorConfig config;
        config.num_runs = j.value("num_runs", 5);
        config.has_seed = j.contains("seed") && !j["seed"].is_null();
        config.seed = 0;
        if (config.has_seed)
        {
            // Negative or non-integer seeds are rejected
            const nlohmann::json &seed = j["seed"];
            if (!seed.is_number_integer() ||
                (!seed.is_number_unsigned() && seed.get<std::int64_t>() < 0))
            {
                throw std::invalid_argument("selector.seed must be a non-negative integer, got: " +
                                            seed.dump());
            }
            config.seed = seed.get<std::uint64_t>();
        }
        return config;
    }

    OutputConfig OutputConfig::from_json(const nlohmann::json &j)
    {
        OutputConfig config;
        config.directory = j.value("directory", "results");
        config.export_results = j.value("export", true);
        return config;
    }

    RunConfig RunConfig::defaults()
    {
        return from_json(nlohmann::json::object());
    }

    std::vector<EngineConfig> RunConfig::default_engines()
    {
        std::vector<EngineConfig> engines;
        const std::vector<std::pair<std::string, int>> sizes = {
            {"bat", 30}, {"genetic", 50}, {"pso", 30}, {"grey_wolf", 30}};

        for (const auto &entry : sizes)
        {
            EngineConfig config;
            config.type = entry.first;
            config.population_size = entry.second;
            config.generations = 100;
            config.params = nlohmann::json::object();
            engines.push_back(config);
        }
        return engines;
    }

    RunConfig RunConfig::from_json(const nlohmann::json &j)
    {
        const nlohmann::json empty = nlohmann::json::object();

        RunConfig config;
        config.data = DataConfig::from_json(j.contains("data") ? j["data"] : empty);
        config.risk = RiskConfig::from_json(j.contains("risk_model") ? j["risk_model"] : empty);
        config.selector = SelectorConfig::from_json(j.contains("selector") ? j["selector"] : empty);
        config.output = OutputConfig::from_json(j.contains("output") ? j["output"] : empty);

        if (j.contains("optimizers"))
        {
            if (!j["optimizers"].is_array())
            {
                throw std::invalid_argument("'optimizers' must be an array");
            }
            for (const auto &entry : j["optimizers"])
            {
                config.optimizers.push_back(EngineConfig::from_json(entry));
            }
        }
        else
        {
            config.optimizers = default_engines();
        }

        return config;
    }

    // ============
    // CSV Loading
    // ============

    MarketData DataLoader::load_csv_long(const std::string &filepath,
                                         const std::string &date_column,
                                         const std::string &ticker_column,
                                         const std::string &price_column,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file = open_csv(filepath);
        const std::vector<std::string> header = read_header(file, filepath);

        const size_t date_idx = column_index(header, date_column, filepath);
        const size_t ticker_idx = column_index(header, ticker_column, filepath);
        const size_t price_idx = column_index(header, price_column, filepath);
        const size_t min_fields = std::max({date_idx, ticker_idx, price_idx}) + 1;

        const std::unordered_set<std::string> wanted(tickers.begin(), tickers.end());

        std::vector<PriceQuote> quotes;
        std::string line;
        while (std::getline(file, line))
        {
            std::vector<std::string> fields = split_record(line);
            if (fields.size() < min_fields)
                continue;

            PriceQuote quote{fields[date_idx], fields[ticker_idx], parse_price(fields[price_idx])};
            if (!is_iso_date(quote.date) || quote.ticker.empty())
                continue;
            if (!wanted.empty() && wanted.count(quote.ticker) == 0)
                continue;

            quotes.push_back(std::move(quote));
        }

        if (quotes.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        std::vector<std::string> dates;
        std::vector<std::string> symbols;
        dates.reserve(quotes.size());
        symbols.reserve(quotes.size());
        for (const PriceQuote &quote : quotes)
        {
            dates.push_back(quote.date);
            symbols.push_back(quote.ticker);
        }
        sort_unique(dates);
        sort_unique(symbols);

        const std::unordered_map<std::string, Eigen::Index> row_of = positions(dates);
        const std::unordered_map<std::string, Eigen::Index> col_of = positions(symbols);

        // Later rows for the same (date, ticker) overwrite earlier ones
        Eigen::MatrixXd prices = Eigen::MatrixXd::Constant(
            static_cast<Eigen::Index>(dates.size()), static_cast<Eigen::Index>(symbols.size()),
            std::numeric_limits<double>::quiet_NaN());
        for (const PriceQuote &quote : quotes)
        {
            prices(row_of.at(quote.date), col_of.at(quote.ticker)) = quote.price;
        }

        return MarketData(prices, dates, symbols);
    }

    MarketData DataLoader::load_csv_wide(const std::string &filepath,
                                         const std::vector<std::string> &tickers)
    {
        std::ifstream file = open_csv(filepath);
        const std::vector<std::string> header = read_header(file, filepath);

        if (header.front() != "date")
        {
            throw std::runtime_error("Wide CSV must start with 'date' column: " + filepath);
        }

        std::vector<size_t> source_columns;
        std::vector<std::string> symbols;
        for (size_t c = 1; c < header.size(); ++c)
        {
            if (tickers.empty() ||
                std::find(tickers.begin(), tickers.end(), header[c]) != tickers.end())
            {
                source_columns.push_back(c);
                symbols.push_back(header[c]);
            }
        }

        if (symbols.empty())
        {
            throw std::runtime_error("None of the requested tickers is a column of " + filepath);
        }

        std::vector<std::string> dates;
        std::vector<double> flat; // row-major, one block of symbols.size() per date
        std::string line;
        while (std::getline(file, line))
        {
            std::vector<std::string> fields = split_record(line);
            if (!is_iso_date(fields.front()))
                continue;

            dates.push_back(fields.front());
            for (size_t c : source_columns)
            {
                flat.push_back(c < fields.size() ? parse_price(fields[c])
                                                 : std::numeric_limits<double>::quiet_NaN());
            }
        }

        if (dates.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
        Eigen::MatrixXd prices = Eigen::Map<const RowMajorMatrix>(
            flat.data(), static_cast<Eigen::Index>(dates.size()), static_cast<Eigen::Index>(symbols.size()));

        return MarketData(prices, dates, symbols);
    }

    MarketData DataLoader::load_csv(const DataConfig &config)
    {
        std::string format = config.format;
        std::transform(format.begin(), format.end(), format.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (format == "auto")
        {
            std::ifstream file = open_csv(config.data_file);
            const std::vector<std::string> header = read_header(file, config.data_file);

            auto has = [&header](const std::string &name)
            { return std::find(header.begin(), header.end(), name) != header.end(); };
            format = (has(config.ticker_column) && has(config.price_column)) ? "long" : "wide";
        }

        if (format == "long")
        {
            return load_csv_long(config.data_file, config.date_column, config.ticker_column,
                                 config.price_column, config.universe);
        }
        if (format == "wide")
        {
            return load_csv_wide(config.data_file, config.universe);
        }

        throw std::invalid_argument(
            "Unknown data format: '" + config.format + "'. Valid options: auto, long, wide");
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        try
        {
            return nlohmann::json::parse(file);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("JSON parsing error in " + filepath + ": " + e.what());
        }
    }

    RunConfig DataLoader::load_config(const std::string &config_path)
    {
        nlohmann::json j = load_json(config_path);

        try
        {
            return RunConfig::from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Invalid configuration in " + config_path + ": " + e.what());
        }
    }

    // ===========================
    // Synthetic Data Generation
    // ===========================

    MarketData DataLoader::generate_synthetic_data(
        const std::vector<std::string> &tickers,
        size_t num_days,
        const std::string &start_date,
        double volatility,
        double drift,
        std::uint64_t seed)
    {
        if (tickers.empty() || num_days == 0)
        {
            throw std::invalid_argument("Synthetic data needs at least one ticker and one day");
        }

        std::mt19937_64 gen(seed);
        std::uniform_real_distribution<double> drift_scale(0.5, 1.5);
        std::uniform_real_distribution<double> vol_scale(0.75, 1.25);
        std::normal_distribution<double> shock(0.0, 1.0);

        const Eigen::Index days = static_cast<Eigen::Index>(num_days);
        Eigen::MatrixXd prices(days, static_cast<Eigen::Index>(tickers.size()));
        for (Eigen::Index j = 0; j < prices.cols(); ++j)
        {
            const double asset_drift = drift * drift_scale(gen);
            const double asset_vol = volatility * vol_scale(gen);

            prices(0, j) = 100.0;
            for (Eigen::Index i = 1; i < days; ++i)
            {
                prices(i, j) = prices(i - 1, j) * (1.0 + asset_drift + asset_vol * shock(gen));
            }
        }

        return MarketData(prices, calendar_dates(start_date, num_days), tickers);
    }

    // ==================
    // Export
    // ==================

    void DataLoader::save_csv_long(const MarketData &data, const std::string &filepath)
    {
        std::filesystem::path path(filepath);
        if (path.has_parent_path())
        {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << "date,close,Name\n"
             << std::fixed << std::setprecision(6);

        const Eigen::MatrixXd &prices = data.get_prices();
        const std::vector<std::string> &dates = data.get_dates();
        const std::vector<std::string> &tickers = data.get_tickers();

        for (Eigen::Index i = 0; i < prices.rows(); ++i)
        {
            for (Eigen::Index j = 0; j < prices.cols(); ++j)
            {
                file << dates[static_cast<size_t>(i)] << ',' << prices(i, j) << ','
                     << tickers[static_cast<size_t>(j)] << '\n';
            }
        }
    }

} // namespace natopt
