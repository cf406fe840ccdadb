/**
 * @file multi_run_selector.cpp
 * @brief Implementation of multi-run selection and reporting
 */

#include "optimizer/multi_run_selector.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace natopt
{
    namespace optimizer
    {

        namespace
        {
            void create_parent_directories(const std::string &filepath)
            {
                std::filesystem::path path(filepath);
                if (path.has_parent_path())
                {
                    std::filesystem::create_directories(path.parent_path());
                }
            }

            std::string asset_label(const std::vector<std::string> &tickers, Eigen::Index i)
            {
                if (static_cast<size_t>(i) < tickers.size())
                {
                    return tickers[static_cast<size_t>(i)];
                }
                return "asset_" + std::to_string(i);
            }
        } // namespace

        // ============================================================================
        // SelectionReport
        // ============================================================================

        SelectionReport::SelectionReport(std::vector<EngineSelection> selections)
            : selections_(std::move(selections))
        {
        }

        const EngineSelection &SelectionReport::overall_best() const
        {
            if (selections_.empty())
            {
                throw std::runtime_error("Selection report is empty");
            }

            std::vector<double> ratios;
            ratios.reserve(selections_.size());
            for (const auto &s : selections_)
            {
                ratios.push_back(s.best.sharpe_ratio);
            }
            return selections_[static_cast<size_t>(MultiRunSelector::select_best_run(ratios))];
        }

        void SelectionReport::check_tickers(const std::vector<std::string> &tickers) const
        {
            if (tickers.empty())
            {
                return;
            }

            for (const auto &s : selections_)
            {
                if (static_cast<size_t>(s.best.weights.size()) != tickers.size())
                {
                    throw std::invalid_argument(
                        "Ticker count (" + std::to_string(tickers.size()) +
                        ") does not match weights of " + s.engine + " (" +
                        std::to_string(s.best.weights.size()) + ")");
                }
            }
        }

        void SelectionReport::print_summary(const std::vector<std::string> &tickers, int top_k) const
        {
            std::cout << "\n=== Best Result per Engine ===\n";
            std::cout << std::left << std::setw(20) << "Engine"
                      << std::right << std::setw(10) << "Sharpe"
                      << std::setw(12) << "Return"
                      << std::setw(12) << "Volatility"
                      << std::setw(10) << "Run" << "\n";
            std::cout << std::string(64, '-') << "\n";

            for (const auto &s : selections_)
            {
                std::cout << std::left << std::setw(20) << s.engine
                          << std::right << std::fixed << std::setprecision(4)
                          << std::setw(10) << s.best.sharpe_ratio
                          << std::setw(11) << s.best.expected_return * 100 << "%"
                          << std::setw(11) << s.best.volatility * 100 << "%"
                          << std::setw(10) << (s.best_run + 1) << "\n";
            }

            for (const auto &s : selections_)
            {
                std::cout << "\n" << s.engine << " (population " << s.population_size
                          << ", " << s.generations << " generations)\n";

                std::cout << "  Run Sharpe ratios:";
                for (double ratio : s.run_sharpe_ratios)
                {
                    std::cout << " " << std::setprecision(4) << ratio;
                }
                std::cout << "\n";

                const Eigen::VectorXd &w = s.best.weights;
                std::vector<Eigen::Index> order(static_cast<size_t>(w.size()));
                std::iota(order.begin(), order.end(), Eigen::Index(0));
                std::stable_sort(order.begin(), order.end(), [&w](Eigen::Index a, Eigen::Index b)
                                 { return w(a) > w(b); });

                size_t shown = std::min(order.size(), static_cast<size_t>(std::max(top_k, 0)));
                std::cout << "  Top weights:\n";
                for (size_t k = 0; k < shown; ++k)
                {
                    std::cout << "    " << std::left << std::setw(10) << asset_label(tickers, order[k])
                              << std::right << std::setw(8) << std::setprecision(2)
                              << w(order[k]) * 100 << "%\n";
                }
            }

            if (!selections_.empty())
            {
                const EngineSelection &winner = overall_best();
                std::cout << "\nBest engine: " << winner.engine
                          << " (Sharpe " << std::setprecision(4) << winner.best.sharpe_ratio << ")\n";
            }
            std::cout << std::string(64, '=') << "\n";
        }

        void SelectionReport::export_histories_csv(const std::string &filepath) const
        {
            create_parent_directories(filepath);

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            size_t rows = 0;
            file << "generation";
            for (const auto &s : selections_)
            {
                file << "," << s.engine;
                rows = std::max(rows, s.best.history.size());
            }
            file << "\n";
            file << std::setprecision(10);

            for (size_t g = 0; g < rows; ++g)
            {
                file << (g + 1);
                for (const auto &s : selections_)
                {
                    file << ",";
                    if (g < s.best.history.size())
                    {
                        file << s.best.history[g];
                    }
                }
                file << "\n";
            }

            file.close();
        }

        void SelectionReport::export_weights_csv(const std::string &filepath,
                                                 const std::vector<std::string> &tickers) const
        {
            check_tickers(tickers);
            create_parent_directories(filepath);

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            Eigen::Index n = 0;
            file << "ticker";
            for (const auto &s : selections_)
            {
                file << "," << s.engine;
                n = std::max(n, s.best.weights.size());
            }
            file << "\n";
            file << std::fixed << std::setprecision(8);

            for (Eigen::Index i = 0; i < n; ++i)
            {
                file << asset_label(tickers, i);
                for (const auto &s : selections_)
                {
                    file << ",";
                    if (i < s.best.weights.size())
                    {
                        file << s.best.weights(i);
                    }
                }
                file << "\n";
            }

            file.close();
        }

        nlohmann::json SelectionReport::to_json(const std::vector<std::string> &tickers) const
        {
            check_tickers(tickers);

            nlohmann::json engines = nlohmann::json::array();
            for (const auto &s : selections_)
            {
                nlohmann::json entry = s.best.to_json();
                entry["population_size"] = s.population_size;
                entry["run_sharpe_ratios"] = s.run_sharpe_ratios;
                entry["best_run"] = s.best_run;
                if (!tickers.empty())
                {
                    nlohmann::json allocation = nlohmann::json::object();
                    for (size_t i = 0; i < tickers.size(); ++i)
                    {
                        allocation[tickers[i]] = s.best.weights(static_cast<Eigen::Index>(i));
                    }
                    entry["allocation"] = allocation;
                }
                engines.push_back(entry);
            }

            nlohmann::json j;
            j["engines"] = engines;
            if (!selections_.empty())
            {
                j["best_engine"] = overall_best().engine;
            }
            return j;
        }

        void SelectionReport::save_json(const std::string &filepath,
                                        const std::vector<std::string> &tickers) const
        {
            nlohmann::json j = to_json(tickers);
            create_parent_directories(filepath);

            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }
            file << j.dump(2) << "\n";
        }

        // ============================================================================
        // MultiRunSelector
        // ============================================================================

        MultiRunSelector::MultiRunSelector(int num_runs, std::uint64_t base_seed)
            : num_runs_(num_runs), base_seed_(base_seed)
        {
            if (num_runs_ <= 0)
            {
                throw std::invalid_argument(
                    "Number of runs must be positive, got: " + std::to_string(num_runs_));
            }
        }

        void MultiRunSelector::add_engine(std::unique_ptr<MetaheuristicOptimizer> engine,
                                          int population_size,
                                          int generations)
        {
            if (!engine)
            {
                throw std::invalid_argument("Cannot register a null engine");
            }

            if (population_size < engine->min_population_size())
            {
                throw std::invalid_argument(
                    engine->get_name() + " requires a population of at least " +
                    std::to_string(engine->min_population_size()) + ", got: " +
                    std::to_string(population_size));
            }

            if (generations < 0)
            {
                throw std::invalid_argument(
                    "Number of generations must be non-negative, got: " +
                    std::to_string(generations));
            }

            engines_.push_back(EngineEntry{std::move(engine), population_size, generations});
        }

        int MultiRunSelector::select_best_run(const std::vector<double> &ratios)
        {
            if (ratios.empty())
            {
                throw std::invalid_argument("No runs to select from");
            }

            int best = -1;
            for (size_t r = 0; r < ratios.size(); ++r)
            {
                if (!std::isfinite(ratios[r]))
                {
                    continue;
                }
                if (best < 0 || ratios[r] > ratios[static_cast<size_t>(best)])
                {
                    best = static_cast<int>(r);
                }
            }
            return best < 0 ? 0 : best;
        }

        SelectionReport MultiRunSelector::run(const SharpeObjective &objective, bool verbose) const
        {
            std::vector<EngineSelection> selections;
            selections.reserve(engines_.size());

            for (size_t e = 0; e < engines_.size(); ++e)
            {
                const EngineEntry &entry = engines_[e];

                if (verbose)
                {
                    std::cout << "  " << entry.engine->get_name() << " ("
                              << num_runs_ << " runs x " << entry.generations
                              << " generations, population " << entry.population_size << ")\n";
                }

                std::vector<HeuristicResult> results;
                results.reserve(static_cast<size_t>(num_runs_));
                std::vector<double> ratios;
                ratios.reserve(static_cast<size_t>(num_runs_));

                for (int r = 0; r < num_runs_; ++r)
                {
                    RandomEngine rng(derive_seed(base_seed_, e, static_cast<std::uint64_t>(r)));
                    HeuristicResult result = entry.engine->run(
                        objective, entry.population_size, entry.generations, rng);

                    if (verbose)
                    {
                        std::cout << "    run " << (r + 1) << "/" << num_runs_
                                  << ": Sharpe " << std::fixed << std::setprecision(4)
                                  << result.sharpe_ratio << "\n";
                    }

                    ratios.push_back(result.sharpe_ratio);
                    results.push_back(std::move(result));
                }

                EngineSelection selection;
                selection.engine = entry.engine->get_name();
                selection.population_size = entry.population_size;
                selection.generations = entry.generations;
                selection.best_run = select_best_run(ratios);
                selection.best = std::move(results[static_cast<size_t>(selection.best_run)]);
                selection.run_sharpe_ratios = std::move(ratios);

                selections.push_back(std::move(selection));
            }

            return SelectionReport(std::move(selections));
        }

    } // namespace optimizer
} // namespace natopt
