/**
 * @file multi_run_selector.hpp
 * @brief Repeated independent runs per engine and best-run selection
 *
 * Each registered engine runs num_runs times. Run r of engine e uses its own
 * RandomEngine seeded with derive_seed(base_seed, e, r), so the whole
 * session is reproducible from one base seed and no random state is shared
 * between runs or engines. Per engine the run with the highest Sharpe ratio
 * is kept; non-finite ratios never beat a finite one and ties keep the
 * earliest run.
 */

#pragma once

#include "optimizer/metaheuristic_optimizer.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace natopt
{
    namespace optimizer
    {

        /**
         * @struct EngineSelection
         * @brief Best of num_runs runs of one engine
         */
        struct EngineSelection
        {
            std::string engine;                   ///< Engine name
            int population_size = 0;              ///< Population per run
            int generations = 0;                  ///< Generations per run
            HeuristicResult best;                 ///< Result of the winning run
            std::vector<double> run_sharpe_ratios; ///< Sharpe ratio of every run
            int best_run = 0;                     ///< Index of the winning run
        };

        /**
         * @class SelectionReport
         * @brief Per-engine winners with console and file output
         */
        class SelectionReport
        {
        public:
            SelectionReport() = default;
            explicit SelectionReport(std::vector<EngineSelection> selections);

            const std::vector<EngineSelection> &selections() const { return selections_; }
            size_t size() const { return selections_.size(); }

            /**
             * @brief Engine with the highest finite Sharpe ratio
             * @throws std::runtime_error if the report is empty
             */
            const EngineSelection &overall_best() const;

            /**
             * @brief Print best ratios, run ratios and top weights per engine
             * @param tickers Asset names in weight order
             * @param top_k Number of largest weights shown per engine
             */
            void print_summary(const std::vector<std::string> &tickers, int top_k = 5) const;

            /**
             * @brief Write generation x engine convergence table
             *
             * Columns: generation, one per engine. Engines with a shorter
             * history leave trailing cells empty.
             *
             * @throws std::runtime_error if the file cannot be written
             */
            void export_histories_csv(const std::string &filepath) const;

            /**
             * @brief Write ticker x engine weight table
             * @throws std::invalid_argument if tickers do not match weights
             * @throws std::runtime_error if the file cannot be written
             */
            void export_weights_csv(const std::string &filepath,
                                    const std::vector<std::string> &tickers) const;

            nlohmann::json to_json(const std::vector<std::string> &tickers = {}) const;

            /**
             * @throws std::runtime_error if the file cannot be written
             */
            void save_json(const std::string &filepath,
                           const std::vector<std::string> &tickers = {}) const;

        private:
            void check_tickers(const std::vector<std::string> &tickers) const;

            std::vector<EngineSelection> selections_;
        };

        /**
         * @class MultiRunSelector
         * @brief Runs every registered engine several times and keeps the best
         *
         * Usage Example:
         * @code
         * MultiRunSelector selector(5, 42);
         * selector.add_engine(OptimizerFactory::create("bat", {}), 30, 100);
         * selector.add_engine(OptimizerFactory::create("gwo", {}), 30, 100);
         * SelectionReport report = selector.run(objective);
         * report.print_summary(tickers);
         * @endcode
         */
        class MultiRunSelector
        {
        public:
            /**
             * @param num_runs Independent runs per engine (> 0)
             * @param base_seed Seed all run seeds are derived from
             * @throws std::invalid_argument if num_runs <= 0
             */
            MultiRunSelector(int num_runs, std::uint64_t base_seed);

            /**
             * @brief Register an engine with its run size
             * @throws std::invalid_argument if engine is null, population_size
             *         is below the engine minimum or generations is negative
             */
            void add_engine(std::unique_ptr<MetaheuristicOptimizer> engine,
                            int population_size,
                            int generations);

            /**
             * @brief Run every engine num_runs times
             * @param objective Shared objective
             * @param verbose Print per-run progress to std::cout
             * @return One selection per engine, in registration order
             */
            SelectionReport run(const SharpeObjective &objective, bool verbose = false) const;

            /**
             * @brief Index of the highest finite ratio, earliest on ties
             *
             * Returns 0 when no ratio is finite.
             * @throws std::invalid_argument if ratios is empty
             */
            static int select_best_run(const std::vector<double> &ratios);

            int num_runs() const { return num_runs_; }
            std::uint64_t base_seed() const { return base_seed_; }
            size_t num_engines() const { return engines_.size(); }

        private:
            struct EngineEntry
            {
                std::unique_ptr<MetaheuristicOptimizer> engine;
                int population_size;
                int generations;
            };

            int num_runs_;
            std::uint64_t base_seed_;
            std::vector<EngineEntry> engines_;
        };

    } // namespace optimizer
} // namespace natopt
