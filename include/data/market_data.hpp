/**
 * @file market_data.hpp
 * @brief Price panel of the asset universe before it becomes a ReturnMatrix
 *
 * Prices are kept exactly as loaded: one row per trading date, one column
 * per ticker, NaN wherever a ticker has no quote for a date (typically
 * before its listing or after its delisting in the five-year S&P 500 file).
 */

#ifndef NATOPT_DATA_MARKET_DATA_HPP
#define NATOPT_DATA_MARKET_DATA_HPP

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace natopt
{

    /**
     * @enum ReturnType
     * @brief Period return convention
     */
    enum class ReturnType
    {
        SIMPLE, ///< P_t / P_{t-1} - 1
        LOG     ///< log(P_t / P_{t-1})
    };

    /**
     * @class MarketData
     * @brief Dates x tickers price panel with ISO date labels
     *
     * Invariants:
     * - dates are ISO (YYYY-MM-DD) strings in strictly increasing order
     * - tickers are unique
     * - prices.rows() == dates.size(), prices.cols() == tickers.size()
     */
    class MarketData
    {
    public:
        /**
         * @param prices Price matrix (dates x tickers), NaN for no quote
         * @param dates Trading dates, strictly increasing
         * @param tickers Column labels, unique
         * @throws std::invalid_argument if an invariant does not hold
         */
        MarketData(const Eigen::MatrixXd &prices,
                   const std::vector<std::string> &dates,
                   const std::vector<std::string> &tickers);

        const Eigen::MatrixXd &get_prices() const { return prices_; }

        /**
         * @brief Price series of one ticker
         * @throws std::invalid_argument if the ticker is unknown
         */
        Eigen::VectorXd get_prices(const std::string &ticker) const;

        const std::vector<std::string> &get_dates() const { return dates_; }
        const std::vector<std::string> &get_tickers() const { return tickers_; }

        size_t num_dates() const { return static_cast<size_t>(prices_.rows()); }
        size_t num_assets() const { return static_cast<size_t>(prices_.cols()); }

        /**
         * @brief Period returns, one row per consecutive pair of dates
         *
         * Row i is the return from dates[i] to dates[i + 1]. The entry is
         * NaN when either price is missing or the earlier price is zero.
         *
         * @throws std::runtime_error with fewer than two dates
         */
        Eigen::MatrixXd calculate_returns(ReturnType type = ReturnType::SIMPLE) const;

        /**
         * @brief Dates within [start_date, end_date]
         *
         * Bounds need not be trading dates; an empty bound is open.
         *
         * @throws std::invalid_argument if start_date > end_date or no date
         *         falls inside the range
         */
        MarketData filter_by_date(const std::string &start_date,
                                  const std::string &end_date) const;

        /**
         * @brief Columns of the given tickers, in the given order
         * @throws std::invalid_argument if a ticker is unknown
         */
        MarketData select_assets(const std::vector<std::string> &selected_tickers) const;

        /**
         * @brief Carry the last quote forward over gaps
         *
         * Entries before a ticker's first quote stay NaN.
         */
        MarketData forward_fill() const;

        /**
         * @brief Fraction of dates with a quote, per ticker
         */
        Eigen::VectorXd coverage() const;

        /**
         * @brief Keep tickers quoted on at least min_coverage of the dates
         *
         * Every period in which any kept ticker lacks a return is later
         * dropped by ReturnMatrix::from_prices, so a single late listing
         * can cost years of history.
         *
         * @throws std::invalid_argument if min_coverage is outside [0, 1]
         *         or no ticker qualifies
         */
        MarketData drop_sparse_assets(double min_coverage) const;

        bool is_valid() const { return prices_.rows() > 0 && prices_.cols() > 0; }

        size_t count_missing() const;

        void print_summary() const;

    private:
        std::optional<Eigen::Index> ticker_column(const std::string &ticker) const;

        Eigen::MatrixXd prices_;
        std::vector<std::string> dates_;
        std::vector<std::string> tickers_;
        std::unordered_map<std::string, Eigen::Index> columns_; ///< Ticker to column
    };

} // namespace natopt

#endif // NATOPT_DATA_MARKET_DATA_HPP
