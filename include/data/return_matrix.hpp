/**
 * @file return_matrix.hpp
 * @brief Complete, immutable matrix of period returns
 *
 * The optimization core treats its input as a fixed-size numeric matrix
 * with no missing values. ReturnMatrix is that matrix plus the labels it
 * was built from. It is read-only once constructed and shared by every
 * engine of a run.
 */

#ifndef NATOPT_DATA_RETURN_MATRIX_HPP
#define NATOPT_DATA_RETURN_MATRIX_HPP

#include "data/market_data.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace natopt
{

    /**
     * @class ReturnMatrix
     * @brief T x N matrix of fractional returns, one column per asset.
     *
     * Invariants:
     * - no NaN or Inf entries
     * - at least one period and one asset
     * - dates.size() == periods, tickers.size() == assets
     *
     * Usage Example:
     * @code
     * auto prices = DataLoader::load_csv("prices.csv");
     * auto returns = ReturnMatrix::from_prices(prices).select_top_by_mean(10);
     * auto objective = optimizer::SharpeObjective::from_returns(returns.values());
     * @endcode
     */
    class ReturnMatrix
    {
    public:
        /**
         * @brief Construct from an already complete return matrix
         * @param values Returns (periods x assets)
         * @param dates Date label of each period (end date of the period)
         * @param tickers Asset labels
         * @throws std::invalid_argument on empty input, label mismatch or
         *         non-finite values
         */
        ReturnMatrix(const Eigen::MatrixXd &values,
                     const std::vector<std::string> &dates,
                     const std::vector<std::string> &tickers);

        /**
         * @brief Build simple returns from prices
         *
         * Prices are forward-filled, period-over-period simple returns
         * computed, and every period with a missing return in any asset is
         * dropped.
         *
         * @throws std::runtime_error if no complete period remains
         */
        static ReturnMatrix from_prices(const MarketData &prices);

        /**
         * @brief Keep the n assets with the highest mean return
         *
         * Columns are ordered by descending mean return; ties keep the
         * original column order. n larger than the number of assets keeps
         * all of them.
         *
         * @throws std::invalid_argument if n <= 0
         */
        ReturnMatrix select_top_by_mean(int n) const;

        /**
         * @brief Arithmetic mean of each asset column
         */
        Eigen::VectorXd mean_returns() const;

        const Eigen::MatrixXd &values() const { return values_; }
        const std::vector<std::string> &get_dates() const { return dates_; }
        const std::vector<std::string> &get_tickers() const { return tickers_; }

        Eigen::Index num_periods() const { return values_.rows(); }
        Eigen::Index num_assets() const { return values_.cols(); }

    private:
        Eigen::MatrixXd values_;
        std::vector<std::string> dates_;
        std::vector<std::string> tickers_;
    };

} // namespace natopt

#endif // NATOPT_DATA_RETURN_MATRIX_HPP
