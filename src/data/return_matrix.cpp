/**
 * @file return_matrix.cpp
 * @brief Implementation of ReturnMatrix
 */

#include "data/return_matrix.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace natopt
{

    ReturnMatrix::ReturnMatrix(const Eigen::MatrixXd &values,
                               const std::vector<std::string> &dates,
                               const std::vector<std::string> &tickers)
        : values_(values), dates_(dates), tickers_(tickers)
    {
        if (values_.rows() == 0 || values_.cols() == 0)
        {
            throw std::invalid_argument("Return matrix cannot be empty");
        }
        if (values_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument(
                "Return matrix has " + std::to_string(values_.rows()) +
                " periods but " + std::to_string(dates_.size()) + " dates");
        }
        if (values_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument(
                "Return matrix has " + std::to_string(values_.cols()) +
                " assets but " + std::to_string(tickers_.size()) + " tickers");
        }
        if (!values_.allFinite())
        {
            throw std::invalid_argument("Return matrix contains NaN or Inf values");
        }
    }

    ReturnMatrix ReturnMatrix::from_prices(const MarketData &prices)
    {
        MarketData filled = prices.forward_fill();
        Eigen::MatrixXd raw = filled.calculate_returns(ReturnType::SIMPLE);
        const auto &dates = filled.get_dates();

        // Keep only periods where every asset has a return
        std::vector<Eigen::Index> complete_rows;
        for (Eigen::Index i = 0; i < raw.rows(); ++i)
        {
            if (raw.row(i).allFinite())
            {
                complete_rows.push_back(i);
            }
        }

        if (complete_rows.empty())
        {
            throw std::runtime_error("No period has a complete set of returns");
        }

        Eigen::MatrixXd values(complete_rows.size(), raw.cols());
        std::vector<std::string> kept_dates;
        kept_dates.reserve(complete_rows.size());

        for (size_t k = 0; k < complete_rows.size(); ++k)
        {
            values.row(k) = raw.row(complete_rows[k]);
            kept_dates.push_back(dates[complete_rows[k] + 1]);
        }

        return ReturnMatrix(values, kept_dates, filled.get_tickers());
    }

    ReturnMatrix ReturnMatrix::select_top_by_mean(int n) const
    {
        if (n <= 0)
        {
            throw std::invalid_argument(
                "Number of assets to keep must be positive, got: " + std::to_string(n));
        }

        Eigen::VectorXd means = mean_returns();
        std::vector<Eigen::Index> order(values_.cols());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(),
                         [&means](Eigen::Index a, Eigen::Index b)
                         { return means(a) > means(b); });

        const size_t keep = std::min(order.size(), static_cast<size_t>(n));

        Eigen::MatrixXd selected(values_.rows(), keep);
        std::vector<std::string> selected_tickers;
        selected_tickers.reserve(keep);

        for (size_t k = 0; k < keep; ++k)
        {
            selected.col(k) = values_.col(order[k]);
            selected_tickers.push_back(tickers_[order[k]]);
        }

        return ReturnMatrix(selected, dates_, selected_tickers);
    }

    Eigen::VectorXd ReturnMatrix::mean_returns() const
    {
        return values_.colwise().mean().transpose();
    }

} // namespace natopt
