/**
 * @file market_data.cpp
 * @brief Implementation of MarketData
 */

#include "data/market_data.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace natopt
{

    MarketData::MarketData(const Eigen::MatrixXd &prices,
                           const std::vector<std::string> &dates,
                           const std::vector<std::string> &tickers)
        : prices_(prices), dates_(dates), tickers_(tickers)
    {
        if (prices_.rows() != static_cast<Eigen::Index>(dates_.size()))
        {
            throw std::invalid_argument(
                "Price panel has " + std::to_string(prices_.rows()) + " rows but " +
                std::to_string(dates_.size()) + " dates");
        }
        if (prices_.cols() != static_cast<Eigen::Index>(tickers_.size()))
        {
            throw std::invalid_argument(
                "Price panel has " + std::to_string(prices_.cols()) + " columns but " +
                std::to_string(tickers_.size()) + " tickers");
        }

        for (size_t i = 1; i < dates_.size(); ++i)
        {
            if (!(dates_[i - 1] < dates_[i]))
            {
                throw std::invalid_argument(
                    "Dates must be strictly increasing: " + dates_[i - 1] + " then " + dates_[i]);
            }
        }

        columns_.reserve(tickers_.size());
        for (size_t j = 0; j < tickers_.size(); ++j)
        {
            if (!columns_.emplace(tickers_[j], static_cast<Eigen::Index>(j)).second)
            {
                throw std::invalid_argument("Duplicate ticker: " + tickers_[j]);
            }
        }
    }

    std::optional<Eigen::Index> MarketData::ticker_column(const std::string &ticker) const
    {
        auto it = columns_.find(ticker);
        if (it == columns_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    Eigen::VectorXd MarketData::get_prices(const std::string &ticker) const
    {
        std::optional<Eigen::Index> column = ticker_column(ticker);
        if (!column)
        {
            throw std::invalid_argument("Ticker not found: " + ticker);
        }
        return prices_.col(*column);
    }

    Eigen::MatrixXd MarketData::calculate_returns(ReturnType type) const
    {
        if (prices_.rows() < 2)
        {
            throw std::runtime_error("Need at least 2 price observations to calculate returns");
        }

        const Eigen::Index periods = prices_.rows() - 1;
        Eigen::ArrayXXd previous = prices_.topRows(periods).array();
        Eigen::ArrayXXd ratio = prices_.bottomRows(periods).array() / previous;

        // NaN quotes propagate through the division on their own
        Eigen::ArrayXXd returns = type == ReturnType::SIMPLE ? Eigen::ArrayXXd(ratio - 1.0)
                                                             : Eigen::ArrayXXd(ratio.log());

        return (previous == 0.0).select(std::numeric_limits<double>::quiet_NaN(), returns).matrix();
    }

    MarketData MarketData::filter_by_date(const std::string &start_date,
                                          const std::string &end_date) const
    {
        if (!start_date.empty() && !end_date.empty() && end_date < start_date)
        {
            throw std::invalid_argument(
                "Start date " + start_date + " is after end date " + end_date);
        }

        auto first = start_date.empty()
                         ? dates_.begin()
                         : std::lower_bound(dates_.begin(), dates_.end(), start_date);
        auto last = end_date.empty()
                        ? dates_.end()
                        : std::upper_bound(dates_.begin(), dates_.end(), end_date);

        if (first >= last)
        {
            throw std::invalid_argument(
                "No trading date between '" + start_date + "' and '" + end_date + "'");
        }

        const Eigen::Index offset = static_cast<Eigen::Index>(first - dates_.begin());
        const Eigen::Index count = static_cast<Eigen::Index>(last - first);

        return MarketData(prices_.middleRows(offset, count),
                          std::vector<std::string>(first, last),
                          tickers_);
    }

    MarketData MarketData::select_assets(const std::vector<std::string> &selected_tickers) const
    {
        Eigen::MatrixXd selected(prices_.rows(), static_cast<Eigen::Index>(selected_tickers.size()));

        for (size_t k = 0; k < selected_tickers.size(); ++k)
        {
            std::optional<Eigen::Index> column = ticker_column(selected_tickers[k]);
            if (!column)
            {
                throw std::invalid_argument("Ticker not found: " + selected_tickers[k]);
            }
            selected.col(static_cast<Eigen::Index>(k)) = prices_.col(*column);
        }

        return MarketData(selected, dates_, selected_tickers);
    }

    MarketData MarketData::forward_fill() const
    {
        Eigen::MatrixXd filled = prices_;

        for (Eigen::Index j = 0; j < filled.cols(); ++j)
        {
            for (Eigen::Index i = 1; i < filled.rows(); ++i)
            {
                if (std::isnan(filled(i, j)))
                {
                    filled(i, j) = filled(i - 1, j);
                }
            }
        }

        return MarketData(filled, dates_, tickers_);
    }

    Eigen::VectorXd MarketData::coverage() const
    {
        if (prices_.rows() == 0)
        {
            return Eigen::VectorXd::Zero(prices_.cols());
        }

        Eigen::VectorXd quoted = (!prices_.array().isNaN()).cast<double>().colwise().sum().transpose();
        return quoted / static_cast<double>(prices_.rows());
    }

    MarketData MarketData::drop_sparse_assets(double min_coverage) const
    {
        if (!(min_coverage >= 0.0 && min_coverage <= 1.0))
        {
            throw std::invalid_argument(
                "Minimum coverage must be in [0, 1], got: " + std::to_string(min_coverage));
        }

        Eigen::VectorXd share = coverage();
        std::vector<std::string> kept;
        for (size_t j = 0; j < tickers_.size(); ++j)
        {
            if (share(static_cast<Eigen::Index>(j)) >= min_coverage)
            {
                kept.push_back(tickers_[j]);
            }
        }

        if (kept.empty())
        {
            throw std::invalid_argument(
                "No ticker is quoted on at least " + std::to_string(min_coverage * 100.0) +
                "% of the dates");
        }

        return select_assets(kept);
    }

    size_t MarketData::count_missing() const
    {
        return static_cast<size_t>(prices_.array().isNaN().count());
    }

    void MarketData::print_summary() const
    {
        std::cout << "\n=== Market Data Summary ===\n";
        std::cout << "Dimensions: " << prices_.rows() << " dates x "
                  << prices_.cols() << " assets\n";
        if (!dates_.empty())
        {
            std::cout << "Date range: " << dates_.front() << " to " << dates_.back() << "\n";
        }
        std::cout << "Missing values: " << count_missing() << "\n";

        if (prices_.cols() > 0 && prices_.rows() > 0)
        {
            Eigen::VectorXd share = coverage();
            Eigen::Index sparsest = 0;
            double lowest = share.minCoeff(&sparsest);
            std::cout << "Lowest coverage: " << tickers_[static_cast<size_t>(sparsest)]
                      << " (" << std::fixed << std::setprecision(1) << lowest * 100.0 << "%)\n";
        }
        std::cout << "==========================\n"
                  << std::endl;
    }

} // namespace natopt
