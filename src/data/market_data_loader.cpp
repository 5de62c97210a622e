// src/data/market_data_loader.cpp

#include "quanttrade/data/market_data_loader.hpp"
#include <cmath>
#include <limits>
#include <map>
#include <set>
#include "quanttrade/core/logger.hpp"
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {

MarketDataLoader::MarketDataLoader(std::shared_ptr<MarketDataService> service)
    : service_(std::move(service)) {
    Logger::register_component("MarketDataLoader");
}

Result<PriceSeries> MarketDataLoader::load_series(const std::string& symbol,
                                                  const Timestamp& start_date,
                                                  const Timestamp& end_date) const {
    if (!service_) {
        return make_error<PriceSeries>(ErrorCode::NOT_INITIALIZED,
                                       "No market data service configured", "MarketDataLoader");
    }

    auto raw = service_->get_historical_data(symbol, start_date, end_date);
    if (raw.is_error()) {
        return forward_error<PriceSeries>(*raw.error());
    }

    // Last quote wins on duplicate dates
    std::map<Timestamp, double> by_date;
    for (const auto& point : raw.value()) {
        if (point.first < start_date || point.first > end_date) {
            continue;
        }
        if (!std::isfinite(point.second) || point.second <= 0.0) {
            continue;
        }
        by_date[point.first] = point.second;
    }

    if (by_date.empty()) {
        return make_error<PriceSeries>(ErrorCode::NO_MARKET_DATA,
                                       "No market data for " + symbol, "MarketDataLoader");
    }

    return PriceSeries(by_date.begin(), by_date.end());
}

Result<PricePanel> MarketDataLoader::load_price_panel(const std::vector<std::string>& symbols,
                                                      const Timestamp& start_date,
                                                      const Timestamp& end_date) const {
    std::vector<std::string> loaded_symbols;
    std::vector<PriceSeries> loaded_series;
    std::set<std::string> requested;

    for (const auto& symbol : symbols) {
        if (!requested.insert(symbol).second) {
            continue;
        }
        auto series = load_series(symbol, start_date, end_date);
        if (series.is_error()) {
            WARN("Skipping " << symbol << ": " << series.error()->what());
            continue;
        }
        loaded_symbols.push_back(symbol);
        loaded_series.push_back(series.take_value());
    }

    if (loaded_symbols.empty()) {
        return make_error<PricePanel>(ErrorCode::NO_MARKET_DATA, "No market data available",
                                      "MarketDataLoader");
    }

    std::set<Timestamp> index;
    for (const auto& series : loaded_series) {
        for (const auto& point : series) {
            index.insert(point.first);
        }
    }
    std::vector<Timestamp> all_dates(index.begin(), index.end());
    std::map<Timestamp, size_t> row_of;
    for (size_t i = 0; i < all_dates.size(); ++i) {
        row_of[all_dates[i]] = i;
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    Eigen::MatrixXd raw = Eigen::MatrixXd::Constant(static_cast<Eigen::Index>(all_dates.size()),
                                                    static_cast<Eigen::Index>(loaded_symbols.size()),
                                                    nan);
    for (size_t c = 0; c < loaded_series.size(); ++c) {
        for (const auto& point : loaded_series[c]) {
            raw(static_cast<Eigen::Index>(row_of[point.first]), static_cast<Eigen::Index>(c)) =
                point.second;
        }
    }

    // Forward-fill each column
    for (Eigen::Index c = 0; c < raw.cols(); ++c) {
        for (Eigen::Index r = 1; r < raw.rows(); ++r) {
            if (std::isnan(raw(r, c))) {
                raw(r, c) = raw(r - 1, c);
            }
        }
    }

    std::vector<Timestamp> dates;
    std::vector<Eigen::Index> keep;
    for (Eigen::Index r = 0; r < raw.rows(); ++r) {
        if (!raw.row(r).array().isNaN().any()) {
            keep.push_back(r);
            dates.push_back(all_dates[static_cast<size_t>(r)]);
        }
    }

    if (keep.empty()) {
        return make_error<PricePanel>(ErrorCode::NO_MARKET_DATA, "No market data available",
                                      "MarketDataLoader");
    }

    Eigen::MatrixXd values(static_cast<Eigen::Index>(keep.size()), raw.cols());
    for (size_t i = 0; i < keep.size(); ++i) {
        values.row(static_cast<Eigen::Index>(i)) = raw.row(keep[i]);
    }

    INFO("Loaded " << dates.size() << " rows for " << loaded_symbols.size() << " of "
                   << requested.size() << " symbols (" << core::format_date(dates.front())
                   << " to " << core::format_date(dates.back()) << ")");

    return PricePanel::create(std::move(dates), std::move(loaded_symbols), std::move(values));
}

}  // namespace quanttrade
