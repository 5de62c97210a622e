// src/strategy/pairs_trading_signals.cpp

#include "quanttrade/strategy/pairs_trading_signals.hpp"
#include <cmath>
#include <limits>
#include "quanttrade/statistics/descriptive.hpp"

namespace quanttrade {

PairsTradingSignals::PairsTradingSignals(PairsTradingParams params) : params_(params) {}

Result<Eigen::MatrixXd> PairsTradingSignals::compute_raw_signals(const PricePanel& prices) const {
    if (prices.cols() < 2) {
        return make_error<Eigen::MatrixXd>(ErrorCode::INVALID_ARGUMENT,
                                           "Pairs trading requires at least two symbols, got " +
                                               std::to_string(prices.cols()),
                                           "PairsTradingSignals");
    }

    const Eigen::Index rows = static_cast<Eigen::Index>(prices.rows());
    Eigen::MatrixXd signals = Eigen::MatrixXd::Zero(rows, static_cast<Eigen::Index>(prices.cols()));

    std::vector<double> spread(prices.rows());
    for (size_t r = 0; r < prices.rows(); ++r) {
        spread[r] = std::log(prices.at(r, 0)) - std::log(prices.at(r, 1));
    }
    std::vector<double> spread_mean = statistics::rolling_mean(spread, params_.spread_window);
    std::vector<double> spread_std = statistics::rolling_std(spread, params_.spread_window);

    const double hold = std::numeric_limits<double>::quiet_NaN();
    for (size_t r = 0; r < spread.size(); ++r) {
        double z = hold;
        if (!std::isnan(spread_mean[r]) && !std::isnan(spread_std[r]) && spread_std[r] > 0.0) {
            z = (spread[r] - spread_mean[r]) / spread_std[r];
        }

        double leg_a = hold;
        if (z > params_.entry_threshold) {
            leg_a = -1.0;
        } else if (z < -params_.entry_threshold) {
            leg_a = 1.0;
        } else if (std::abs(z) < params_.exit_threshold) {
            leg_a = 0.0;
        }

        signals(static_cast<Eigen::Index>(r), 0) = leg_a;
        signals(static_cast<Eigen::Index>(r), 1) = std::isnan(leg_a) ? hold : -leg_a;
    }

    return signals;
}

}  // namespace quanttrade
