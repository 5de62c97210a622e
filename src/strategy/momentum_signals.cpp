// src/strategy/momentum_signals.cpp

#include "quanttrade/strategy/momentum_signals.hpp"
#include <cmath>
#include "quanttrade/statistics/descriptive.hpp"

namespace quanttrade {

MomentumSignals::MomentumSignals(MomentumParams params) : params_(params) {}

Result<Eigen::MatrixXd> MomentumSignals::compute_raw_signals(const PricePanel& prices) const {
    Eigen::MatrixXd signals = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(prices.rows()),
                                                    static_cast<Eigen::Index>(prices.cols()));

    for (size_t c = 0; c < prices.cols(); ++c) {
        std::vector<double> momentum =
            statistics::pct_change(prices.column(c), params_.lookback_period);

        for (size_t r = 0; r < momentum.size(); ++r) {
            // Undefined momentum compares false and stays 0
            if (momentum[r] > params_.momentum_threshold) {
                signals(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = 1.0;
            } else if (momentum[r] < -params_.momentum_threshold) {
                signals(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = -1.0;
            }
        }
    }

    return signals;
}

}  // namespace quanttrade
