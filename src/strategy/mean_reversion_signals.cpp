// src/strategy/mean_reversion_signals.cpp

#include "quanttrade/strategy/mean_reversion_signals.hpp"
#include <cmath>
#include "quanttrade/statistics/descriptive.hpp"

namespace quanttrade {

MeanReversionSignals::MeanReversionSignals(MeanReversionParams params) : params_(params) {}

Result<Eigen::MatrixXd> MeanReversionSignals::compute_raw_signals(const PricePanel& prices) const {
    Eigen::MatrixXd signals = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(prices.rows()),
                                                    static_cast<Eigen::Index>(prices.cols()));

    for (size_t c = 0; c < prices.cols(); ++c) {
        std::vector<double> price = prices.column(c);
        std::vector<double> rolling_mean =
            statistics::rolling_mean(price, params_.lookback_period);
        std::vector<double> rolling_std = statistics::rolling_std(price, params_.lookback_period);

        for (size_t r = 0; r < price.size(); ++r) {
            if (std::isnan(rolling_mean[r]) || std::isnan(rolling_std[r])) {
                continue;
            }
            double upper_band = rolling_mean[r] + rolling_std[r] * params_.std_dev;
            double lower_band = rolling_mean[r] - rolling_std[r] * params_.std_dev;

            if (price[r] < lower_band) {
                signals(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = 1.0;
            } else if (price[r] > upper_band) {
                signals(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = -1.0;
            }
        }
    }

    return signals;
}

}  // namespace quanttrade
