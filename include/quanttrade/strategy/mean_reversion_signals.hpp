// include/quanttrade/strategy/mean_reversion_signals.hpp
#pragma once

#include "quanttrade/strategy/signal_strategy.hpp"

namespace quanttrade {

/**
 * @brief Bollinger-band mean reversion
 *
 * Buys (+1) when the close falls below mean - std_dev * sigma over the
 * lookback window, sells (-1) above mean + std_dev * sigma.
 */
class MeanReversionSignals : public SignalStrategy {
public:
    explicit MeanReversionSignals(MeanReversionParams params);

    Result<Eigen::MatrixXd> compute_raw_signals(const PricePanel& prices) const override;

    int warmup_period() const override {
        return params_.lookback_period;
    }

    StrategyType type() const override {
        return StrategyType::MEAN_REVERSION;
    }

private:
    MeanReversionParams params_;
};

}  // namespace quanttrade
