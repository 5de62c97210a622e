// include/quanttrade/strategy/momentum_signals.hpp
#pragma once

#include "quanttrade/strategy/signal_strategy.hpp"

namespace quanttrade {

/**
 * @brief Rate-of-change momentum
 *
 * Signal is +1 when the change over lookback_period bars exceeds
 * momentum_threshold, -1 when it is below -momentum_threshold, else 0.
 */
class MomentumSignals : public SignalStrategy {
public:
    explicit MomentumSignals(MomentumParams params);

    Result<Eigen::MatrixXd> compute_raw_signals(const PricePanel& prices) const override;

    int warmup_period() const override {
        return params_.lookback_period;
    }

    StrategyType type() const override {
        return StrategyType::MOMENTUM;
    }

private:
    MomentumParams params_;
};

}  // namespace quanttrade
