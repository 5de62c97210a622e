// include/quanttrade/strategy/pairs_trading_signals.hpp
#pragma once

#include "quanttrade/strategy/signal_strategy.hpp"

namespace quanttrade {

/**
 * @brief Log-spread pairs trading on the first two symbols of the panel
 *
 * spread = log(A) - log(B), z = (spread - rolling mean) / rolling std.
 * A goes short above +entry, long below -entry, flat inside +/-exit and
 * otherwise keeps its previous signal. B always takes the opposite side of
 * A; any further symbols stay flat.
 */
class PairsTradingSignals : public SignalStrategy {
public:
    explicit PairsTradingSignals(PairsTradingParams params);

    /**
     * @return INVALID_ARGUMENT if the panel has fewer than two symbols
     */
    Result<Eigen::MatrixXd> compute_raw_signals(const PricePanel& prices) const override;

    int warmup_period() const override {
        return params_.spread_window;
    }

    StrategyType type() const override {
        return StrategyType::PAIRS_TRADING;
    }

private:
    PairsTradingParams params_;
};

}  // namespace quanttrade
