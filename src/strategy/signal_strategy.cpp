// src/strategy/signal_strategy.cpp

#include "quanttrade/strategy/signal_strategy.hpp"
#include <cmath>
#include "quanttrade/strategy/mean_reversion_signals.hpp"
#include "quanttrade/strategy/momentum_signals.hpp"
#include "quanttrade/strategy/pairs_trading_signals.hpp"

namespace quanttrade {

Result<SignalPanel> SignalStrategy::generate(const PricePanel& prices) const {
    auto raw_result = compute_raw_signals(prices);
    if (raw_result.is_error()) {
        return forward_error<SignalPanel>(*raw_result.error());
    }
    const Eigen::MatrixXd& raw = raw_result.value();

    if (raw.rows() != static_cast<Eigen::Index>(prices.rows()) ||
        raw.cols() != static_cast<Eigen::Index>(prices.cols())) {
        return make_error<SignalPanel>(ErrorCode::INVALID_SIGNAL,
                                       "Signal matrix does not match the price panel shape",
                                       "SignalStrategy");
    }

    SignalPanel panel;
    panel.dates = prices.dates();
    panel.symbols = prices.symbols();
    panel.warmup_period = warmup_period();
    panel.values = Eigen::MatrixXi::Zero(raw.rows(), raw.cols());

    for (Eigen::Index c = 0; c < raw.cols(); ++c) {
        int last = 0;  // Gaps before the first defined signal become 0
        for (Eigen::Index r = 0; r < raw.rows(); ++r) {
            double cell = raw(r, c);
            if (!std::isnan(cell)) {
                if (cell != -1.0 && cell != 0.0 && cell != 1.0) {
                    return make_error<SignalPanel>(ErrorCode::INVALID_SIGNAL,
                                                   "Signal value out of {-1, 0, 1}",
                                                   "SignalStrategy");
                }
                last = static_cast<int>(cell);
            }
            panel.values(r, c) = last;
        }
    }

    return panel;
}

Result<std::unique_ptr<SignalStrategy>> create_signal_strategy(const StrategyConfig& config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<std::unique_ptr<SignalStrategy>>(*valid.error());
    }

    std::unique_ptr<SignalStrategy> strategy;
    switch (config.type) {
        case StrategyType::MOMENTUM:
            strategy = std::make_unique<MomentumSignals>(std::get<MomentumParams>(config.params));
            break;
        case StrategyType::MEAN_REVERSION:
            strategy = std::make_unique<MeanReversionSignals>(
                std::get<MeanReversionParams>(config.params));
            break;
        case StrategyType::PAIRS_TRADING:
            strategy = std::make_unique<PairsTradingSignals>(
                std::get<PairsTradingParams>(config.params));
            break;
    }

    if (!strategy) {
        return make_error<std::unique_ptr<SignalStrategy>>(
            ErrorCode::UNSUPPORTED_STRATEGY,
            "Unsupported strategy type: " + strategy_type_to_string(config.type),
            "SignalStrategy");
    }
    return strategy;
}

Result<SignalPanel> generate_signals(const PricePanel& prices, const StrategyConfig& config) {
    auto strategy = create_signal_strategy(config);
    if (strategy.is_error()) {
        return forward_error<SignalPanel>(*strategy.error());
    }
    return strategy.value()->generate(prices);
}

}  // namespace quanttrade
