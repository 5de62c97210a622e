// include/quanttrade/strategy/signal_strategy.hpp
#pragma once

#include <Eigen/Dense>
#include <memory>
#include "quanttrade/core/error.hpp"
#include "quanttrade/data/price_panel.hpp"
#include "quanttrade/strategy/signal_panel.hpp"
#include "quanttrade/strategy/strategy_config.hpp"

namespace quanttrade {

/**
 * @brief Interface for rules that turn prices into position signals
 */
class SignalStrategy {
public:
    virtual ~SignalStrategy() = default;

    /**
     * @brief Raw per-cell signals before cleaning
     *
     * Cells are -1, 0 or +1; NaN means "keep the previous signal".
     *
     * @param prices Price panel to evaluate
     * @return Matrix of the panel's shape, or an error
     */
    virtual Result<Eigen::MatrixXd> compute_raw_signals(const PricePanel& prices) const = 0;

    /**
     * @brief Largest rolling window used by the rule
     */
    virtual int warmup_period() const = 0;

    virtual StrategyType type() const = 0;

    /**
     * @brief Compute, forward-fill, default to 0 and cast to int
     */
    Result<SignalPanel> generate(const PricePanel& prices) const;
};

/**
 * @brief Instantiate the signal rule described by a strategy config
 * @return The strategy, or the config's validation error
 */
Result<std::unique_ptr<SignalStrategy>> create_signal_strategy(const StrategyConfig& config);

/**
 * @brief Convenience wrapper: create the strategy and generate its signal panel
 */
Result<SignalPanel> generate_signals(const PricePanel& prices, const StrategyConfig& config);

}  // namespace quanttrade
