// include/quanttrade/strategy/strategy_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>
#include "quanttrade/core/config_base.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"

namespace quanttrade {

/**
 * @brief Supported signal strategies
 */
enum class StrategyType { MOMENTUM, MEAN_REVERSION, PAIRS_TRADING };

std::string strategy_type_to_string(StrategyType type);

/**
 * @brief Parse "momentum", "mean_reversion" or "pairs_trading"
 * @return The type, or UNSUPPORTED_STRATEGY
 */
Result<StrategyType> strategy_type_from_string(const std::string& name);

/**
 * @brief Momentum parameters
 */
struct MomentumParams {
    int lookback_period{20};          // Bars for the rate of change
    double momentum_threshold{0.02};  // Minimum absolute change to take a side
};

/**
 * @brief Bollinger-band mean reversion parameters
 */
struct MeanReversionParams {
    int lookback_period{20};  // Rolling window for mean and std
    double std_dev{2.0};      // Band width in standard deviations
};

/**
 * @brief Log-spread pairs trading parameters
 */
struct PairsTradingParams {
    int spread_window{30};        // Rolling window for the spread z-score
    double entry_threshold{2.0};  // |z| above which a position is opened
    double exit_threshold{0.5};   // |z| below which the position is closed
};

using StrategyParams = std::variant<MomentumParams, MeanReversionParams, PairsTradingParams>;

/**
 * @brief Strategy definition: which symbols, which signal rule, which parameters
 *
 * JSON shape (parameters are flat keys next to "type", or nested under
 * "parameters"; absent parameters take their defaults):
 * {"type": "momentum", "symbols": ["SPY"], "lookback_period": 20, "momentum_threshold": 0.02}
 */
struct StrategyConfig : public ConfigBase {
    std::string name;  // Optional label
    StrategyType type{StrategyType::MOMENTUM};
    std::vector<std::string> symbols;
    StrategyParams params{MomentumParams{}};

    /**
     * @brief Build and validate a strategy config from JSON
     * @return The config, or INVALID_ARGUMENT / UNSUPPORTED_STRATEGY
     */
    static Result<StrategyConfig> parse(const nlohmann::json& j);

    /**
     * @brief Check parameter ranges and symbol list
     */
    Result<void> validate() const override;

    /**
     * @brief Tunable parameters as a name -> value map
     */
    ParameterSet parameters() const;

    /**
     * @brief Copy with the named parameters replaced; unknown names are ignored
     */
    StrategyConfig with_parameters(const ParameterSet& overrides) const;

    /**
     * @brief Largest rolling window the strategy needs before its first signal
     */
    int max_lookback() const;

    nlohmann::json to_json() const override;

    /**
     * @throws BacktestError if the JSON does not describe a valid strategy
     */
    void from_json(const nlohmann::json& j) override;
};

}  // namespace quanttrade
