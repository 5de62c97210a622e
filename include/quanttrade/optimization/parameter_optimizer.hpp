// include/quanttrade/optimization/parameter_optimizer.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quanttrade/backtest/backtest_config.hpp"
#include "quanttrade/backtest/backtest_pipeline.hpp"
#include "quanttrade/core/config_base.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"
#include "quanttrade/data/price_panel.hpp"
#include "quanttrade/strategy/strategy_config.hpp"

namespace quanttrade {

/**
 * @brief Configuration for in-sample parameter search
 */
struct OptimizerConfig : public ConfigBase {
    std::string method{"grid"};           // "grid" or "random"
    std::string objective{"sharpe_ratio"};  // Metric to maximise
    int num_samples{20};                   // Candidates drawn by random search
    uint64_t seed{42};                     // Random search base seed

    // Configuration metadata
    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Read the named objective from a set of metrics
 * @return The value, or INVALID_ARGUMENT for an unknown objective
 */
Result<double> objective_value(const backtest::BacktestResults& results,
                               const std::string& objective);

/**
 * @brief Chooses strategy parameters on a training slice
 */
class ParameterOptimizer {
public:
    virtual ~ParameterOptimizer() = default;

    /**
     * @brief Select parameters for the strategy
     * @param train Training prices
     * @param strategy Strategy whose parameters are searched
     * @param config Backtest settings for the training period
     * @return Chosen parameters; the strategy's current parameters when no
     *         candidate could be evaluated
     */
    virtual Result<ParameterSet> optimize(const PricePanel& train, const StrategyConfig& strategy,
                                          const backtest::BacktestConfig& config) const = 0;
};

/**
 * @brief Shared candidate evaluation: run every candidate, keep the best objective
 *
 * Ties keep the earlier candidate; failed candidates are skipped.
 */
class SearchOptimizerBase : public ParameterOptimizer {
public:
    SearchOptimizerBase(OptimizerConfig config,
                        std::shared_ptr<const backtest::BacktestPipeline> pipeline);

    Result<ParameterSet> optimize(const PricePanel& train, const StrategyConfig& strategy,
                                  const backtest::BacktestConfig& config) const override;

    /**
     * @brief Candidate parameter sets in evaluation order
     */
    virtual std::vector<ParameterSet> candidates(const PricePanel& train,
                                                 const StrategyConfig& strategy) const = 0;

protected:
    OptimizerConfig config_;
    std::shared_ptr<const backtest::BacktestPipeline> pipeline_;
};

/**
 * @brief Exhaustive search over a fixed per-strategy grid
 *
 * momentum: lookback_period {10..30 step 5} x momentum_threshold {0.01..0.05 step 0.01}
 * mean_reversion: lookback_period {10..30 step 5} x std_dev {1.5, 2.0, 2.5}
 * pairs_trading: entry_threshold {1.5, 2.0, 2.5} x exit_threshold {0.25, 0.5, 0.75}
 */
class GridSearchOptimizer : public SearchOptimizerBase {
public:
    using SearchOptimizerBase::SearchOptimizerBase;

    std::vector<ParameterSet> candidates(const PricePanel& train,
                                         const StrategyConfig& strategy) const override;
};

/**
 * @brief Seeded random draws within per-strategy ranges
 *
 * The generator is seeded from the configured seed, the training length and
 * its first date, so the same slice always yields the same candidates.
 */
class RandomSearchOptimizer : public SearchOptimizerBase {
public:
    using SearchOptimizerBase::SearchOptimizerBase;

    std::vector<ParameterSet> candidates(const PricePanel& train,
                                         const StrategyConfig& strategy) const override;
};

/**
 * @brief Build the optimizer named by config.method
 * @return The optimizer, or INVALID_ARGUMENT for an unknown method or objective
 */
Result<std::unique_ptr<ParameterOptimizer>> create_parameter_optimizer(
    const OptimizerConfig& config, std::shared_ptr<const backtest::BacktestPipeline> pipeline);

}  // namespace quanttrade
