// include/quanttrade/backtest/monte_carlo.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quanttrade/backtest/backtest_config.hpp"
#include "quanttrade/backtest/backtest_pipeline.hpp"
#include "quanttrade/backtest/resampler.hpp"
#include "quanttrade/core/cancellation.hpp"
#include "quanttrade/core/config_base.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/data/price_panel.hpp"
#include "quanttrade/strategy/strategy_config.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief Monte Carlo settings
 */
struct MonteCarloConfig : public ConfigBase {
    int num_simulations{1000};
    int block_size{20};          // Rows per bootstrap block
    uint64_t seed{42};           // Simulation i uses seed + i
    int num_threads{1};          // Worker threads; results do not depend on it
    int progress_interval{100};  // Log every N completed simulations

    // Configuration metadata
    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Aggregated outcome of a Monte Carlo experiment
 */
struct MonteCarloReport {
    StrategyConfig strategy;
    int num_simulations{0};    // Requested
    int completed{0};          // Successful simulations
    int failed{0};             // Excluded after an error
    std::vector<double> total_returns;  // Successful runs in simulation order
    nlohmann::json analysis;
    Timestamp generated_at;

    nlohmann::json to_json() const;
};

/**
 * @brief Runs the pipeline on many resampled histories
 */
class MonteCarloRunner {
public:
    /**
     * @param resampler History generator; BlockBootstrapResampler(config.block_size) when null
     * @param pipeline Pipeline shared by all simulations
     */
    MonteCarloRunner(MonteCarloConfig config, std::shared_ptr<const Resampler> resampler,
                     std::shared_ptr<const BacktestPipeline> pipeline);

    /**
     * @brief Run config.num_simulations simulations
     *
     * Failed simulations are logged and counted unless fail_fast is set, in
     * which case the first failure is returned.
     *
     * @return The report, CANCELLED, or COMPUTATION_ERROR if every simulation failed
     */
    Result<MonteCarloReport> run(const PricePanel& prices, const StrategyConfig& strategy,
                                 const BacktestConfig& config, bool fail_fast = false,
                                 const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Distribution summary of simulated total returns
     *
     * Keys: return_statistics, confidence_intervals, probability_analysis, risk_metrics.
     */
    static nlohmann::json analyze_returns(const std::vector<double>& total_returns);

private:
    MonteCarloConfig config_;
    std::shared_ptr<const Resampler> resampler_;
    std::shared_ptr<const BacktestPipeline> pipeline_;
};

}  // namespace backtest
}  // namespace quanttrade
