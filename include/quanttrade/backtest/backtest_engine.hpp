// include/quanttrade/backtest/backtest_engine.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "quanttrade/backtest/backtest_config.hpp"
#include "quanttrade/backtest/backtest_pipeline.hpp"
#include "quanttrade/backtest/detailed_analysis.hpp"
#include "quanttrade/backtest/monte_carlo.hpp"
#include "quanttrade/backtest/portfolio_simulator.hpp"
#include "quanttrade/backtest/resampler.hpp"
#include "quanttrade/backtest/walk_forward.hpp"
#include "quanttrade/core/cancellation.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/data/market_data_loader.hpp"
#include "quanttrade/data/market_data_service.hpp"
#include "quanttrade/optimization/parameter_optimizer.hpp"
#include "quanttrade/strategy/strategy_config.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief Engine-wide behaviour shared by all drivers
 */
struct EngineOptions {
    bool fail_fast{false};  // Throw from JSON drivers and stop loops at the first failure
    MonteCarloConfig monte_carlo;
    WalkForwardConfig walk_forward;
    OptimizerConfig optimizer;
    std::shared_ptr<const Resampler> resampler;  // Monte Carlo history generator, bootstrap when null
};

/**
 * @brief Single backtest outcome with its descriptive analysis
 */
struct BacktestReport {
    StrategyConfig strategy;
    BacktestConfig config;
    BacktestResults results;
    nlohmann::json detailed_analysis;
    Timestamp generated_at;

    nlohmann::json to_json() const;
};

/**
 * @brief Entry point for backtests, Monte Carlo experiments and walk-forward analysis
 *
 * Typed drivers return Result; the JSON drivers accept raw configuration
 * documents and return a report document or {"error": "..."}.
 */
class BacktestEngine {
public:
    /**
     * @param service Market data source
     * @param options Driver options
     * @param simulator Portfolio simulator; SignalPortfolioSimulator when null
     */
    explicit BacktestEngine(std::shared_ptr<MarketDataService> service,
                            EngineOptions options = EngineOptions(),
                            std::shared_ptr<const PortfolioSimulator> simulator = nullptr);

    Result<BacktestReport> run_backtest(const StrategyConfig& strategy,
                                        const BacktestConfig& config,
                                        const CancellationToken* cancel = nullptr) const;

    Result<MonteCarloReport> run_monte_carlo(const StrategyConfig& strategy,
                                             const BacktestConfig& config, int num_simulations,
                                             const CancellationToken* cancel = nullptr) const;

    Result<WalkForwardReport> run_walk_forward(const StrategyConfig& strategy,
                                               const BacktestConfig& config, int train_months,
                                               int test_months,
                                               const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Backtest from JSON configuration documents
     * @throws BacktestError on failure when fail_fast is set
     */
    nlohmann::json backtest_strategy(const nlohmann::json& strategy_config,
                                     const nlohmann::json& backtest_config) const;

    nlohmann::json monte_carlo_backtest(const nlohmann::json& strategy_config,
                                        const nlohmann::json& backtest_config,
                                        int num_simulations = 1000) const;

    nlohmann::json walk_forward_analysis(const nlohmann::json& strategy_config,
                                         const nlohmann::json& backtest_config,
                                         int train_months = 12, int test_months = 3) const;

    const EngineOptions& options() const {
        return options_;
    }

private:
    Result<PricePanel> load_prices(const StrategyConfig& strategy,
                                   const BacktestConfig& config) const;

    nlohmann::json failure_document(const std::string& prefix, const BacktestError& error) const;

    EngineOptions options_;
    MarketDataLoader loader_;
    std::shared_ptr<const BacktestPipeline> pipeline_;
    DetailedAnalyzer detailed_analyzer_;
};

}  // namespace backtest
}  // namespace quanttrade
