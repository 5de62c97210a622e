// include/quanttrade/backtest/backtest_pipeline.hpp
#pragma once

#include <memory>
#include "quanttrade/backtest/backtest_config.hpp"
#include "quanttrade/backtest/performance_analyzer.hpp"
#include "quanttrade/backtest/portfolio_simulator.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/data/price_panel.hpp"
#include "quanttrade/strategy/signal_panel.hpp"
#include "quanttrade/strategy/strategy_config.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief Everything produced by one pass of the pipeline
 */
struct PipelineOutput {
    SignalPanel signals;
    SimulatedPortfolio portfolio;
    BacktestResults results;
};

/**
 * @brief signals -> simulation -> metrics on an already loaded price panel
 *
 * Holds no mutable state; a single instance may be shared by worker threads.
 */
class BacktestPipeline {
public:
    /**
     * @param simulator Portfolio simulator; SignalPortfolioSimulator when null
     */
    explicit BacktestPipeline(std::shared_ptr<const PortfolioSimulator> simulator = nullptr);

    Result<PipelineOutput> run(const PricePanel& prices, const StrategyConfig& strategy,
                               const BacktestConfig& config) const;

    const PerformanceAnalyzer& analyzer() const {
        return analyzer_;
    }

private:
    std::shared_ptr<const PortfolioSimulator> simulator_;
    PerformanceAnalyzer analyzer_;
};

}  // namespace backtest
}  // namespace quanttrade
