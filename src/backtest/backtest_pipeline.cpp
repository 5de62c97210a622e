// src/backtest/backtest_pipeline.cpp

#include "quanttrade/backtest/backtest_pipeline.hpp"
#include "quanttrade/strategy/signal_strategy.hpp"

namespace quanttrade {
namespace backtest {

BacktestPipeline::BacktestPipeline(std::shared_ptr<const PortfolioSimulator> simulator)
    : simulator_(std::move(simulator)) {
    if (!simulator_) {
        simulator_ = std::make_shared<SignalPortfolioSimulator>();
    }
}

Result<PipelineOutput> BacktestPipeline::run(const PricePanel& prices,
                                             const StrategyConfig& strategy,
                                             const BacktestConfig& config) const {
    if (prices.empty()) {
        return make_error<PipelineOutput>(ErrorCode::NO_MARKET_DATA, "No market data available",
                                          "BacktestPipeline");
    }

    auto signals = generate_signals(prices, strategy);
    if (signals.is_error()) {
        return forward_error<PipelineOutput>(*signals.error());
    }

    auto portfolio = simulator_->simulate(prices, signals.value(), config);
    if (portfolio.is_error()) {
        return forward_error<PipelineOutput>(*portfolio.error());
    }

    auto results = analyzer_.analyze(portfolio.value(), config);
    if (results.is_error()) {
        return forward_error<PipelineOutput>(*results.error());
    }

    PipelineOutput output;
    output.signals = signals.take_value();
    output.portfolio = portfolio.take_value();
    output.results = results.value();
    return output;
}

}  // namespace backtest
}  // namespace quanttrade
