// src/backtest/backtest_engine.cpp

#include "quanttrade/backtest/backtest_engine.hpp"
#include <optional>
#include "quanttrade/core/logger.hpp"
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {
namespace backtest {

namespace {

// Parse both documents; the strategy is parsed first so an unknown type wins
Result<std::pair<StrategyConfig, BacktestConfig>> parse_documents(
    const nlohmann::json& strategy_json, const nlohmann::json& backtest_json) {
    auto strategy = StrategyConfig::parse(strategy_json);
    if (strategy.is_error()) {
        return forward_error<std::pair<StrategyConfig, BacktestConfig>>(*strategy.error());
    }
    auto config = BacktestConfig::parse(backtest_json);
    if (config.is_error()) {
        return forward_error<std::pair<StrategyConfig, BacktestConfig>>(*config.error());
    }
    return std::make_pair(strategy.take_value(), config.take_value());
}

}  // anonymous namespace

nlohmann::json BacktestReport::to_json() const {
    nlohmann::json j;
    j["strategy_config"] = strategy.to_json();
    j["backtest_config"] = config.to_json();
    j["performance_metrics"] = results.to_json();
    j["detailed_analysis"] = detailed_analysis;
    j["timestamp"] = core::format_iso8601(generated_at);
    return j;
}

BacktestEngine::BacktestEngine(std::shared_ptr<MarketDataService> service,
                               EngineOptions options,
                               std::shared_ptr<const PortfolioSimulator> simulator)
    : options_(std::move(options)),
      loader_(std::move(service)),
      pipeline_(std::make_shared<BacktestPipeline>(std::move(simulator))) {
    Logger::register_component("BacktestEngine");
}

Result<PricePanel> BacktestEngine::load_prices(const StrategyConfig& strategy,
                                               const BacktestConfig& config) const {
    INFO("Loading " << strategy.symbols.size() << " symbols from "
                    << core::format_date(config.start_date) << " to "
                    << core::format_date(config.end_date));
    return loader_.load_price_panel(strategy.symbols, config.start_date, config.end_date);
}

Result<BacktestReport> BacktestEngine::run_backtest(const StrategyConfig& strategy,
                                                    const BacktestConfig& config,
                                                    const CancellationToken* cancel) const {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<BacktestReport>(*valid.error());
    }
    if (cancel && cancel->is_cancelled()) {
        return make_error<BacktestReport>(ErrorCode::CANCELLED, "Backtest cancelled",
                                          "BacktestEngine");
    }

    INFO("Running " << strategy_type_to_string(strategy.type) << " backtest");

    auto prices = load_prices(strategy, config);
    if (prices.is_error()) {
        return forward_error<BacktestReport>(*prices.error());
    }

    auto output = pipeline_->run(prices.value(), strategy, config);
    if (output.is_error()) {
        return forward_error<BacktestReport>(*output.error());
    }

    std::optional<PriceSeries> benchmark;
    if (!config.benchmark.empty()) {
        auto series = loader_.load_series(config.benchmark, config.start_date, config.end_date);
        if (series.is_ok()) {
            benchmark = series.take_value();
        } else {
            WARN("Benchmark " << config.benchmark
                              << " unavailable, skipping comparison: " << series.error()->what());
        }
    }

    const PipelineOutput& run = output.value();

    BacktestReport report;
    report.strategy = strategy;
    report.config = config;
    report.results = run.results;
    report.detailed_analysis =
        detailed_analyzer_.generate(run.portfolio, run.results, run.signals, benchmark);
    report.generated_at = std::chrono::system_clock::now();

    INFO("Backtest finished: total_return=" << run.results.total_return
                                            << ", sharpe=" << run.results.sharpe_ratio
                                            << ", trades=" << run.results.total_trades);
    return report;
}

Result<MonteCarloReport> BacktestEngine::run_monte_carlo(const StrategyConfig& strategy,
                                                         const BacktestConfig& config,
                                                         int num_simulations,
                                                         const CancellationToken* cancel) const {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<MonteCarloReport>(*valid.error());
    }

    auto prices = load_prices(strategy, config);
    if (prices.is_error()) {
        return forward_error<MonteCarloReport>(*prices.error());
    }

    MonteCarloConfig mc_config = options_.monte_carlo;
    mc_config.num_simulations = num_simulations;
    MonteCarloRunner runner(mc_config, options_.resampler, pipeline_);
    return runner.run(prices.value(), strategy, config, options_.fail_fast, cancel);
}

Result<WalkForwardReport> BacktestEngine::run_walk_forward(const StrategyConfig& strategy,
                                                           const BacktestConfig& config,
                                                           int train_months, int test_months,
                                                           const CancellationToken* cancel) const {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<WalkForwardReport>(*valid.error());
    }

    auto optimizer = create_parameter_optimizer(options_.optimizer, pipeline_);
    if (optimizer.is_error()) {
        return forward_error<WalkForwardReport>(*optimizer.error());
    }

    auto prices = load_prices(strategy, config);
    if (prices.is_error()) {
        return forward_error<WalkForwardReport>(*prices.error());
    }

    WalkForwardConfig wf_config = options_.walk_forward;
    wf_config.train_months = train_months;
    wf_config.test_months = test_months;

    std::shared_ptr<const ParameterOptimizer> shared_optimizer = optimizer.take_value();
    WalkForwardRunner runner(wf_config, shared_optimizer, pipeline_);
    return runner.run(prices.value(), strategy, config, options_.fail_fast, cancel);
}

nlohmann::json BacktestEngine::failure_document(const std::string& prefix,
                                                const BacktestError& error) const {
    if (options_.fail_fast) {
        throw error;
    }
    ERROR(error.to_string());
    if (error.code() == ErrorCode::NO_MARKET_DATA) {
        return {{"error", "No market data available"}};
    }
    return {{"error", prefix + error.what()}};
}

nlohmann::json BacktestEngine::backtest_strategy(const nlohmann::json& strategy_config,
                                                 const nlohmann::json& backtest_config) const {
    const std::string prefix = "Backtesting failed: ";
    try {
        auto parsed = parse_documents(strategy_config, backtest_config);
        if (parsed.is_error()) {
            return failure_document(prefix, *parsed.error());
        }
        const auto& [strategy, config] = parsed.value();

        auto report = run_backtest(strategy, config);
        if (report.is_error()) {
            return failure_document(prefix, *report.error());
        }

        nlohmann::json j = report.value().to_json();
        j["strategy_config"] = strategy_config;
        return j;
    } catch (const std::exception& e) {
        if (options_.fail_fast) {
            throw;
        }
        ERROR(prefix << e.what());
        return {{"error", prefix + e.what()}};
    }
}

nlohmann::json BacktestEngine::monte_carlo_backtest(const nlohmann::json& strategy_config,
                                                    const nlohmann::json& backtest_config,
                                                    int num_simulations) const {
    const std::string prefix = "Monte Carlo backtesting failed: ";
    try {
        auto parsed = parse_documents(strategy_config, backtest_config);
        if (parsed.is_error()) {
            return failure_document(prefix, *parsed.error());
        }
        const auto& [strategy, config] = parsed.value();

        auto report = run_monte_carlo(strategy, config, num_simulations);
        if (report.is_error()) {
            return failure_document(prefix, *report.error());
        }

        nlohmann::json j = report.value().to_json();
        j["strategy_config"] = strategy_config;
        return j;
    } catch (const std::exception& e) {
        if (options_.fail_fast) {
            throw;
        }
        ERROR(prefix << e.what());
        return {{"error", prefix + e.what()}};
    }
}

nlohmann::json BacktestEngine::walk_forward_analysis(const nlohmann::json& strategy_config,
                                                     const nlohmann::json& backtest_config,
                                                     int train_months, int test_months) const {
    const std::string prefix = "Walk-forward analysis failed: ";
    try {
        auto parsed = parse_documents(strategy_config, backtest_config);
        if (parsed.is_error()) {
            return failure_document(prefix, *parsed.error());
        }
        const auto& [strategy, config] = parsed.value();

        auto report = run_walk_forward(strategy, config, train_months, test_months);
        if (report.is_error()) {
            return failure_document(prefix, *report.error());
        }

        nlohmann::json j = report.value().to_json();
        j["strategy_config"] = strategy_config;
        return j;
    } catch (const std::exception& e) {
        if (options_.fail_fast) {
            throw;
        }
        ERROR(prefix << e.what());
        return {{"error", prefix + e.what()}};
    }
}

}  // namespace backtest
}  // namespace quanttrade
