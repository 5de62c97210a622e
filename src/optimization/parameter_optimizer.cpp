// src/optimization/parameter_optimizer.cpp

#include "quanttrade/optimization/parameter_optimizer.hpp"
#include <algorithm>
#include <random>
#include "quanttrade/core/logger.hpp"
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {

Result<void> OptimizerConfig::validate() const {
    if (method != "grid" && method != "random") {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Unknown optimizer method: " + method, "OptimizerConfig");
    }
    auto objective_check = objective_value(backtest::BacktestResults{}, objective);
    if (objective_check.is_error()) {
        return make_error<void>(objective_check.error()->code(), objective_check.error()->what(),
                                "OptimizerConfig");
    }
    if (method == "random" && num_samples < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "num_samples must be >= 1",
                                "OptimizerConfig");
    }
    return Result<void>();
}

nlohmann::json OptimizerConfig::to_json() const {
    nlohmann::json j;
    j["method"] = method;
    j["objective"] = objective;
    j["num_samples"] = num_samples;
    j["seed"] = seed;
    j["version"] = version;
    return j;
}

void OptimizerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("method"))
        method = j.at("method").get<std::string>();
    if (j.contains("objective"))
        objective = j.at("objective").get<std::string>();
    if (j.contains("num_samples"))
        num_samples = j.at("num_samples").get<int>();
    if (j.contains("seed"))
        seed = j.at("seed").get<uint64_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<double> objective_value(const backtest::BacktestResults& results,
                               const std::string& objective) {
    if (objective == "sharpe_ratio")
        return results.sharpe_ratio;
    if (objective == "total_return")
        return results.total_return;
    if (objective == "annual_return")
        return results.annual_return;
    if (objective == "sortino_ratio")
        return results.sortino_ratio;
    if (objective == "calmar_ratio")
        return results.calmar_ratio;
    return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                              "Unknown optimization objective: " + objective,
                              "ParameterOptimizer");
}

SearchOptimizerBase::SearchOptimizerBase(OptimizerConfig config,
                                         std::shared_ptr<const backtest::BacktestPipeline> pipeline)
    : config_(std::move(config)), pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        pipeline_ = std::make_shared<backtest::BacktestPipeline>();
    }
    Logger::register_component("ParameterOptimizer");
}

Result<ParameterSet> SearchOptimizerBase::optimize(const PricePanel& train,
                                                   const StrategyConfig& strategy,
                                                   const backtest::BacktestConfig& config) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<ParameterSet>(*valid.error());
    }

    std::vector<ParameterSet> grid = candidates(train, strategy);

    bool found = false;
    double best_score = 0.0;
    ParameterSet best = strategy.parameters();
    size_t failures = 0;

    for (const auto& candidate : grid) {
        StrategyConfig trial = strategy.with_parameters(candidate);
        auto output = pipeline_->run(train, trial, config);
        if (output.is_error()) {
            failures++;
            DEBUG("Candidate rejected: " << output.error()->what());
            continue;
        }

        auto score = objective_value(output.value().results, config_.objective);
        if (score.is_error()) {
            return forward_error<ParameterSet>(*score.error());
        }
        if (!found || score.value() > best_score) {
            found = true;
            best_score = score.value();
            best = trial.parameters();
        }
    }

    if (!found) {
        WARN("No optimization candidate succeeded (" << failures << " failed), keeping "
                                                     << "current parameters");
    } else {
        DEBUG("Best " << config_.objective << " " << best_score << " over " << grid.size()
                      << " candidates");
    }
    return best;
}

std::vector<ParameterSet> GridSearchOptimizer::candidates(const PricePanel& /*train*/,
                                                          const StrategyConfig& strategy) const {
    std::vector<ParameterSet> grid;
    const std::vector<double> lookbacks = {10, 15, 20, 25, 30};

    switch (strategy.type) {
        case StrategyType::MOMENTUM:
            for (double lookback : lookbacks) {
                for (double threshold : {0.01, 0.02, 0.03, 0.04, 0.05}) {
                    grid.push_back(
                        {{"lookback_period", lookback}, {"momentum_threshold", threshold}});
                }
            }
            break;
        case StrategyType::MEAN_REVERSION:
            for (double lookback : lookbacks) {
                for (double std_dev : {1.5, 2.0, 2.5}) {
                    grid.push_back({{"lookback_period", lookback}, {"std_dev", std_dev}});
                }
            }
            break;
        case StrategyType::PAIRS_TRADING:
            for (double entry : {1.5, 2.0, 2.5}) {
                for (double exit : {0.25, 0.5, 0.75}) {
                    grid.push_back({{"entry_threshold", entry}, {"exit_threshold", exit}});
                }
            }
            break;
    }
    return grid;
}

std::vector<ParameterSet> RandomSearchOptimizer::candidates(const PricePanel& train,
                                                            const StrategyConfig& strategy) const {
    uint64_t seed = config_.seed ^ (static_cast<uint64_t>(train.rows()) * 0x9E3779B97F4A7C15ULL);
    if (!train.empty()) {
        seed ^= static_cast<uint64_t>(core::days_since_epoch(train.dates().front()));
    }
    std::mt19937_64 rng(seed);

    std::uniform_int_distribution<int> lookback(10, 29);
    std::uniform_real_distribution<double> threshold(0.01, 0.05);
    std::uniform_real_distribution<double> band(1.5, 2.5);
    std::uniform_real_distribution<double> entry(1.5, 2.5);
    std::uniform_real_distribution<double> exit(0.25, 0.75);

    std::vector<ParameterSet> samples;
    samples.reserve(static_cast<size_t>(std::max(config_.num_samples, 0)));
    for (int i = 0; i < config_.num_samples; ++i) {
        switch (strategy.type) {
            case StrategyType::MOMENTUM: {
                // Draw order is fixed so candidates are reproducible
                double l = lookback(rng);
                double t = threshold(rng);
                samples.push_back({{"lookback_period", l}, {"momentum_threshold", t}});
                break;
            }
            case StrategyType::MEAN_REVERSION: {
                double l = lookback(rng);
                double s = band(rng);
                samples.push_back({{"lookback_period", l}, {"std_dev", s}});
                break;
            }
            case StrategyType::PAIRS_TRADING: {
                double e = entry(rng);
                double x = exit(rng);
                samples.push_back({{"entry_threshold", e}, {"exit_threshold", x}});
                break;
            }
        }
    }
    return samples;
}

Result<std::unique_ptr<ParameterOptimizer>> create_parameter_optimizer(
    const OptimizerConfig& config, std::shared_ptr<const backtest::BacktestPipeline> pipeline) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<std::unique_ptr<ParameterOptimizer>>(*valid.error());
    }

    std::unique_ptr<ParameterOptimizer> optimizer;
    if (config.method == "random") {
        optimizer = std::make_unique<RandomSearchOptimizer>(config, std::move(pipeline));
    } else {
        optimizer = std::make_unique<GridSearchOptimizer>(config, std::move(pipeline));
    }
    return optimizer;
}

}  // namespace quanttrade
