// src/backtest/walk_forward.cpp

#include "quanttrade/backtest/walk_forward.hpp"
#include <map>
#include "quanttrade/core/logger.hpp"
#include "quanttrade/core/time_utils.hpp"
#include "quanttrade/statistics/descriptive.hpp"

namespace quanttrade {
namespace backtest {

namespace {

constexpr double STABLE_RETURN_STD = 0.05;

std::string period_label(const Timestamp& from, const Timestamp& to) {
    return core::format_date(from) + " to " + core::format_date(to);
}

}  // anonymous namespace

Result<void> WalkForwardConfig::validate() const {
    if (train_months < 1 || test_months < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "train_months and test_months must be >= 1",
                                "WalkForwardConfig");
    }
    return Result<void>();
}

nlohmann::json WalkForwardConfig::to_json() const {
    nlohmann::json j;
    j["train_months"] = train_months;
    j["test_months"] = test_months;
    j["min_train_rows"] = min_train_rows;
    j["min_test_rows"] = min_test_rows;
    j["version"] = version;
    return j;
}

void WalkForwardConfig::from_json(const nlohmann::json& j) {
    if (j.contains("train_months"))
        train_months = j.at("train_months").get<int>();
    if (j.contains("test_months"))
        test_months = j.at("test_months").get<int>();
    if (j.contains("min_train_rows"))
        min_train_rows = j.at("min_train_rows").get<size_t>();
    if (j.contains("min_test_rows"))
        min_test_rows = j.at("min_test_rows").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

nlohmann::json WalkForwardWindow::to_json() const {
    nlohmann::json j;
    j["window"] = window;
    j["train_period"] = period_label(train_start, train_end);
    j["test_period"] = period_label(test_start, test_end);
    j["optimized_params"] = optimized_params;
    j["test_results"] = test_results.to_json();
    return j;
}

nlohmann::json WalkForwardReport::to_json() const {
    nlohmann::json j;
    j["strategy_config"] = strategy.to_json();
    j["walk_forward_results"] = nlohmann::json::array();
    for (const auto& w : windows) {
        j["walk_forward_results"].push_back(w.to_json());
    }
    j["analysis"] = analysis;
    j["skipped_windows"] = skipped_windows;
    j["failed_windows"] = failed_windows;
    j["timestamp"] = core::format_iso8601(generated_at);
    return j;
}

WalkForwardRunner::WalkForwardRunner(WalkForwardConfig config,
                                     std::shared_ptr<const ParameterOptimizer> optimizer,
                                     std::shared_ptr<const BacktestPipeline> pipeline)
    : config_(std::move(config)),
      optimizer_(std::move(optimizer)),
      pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        pipeline_ = std::make_shared<BacktestPipeline>();
    }
    if (!optimizer_) {
        optimizer_ = std::make_shared<GridSearchOptimizer>(OptimizerConfig{}, pipeline_);
    }
    Logger::register_component("WalkForward");
}

Result<WalkForwardReport> WalkForwardRunner::run(const PricePanel& prices,
                                                 const StrategyConfig& strategy,
                                                 const BacktestConfig& config, bool fail_fast,
                                                 const CancellationToken* cancel) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<WalkForwardReport>(*valid.error());
    }

    WalkForwardReport report;
    report.strategy = strategy;

    Timestamp current = config.start_date;
    int window_num = 0;
    int iteration = 0;

    INFO("Starting walk-forward: " << config_.train_months << " month train, "
                                   << config_.test_months << " month test");

    while (core::add_months(current, config_.train_months + config_.test_months) <=
           config.end_date) {
        iteration++;
        if (cancel && cancel->is_cancelled()) {
            return make_error<WalkForwardReport>(
                ErrorCode::CANCELLED,
                "Walk-forward cancelled after " + std::to_string(window_num) + " windows",
                "WalkForwardRunner");
        }

        const Timestamp train_start = current;
        const Timestamp train_end = core::add_months(train_start, config_.train_months);
        const Timestamp test_start = train_end;
        const Timestamp test_end = core::add_months(test_start, config_.test_months);
        current = core::add_months(current, config_.test_months);

        PricePanel train = prices.slice(train_start, train_end);
        PricePanel test = prices.slice(test_start, test_end);

        if (train.rows() < config_.min_train_rows || test.rows() < config_.min_test_rows) {
            report.skipped_windows++;
            DEBUG("Skipping window " << iteration << ": " << train.rows() << " train rows, "
                                     << test.rows() << " test rows");
            continue;
        }

        auto outcome = [&]() -> Result<WalkForwardWindow> {
            auto params = optimizer_->optimize(train, strategy,
                                               config.with_dates(train_start, train_end));
            if (params.is_error()) {
                return forward_error<WalkForwardWindow>(*params.error());
            }

            StrategyConfig tuned = strategy.with_parameters(params.value());
            auto output = pipeline_->run(test, tuned, config.with_dates(test_start, test_end));
            if (output.is_error()) {
                return forward_error<WalkForwardWindow>(*output.error());
            }

            WalkForwardWindow w;
            w.train_start = train_start;
            w.train_end = train_end;
            w.test_start = test_start;
            w.test_end = test_end;
            w.optimized_params = tuned.parameters();
            w.test_results = output.value().results;
            return w;
        }();

        if (outcome.is_error()) {
            if (fail_fast) {
                return forward_error<WalkForwardReport>(*outcome.error());
            }
            report.failed_windows++;
            WARN("Walk-forward window " << iteration << " ("
                                        << period_label(test_start, test_end)
                                        << ") failed: " << outcome.error()->what());
            continue;
        }

        WalkForwardWindow w = outcome.take_value();
        w.window = ++window_num;
        report.windows.push_back(std::move(w));
    }

    if (report.skipped_windows > 0) {
        WARN("Skipped " << report.skipped_windows << " walk-forward windows with too few rows");
    }

    report.analysis = analyze_windows(report.windows);
    report.generated_at = std::chrono::system_clock::now();
    INFO("Walk-forward finished: " << report.windows.size() << " windows, "
                                   << report.failed_windows << " failed");
    return report;
}

nlohmann::json WalkForwardRunner::analyze_windows(const std::vector<WalkForwardWindow>& windows) {
    if (windows.empty()) {
        return nlohmann::json::object();
    }

    std::vector<double> annual_returns;
    std::vector<double> sharpe_ratios;
    std::map<std::string, std::vector<double>> parameter_history;
    for (const auto& w : windows) {
        annual_returns.push_back(w.test_results.annual_return);
        sharpe_ratios.push_back(w.test_results.sharpe_ratio);
        for (const auto& [name, value] : w.optimized_params) {
            parameter_history[name].push_back(value);
        }
    }

    double return_std = statistics::population_std(annual_returns);

    nlohmann::json j;
    j["performance_consistency"] = {{"avg_annual_return", statistics::mean(annual_returns)},
                                    {"return_volatility", return_std},
                                    {"avg_sharpe_ratio", statistics::mean(sharpe_ratios)},
                                    {"sharpe_volatility", statistics::population_std(sharpe_ratios)}};
    j["parameter_stability"] = parameter_history;
    j["degradation_analysis"] = {
        {"performance_degradation", return_std < STABLE_RETURN_STD ? "stable" : "unstable"}};
    return j;
}

}  // namespace backtest
}  // namespace quanttrade
