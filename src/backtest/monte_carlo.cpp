// src/backtest/monte_carlo.cpp

#include "quanttrade/backtest/monte_carlo.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include "quanttrade/core/logger.hpp"
#include "quanttrade/core/time_utils.hpp"
#include "quanttrade/statistics/descriptive.hpp"

namespace quanttrade {
namespace backtest {

Result<void> MonteCarloConfig::validate() const {
    if (num_simulations < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "num_simulations must be >= 1",
                                "MonteCarloConfig");
    }
    if (block_size < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "block_size must be >= 1",
                                "MonteCarloConfig");
    }
    if (num_threads < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "num_threads must be >= 1",
                                "MonteCarloConfig");
    }
    return Result<void>();
}

nlohmann::json MonteCarloConfig::to_json() const {
    nlohmann::json j;
    j["num_simulations"] = num_simulations;
    j["block_size"] = block_size;
    j["seed"] = seed;
    j["num_threads"] = num_threads;
    j["progress_interval"] = progress_interval;
    j["version"] = version;
    return j;
}

void MonteCarloConfig::from_json(const nlohmann::json& j) {
    if (j.contains("num_simulations"))
        num_simulations = j.at("num_simulations").get<int>();
    if (j.contains("block_size"))
        block_size = j.at("block_size").get<int>();
    if (j.contains("seed"))
        seed = j.at("seed").get<uint64_t>();
    if (j.contains("num_threads"))
        num_threads = j.at("num_threads").get<int>();
    if (j.contains("progress_interval"))
        progress_interval = j.at("progress_interval").get<int>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

nlohmann::json MonteCarloReport::to_json() const {
    nlohmann::json j;
    j["strategy_config"] = strategy.to_json();
    j["num_simulations"] = num_simulations;
    j["completed_simulations"] = completed;
    j["failed_simulations"] = failed;
    j["monte_carlo_analysis"] = analysis;
    j["timestamp"] = core::format_iso8601(generated_at);
    return j;
}

MonteCarloRunner::MonteCarloRunner(MonteCarloConfig config,
                                   std::shared_ptr<const Resampler> resampler,
                                   std::shared_ptr<const BacktestPipeline> pipeline)
    : config_(std::move(config)),
      resampler_(std::move(resampler)),
      pipeline_(std::move(pipeline)) {
    if (!resampler_) {
        resampler_ =
            std::make_shared<BlockBootstrapResampler>(static_cast<size_t>(config_.block_size));
    }
    if (!pipeline_) {
        pipeline_ = std::make_shared<BacktestPipeline>();
    }
    Logger::register_component("MonteCarlo");
}

Result<MonteCarloReport> MonteCarloRunner::run(const PricePanel& prices,
                                               const StrategyConfig& strategy,
                                               const BacktestConfig& config, bool fail_fast,
                                               const CancellationToken* cancel) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<MonteCarloReport>(*valid.error());
    }

    const size_t total = static_cast<size_t>(config_.num_simulations);
    const size_t workers =
        std::min(static_cast<size_t>(config_.num_threads), std::max<size_t>(total, 1));

    std::vector<std::optional<double>> outcomes(total);
    std::atomic<size_t> next_index{0};
    std::atomic<size_t> completed{0};
    std::atomic<size_t> failed{0};
    std::atomic<bool> stop{false};
    std::atomic<bool> cancelled{false};

    std::mutex error_mutex;
    size_t first_error_index = total;
    std::unique_ptr<BacktestError> first_error;

    INFO("Starting Monte Carlo: " << total << " simulations on " << workers << " thread(s)");

    const std::string component = Logger::current_component();
    auto worker = [&]() {
        ScopedLogComponent tag(component.empty() ? "MonteCarlo" : component);
        while (!stop.load(std::memory_order_acquire)) {
            if (cancel && cancel->is_cancelled()) {
                cancelled.store(true, std::memory_order_release);
                stop.store(true, std::memory_order_release);
                return;
            }
            size_t i = next_index.fetch_add(1);
            if (i >= total) {
                return;
            }

            auto output = [&]() -> Result<PipelineOutput> {
                std::mt19937_64 rng(config_.seed + static_cast<uint64_t>(i));
                auto sample = resampler_->resample(prices, rng);
                if (sample.is_error()) {
                    return forward_error<PipelineOutput>(*sample.error());
                }
                return pipeline_->run(sample.value(), strategy, config);
            }();

            if (output.is_ok()) {
                outcomes[i] = output.value().results.total_return;
                size_t done = completed.fetch_add(1) + 1;
                if (config_.progress_interval > 0 &&
                    done % static_cast<size_t>(config_.progress_interval) == 0) {
                    INFO("Completed " << done << "/" << total << " Monte Carlo simulations");
                }
                continue;
            }

            failed.fetch_add(1);
            WARN("Monte Carlo simulation " << i << " failed: " << output.error()->what());
            if (fail_fast) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (i < first_error_index) {
                    first_error_index = i;
                    first_error = std::make_unique<BacktestError>(*output.error());
                }
                stop.store(true, std::memory_order_release);
            }
        }
    };

    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t t = 0; t < workers; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    if (first_error) {
        return Result<MonteCarloReport>(std::move(first_error));
    }
    if (cancelled.load()) {
        return make_error<MonteCarloReport>(ErrorCode::CANCELLED,
                                            "Monte Carlo cancelled after " +
                                                std::to_string(completed.load()) + " simulations",
                                            "MonteCarloRunner");
    }

    MonteCarloReport report;
    report.strategy = strategy;
    report.num_simulations = static_cast<int>(total);
    report.completed = static_cast<int>(completed.load());
    report.failed = static_cast<int>(failed.load());
    for (const auto& outcome : outcomes) {
        if (outcome) {
            report.total_returns.push_back(*outcome);
        }
    }

    if (report.total_returns.empty()) {
        return make_error<MonteCarloReport>(ErrorCode::COMPUTATION_ERROR,
                                            "All " + std::to_string(total) +
                                                " Monte Carlo simulations failed",
                                            "MonteCarloRunner");
    }
    if (report.failed > 0) {
        WARN("Excluded " << report.failed << " failed Monte Carlo simulations");
    }

    report.analysis = analyze_returns(report.total_returns);
    report.generated_at = std::chrono::system_clock::now();
    INFO("Monte Carlo finished: " << report.completed << " completed, " << report.failed
                                  << " failed");
    return report;
}

nlohmann::json MonteCarloRunner::analyze_returns(const std::vector<double>& total_returns) {
    if (total_returns.empty()) {
        return nlohmann::json::object();
    }

    auto fraction = [&total_returns](auto predicate) {
        double hits = static_cast<double>(
            std::count_if(total_returns.begin(), total_returns.end(), predicate));
        return hits / static_cast<double>(total_returns.size());
    };

    double var_95 = statistics::quantile(total_returns, 0.05);
    std::vector<double> tail;
    for (double r : total_returns) {
        if (r <= var_95) {
            tail.push_back(r);
        }
    }
    double minimum = *std::min_element(total_returns.begin(), total_returns.end());
    double maximum = *std::max_element(total_returns.begin(), total_returns.end());

    nlohmann::json j;
    j["return_statistics"] = {{"mean", statistics::mean(total_returns)},
                              {"median", statistics::median(total_returns)},
                              {"std_dev", statistics::population_std(total_returns)},
                              {"min", minimum},
                              {"max", maximum}};
    j["confidence_intervals"] = {
        {"95%",
         {statistics::quantile(total_returns, 0.025), statistics::quantile(total_returns, 0.975)}},
        {"90%",
         {statistics::quantile(total_returns, 0.05), statistics::quantile(total_returns, 0.95)}},
        {"80%",
         {statistics::quantile(total_returns, 0.10), statistics::quantile(total_returns, 0.90)}}};
    j["probability_analysis"] = {
        {"prob_positive", fraction([](double r) { return r > 0.0; })},
        {"prob_above_10pct", fraction([](double r) { return r > 0.10; })},
        {"prob_below_neg10pct", fraction([](double r) { return r < -0.10; })}};
    j["risk_metrics"] = {
        {"var_95", var_95}, {"cvar_95", statistics::mean(tail)}, {"maximum_loss", minimum}};
    return j;
}

}  // namespace backtest
}  // namespace quanttrade
