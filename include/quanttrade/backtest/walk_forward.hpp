// include/quanttrade/backtest/walk_forward.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "quanttrade/backtest/backtest_config.hpp"
#include "quanttrade/backtest/backtest_pipeline.hpp"
#include "quanttrade/core/cancellation.hpp"
#include "quanttrade/core/config_base.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"
#include "quanttrade/data/price_panel.hpp"
#include "quanttrade/optimization/parameter_optimizer.hpp"
#include "quanttrade/strategy/strategy_config.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief Walk-forward window settings
 */
struct WalkForwardConfig : public ConfigBase {
    int train_months{12};
    int test_months{3};
    size_t min_train_rows{30};  // Windows with fewer training rows are skipped
    size_t min_test_rows{10};   // Windows with fewer test rows are skipped

    // Configuration metadata
    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief One evaluated walk-forward window
 */
struct WalkForwardWindow {
    int window{0};  // 1-based, counts evaluated windows only
    Timestamp train_start;
    Timestamp train_end;
    Timestamp test_start;
    Timestamp test_end;
    ParameterSet optimized_params;
    BacktestResults test_results;

    nlohmann::json to_json() const;
};

struct WalkForwardReport {
    StrategyConfig strategy;
    std::vector<WalkForwardWindow> windows;
    int skipped_windows{0};  // Not enough rows
    int failed_windows{0};   // Optimisation or test run failed
    nlohmann::json analysis;
    Timestamp generated_at;

    nlohmann::json to_json() const;
};

/**
 * @brief Rolling re-optimisation with out-of-sample evaluation
 *
 * Windows start at config.start_date and advance by test_months while
 * train_months + test_months still ends on or before config.end_date.
 */
class WalkForwardRunner {
public:
    /**
     * @param optimizer In-sample optimiser; grid search when null
     * @param pipeline Pipeline used for the test slices
     */
    WalkForwardRunner(WalkForwardConfig config,
                      std::shared_ptr<const ParameterOptimizer> optimizer,
                      std::shared_ptr<const BacktestPipeline> pipeline);

    /**
     * @return The report, CANCELLED, or the first window error when fail_fast is set
     */
    Result<WalkForwardReport> run(const PricePanel& prices, const StrategyConfig& strategy,
                                  const BacktestConfig& config, bool fail_fast = false,
                                  const CancellationToken* cancel = nullptr) const;

    /**
     * @brief Consistency, parameter stability and degradation across windows
     *
     * Empty input yields an empty object.
     */
    static nlohmann::json analyze_windows(const std::vector<WalkForwardWindow>& windows);

private:
    WalkForwardConfig config_;
    std::shared_ptr<const ParameterOptimizer> optimizer_;
    std::shared_ptr<const BacktestPipeline> pipeline_;
};

}  // namespace backtest
}  // namespace quanttrade
