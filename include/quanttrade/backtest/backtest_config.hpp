// include/quanttrade/backtest/backtest_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "quanttrade/core/config_base.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief Parse "1D" / "1W" / "1M" (or "D" / "W" / "M")
 * @return The frequency, or INVALID_ARGUMENT
 */
Result<RebalanceFrequency> parse_rebalance_frequency(const std::string& text);

/**
 * @brief Simulation settings shared by every experiment driver
 */
struct BacktestConfig : public ConfigBase {
    double initial_capital{100000.0};  // Starting cash, > 0
    double commission{0.001};          // Fraction of fill notional per fill
    double slippage{0.0005};           // Adverse fractional price adjustment
    Timestamp start_date;              // Defaults to 2020-01-01
    Timestamp end_date;                // Defaults to 2024-01-01
    std::string benchmark{"SPY"};
    double risk_free_rate{0.02};  // Annual
    RebalanceFrequency rebalance_freq{RebalanceFrequency::DAILY};
    double max_leverage{1.0};   // Gross exposure cap as a multiple of equity, >= 1
    double position_size{0.25};  // Entry notional as a fraction of equity, (0, 1]
    bool allow_short{false};     // Let -1 open a short when flat

    // Configuration metadata
    std::string version{"1.0.0"};

    BacktestConfig();

    /**
     * @brief Check ranges and date ordering
     * @return INVALID_ARGUMENT describing the first violation
     */
    Result<void> validate() const override;

    /**
     * @brief Build from JSON on top of the defaults and validate
     */
    static Result<BacktestConfig> parse(const nlohmann::json& j);

    /**
     * @brief Copy with a different date range
     */
    BacktestConfig with_dates(const Timestamp& start, const Timestamp& end) const;

    nlohmann::json to_json() const override;

    /**
     * @throws BacktestError on malformed dates or frequency
     */
    void from_json(const nlohmann::json& j) override;
};

}  // namespace backtest
}  // namespace quanttrade
