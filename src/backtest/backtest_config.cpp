// src/backtest/backtest_config.cpp

#include "quanttrade/backtest/backtest_config.hpp"
#include <cmath>
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {
namespace backtest {

Result<RebalanceFrequency> parse_rebalance_frequency(const std::string& text) {
    if (text == "1D" || text == "D")
        return RebalanceFrequency::DAILY;
    if (text == "1W" || text == "W")
        return RebalanceFrequency::WEEKLY;
    if (text == "1M" || text == "M")
        return RebalanceFrequency::MONTHLY;
    return make_error<RebalanceFrequency>(ErrorCode::INVALID_ARGUMENT,
                                          "Unsupported rebalance frequency: " + text,
                                          "BacktestConfig");
}

BacktestConfig::BacktestConfig()
    : start_date(core::make_date(2020, 1, 1)), end_date(core::make_date(2024, 1, 1)) {}

Result<void> BacktestConfig::validate() const {
    auto fail = [](const std::string& msg) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, msg, "BacktestConfig");
    };

    if (!std::isfinite(initial_capital) || initial_capital <= 0.0)
        return fail("initial_capital must be positive");
    if (!std::isfinite(commission) || commission < 0.0)
        return fail("commission must be non-negative");
    if (!std::isfinite(slippage) || slippage < 0.0 || slippage >= 1.0)
        return fail("slippage must be in [0, 1)");
    if (start_date >= end_date)
        return fail("start_date must be before end_date");
    if (!std::isfinite(risk_free_rate))
        return fail("risk_free_rate must be finite");
    if (!std::isfinite(max_leverage) || max_leverage < 1.0)
        return fail("max_leverage must be >= 1");
    if (!std::isfinite(position_size) || position_size <= 0.0 || position_size > 1.0)
        return fail("position_size must be in (0, 1]");

    return Result<void>();
}

Result<BacktestConfig> BacktestConfig::parse(const nlohmann::json& j) {
    BacktestConfig config;
    try {
        config.from_json(j);
    } catch (const BacktestError& e) {
        return forward_error<BacktestConfig>(e);
    } catch (const nlohmann::json::exception& e) {
        return make_error<BacktestConfig>(ErrorCode::INVALID_ARGUMENT,
                                          std::string("Malformed backtest config: ") + e.what(),
                                          "BacktestConfig");
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<BacktestConfig>(*valid.error());
    }
    return config;
}

BacktestConfig BacktestConfig::with_dates(const Timestamp& start, const Timestamp& end) const {
    BacktestConfig copy = *this;
    copy.start_date = start;
    copy.end_date = end;
    return copy;
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["initial_capital"] = initial_capital;
    j["commission"] = commission;
    j["slippage"] = slippage;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["benchmark"] = benchmark;
    j["risk_free_rate"] = risk_free_rate;
    j["rebalance_freq"] = rebalance_frequency_to_string(rebalance_freq);
    j["max_leverage"] = max_leverage;
    j["position_size"] = position_size;
    j["allow_short"] = allow_short;
    j["version"] = version;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("commission"))
        commission = j.at("commission").get<double>();
    if (j.contains("slippage"))
        slippage = j.at("slippage").get<double>();
    if (j.contains("start_date"))
        start_date = core::parse_date(j.at("start_date").get<std::string>()).value();
    if (j.contains("end_date"))
        end_date = core::parse_date(j.at("end_date").get<std::string>()).value();
    if (j.contains("benchmark"))
        benchmark = j.at("benchmark").get<std::string>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("rebalance_freq"))
        rebalance_freq = parse_rebalance_frequency(j.at("rebalance_freq").get<std::string>()).value();
    if (j.contains("max_leverage"))
        max_leverage = j.at("max_leverage").get<double>();
    if (j.contains("position_size"))
        position_size = j.at("position_size").get<double>();
    if (j.contains("allow_short"))
        allow_short = j.at("allow_short").get<bool>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

}  // namespace backtest
}  // namespace quanttrade
