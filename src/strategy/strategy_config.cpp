// src/strategy/strategy_config.cpp

#include "quanttrade/strategy/strategy_config.hpp"
#include <cmath>

namespace quanttrade {

namespace {

// Overload set helper for std::visit
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <typename T>
void read_if_present(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j.at(key).is_null()) {
        out = j.at(key).get<T>();
    }
}

// Parameters may be flat keys or nested under "parameters"; nested values win
void read_parameter(const nlohmann::json& j, const char* key, int& out) {
    double value = out;
    read_if_present(j, key, value);
    if (j.contains("parameters") && j.at("parameters").is_object()) {
        read_if_present(j.at("parameters"), key, value);
    }
    out = static_cast<int>(std::lround(value));
}

void read_parameter(const nlohmann::json& j, const char* key, double& out) {
    read_if_present(j, key, out);
    if (j.contains("parameters") && j.at("parameters").is_object()) {
        read_if_present(j.at("parameters"), key, out);
    }
}

int to_window(double value) {
    return static_cast<int>(std::lround(value));
}

}  // anonymous namespace

std::string strategy_type_to_string(StrategyType type) {
    switch (type) {
        case StrategyType::MEAN_REVERSION:
            return "mean_reversion";
        case StrategyType::PAIRS_TRADING:
            return "pairs_trading";
        default:
            return "momentum";
    }
}

Result<StrategyType> strategy_type_from_string(const std::string& name) {
    if (name == "momentum")
        return StrategyType::MOMENTUM;
    if (name == "mean_reversion")
        return StrategyType::MEAN_REVERSION;
    if (name == "pairs_trading")
        return StrategyType::PAIRS_TRADING;
    return make_error<StrategyType>(ErrorCode::UNSUPPORTED_STRATEGY,
                                    "Unsupported strategy type: " + name, "StrategyConfig");
}

Result<StrategyConfig> StrategyConfig::parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        return make_error<StrategyConfig>(ErrorCode::INVALID_ARGUMENT,
                                          "Strategy config must be a JSON object",
                                          "StrategyConfig");
    }
    if (!j.contains("type") || !j.at("type").is_string()) {
        return make_error<StrategyConfig>(ErrorCode::INVALID_ARGUMENT,
                                          "Strategy config requires a string 'type'",
                                          "StrategyConfig");
    }
    if (!j.contains("symbols") || !j.at("symbols").is_array()) {
        return make_error<StrategyConfig>(ErrorCode::INVALID_ARGUMENT,
                                          "Strategy config requires a 'symbols' array",
                                          "StrategyConfig");
    }

    auto type = strategy_type_from_string(j.at("type").get<std::string>());
    if (type.is_error()) {
        return forward_error<StrategyConfig>(*type.error());
    }

    StrategyConfig config;
    try {
        config.type = type.value();
        config.symbols = j.at("symbols").get<std::vector<std::string>>();
        read_if_present(j, "name", config.name);

        switch (config.type) {
            case StrategyType::MOMENTUM: {
                MomentumParams p;
                read_parameter(j, "lookback_period", p.lookback_period);
                // "threshold" is accepted as an alias of "momentum_threshold"
                read_parameter(j, "threshold", p.momentum_threshold);
                read_parameter(j, "momentum_threshold", p.momentum_threshold);
                config.params = p;
                break;
            }
            case StrategyType::MEAN_REVERSION: {
                MeanReversionParams p;
                read_parameter(j, "lookback_period", p.lookback_period);
                read_parameter(j, "std_dev", p.std_dev);
                config.params = p;
                break;
            }
            case StrategyType::PAIRS_TRADING: {
                PairsTradingParams p;
                read_parameter(j, "spread_window", p.spread_window);
                read_parameter(j, "entry_threshold", p.entry_threshold);
                read_parameter(j, "exit_threshold", p.exit_threshold);
                config.params = p;
                break;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<StrategyConfig>(ErrorCode::INVALID_ARGUMENT,
                                          std::string("Malformed strategy config: ") + e.what(),
                                          "StrategyConfig");
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<StrategyConfig>(*valid.error());
    }
    return config;
}

Result<void> StrategyConfig::validate() const {
    if (symbols.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Strategy requires at least one symbol", "StrategyConfig");
    }
    for (const auto& symbol : symbols) {
        if (symbol.empty()) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Empty symbol in strategy",
                                    "StrategyConfig");
        }
    }

    // Variant alternatives are declared in StrategyType order
    if (params.index() != static_cast<size_t>(type)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Parameters do not match strategy type " +
                                    strategy_type_to_string(type),
                                "StrategyConfig");
    }

    std::string problem = std::visit(
        overloaded{
            [](const MomentumParams& p) -> std::string {
                if (p.lookback_period < 1)
                    return "lookback_period must be >= 1";
                if (!std::isfinite(p.momentum_threshold) || p.momentum_threshold < 0.0)
                    return "momentum_threshold must be a non-negative number";
                return "";
            },
            [](const MeanReversionParams& p) -> std::string {
                if (p.lookback_period < 2)
                    return "lookback_period must be >= 2";
                if (!std::isfinite(p.std_dev) || p.std_dev <= 0.0)
                    return "std_dev must be positive";
                return "";
            },
            [](const PairsTradingParams& p) -> std::string {
                if (p.spread_window < 2)
                    return "spread_window must be >= 2";
                if (!std::isfinite(p.entry_threshold) || !std::isfinite(p.exit_threshold) ||
                    p.exit_threshold < 0.0 || p.entry_threshold < p.exit_threshold)
                    return "thresholds must satisfy 0 <= exit_threshold <= entry_threshold";
                return "";
            }},
        params);

    if (!problem.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                strategy_type_to_string(type) + ": " + problem, "StrategyConfig");
    }
    return Result<void>();
}

ParameterSet StrategyConfig::parameters() const {
    ParameterSet result;
    std::visit(overloaded{[&](const MomentumParams& p) {
                              result["lookback_period"] = p.lookback_period;
                              result["momentum_threshold"] = p.momentum_threshold;
                          },
                          [&](const MeanReversionParams& p) {
                              result["lookback_period"] = p.lookback_period;
                              result["std_dev"] = p.std_dev;
                          },
                          [&](const PairsTradingParams& p) {
                              result["spread_window"] = p.spread_window;
                              result["entry_threshold"] = p.entry_threshold;
                              result["exit_threshold"] = p.exit_threshold;
                          }},
               params);
    return result;
}

StrategyConfig StrategyConfig::with_parameters(const ParameterSet& overrides) const {
    StrategyConfig copy = *this;
    auto lookup = [&overrides](const char* key, double fallback) {
        auto it = overrides.find(key);
        return it == overrides.end() ? fallback : it->second;
    };

    std::visit(overloaded{[&](MomentumParams& p) {
                              p.lookback_period =
                                  to_window(lookup("lookback_period", p.lookback_period));
                              p.momentum_threshold =
                                  lookup("threshold", p.momentum_threshold);
                              p.momentum_threshold =
                                  lookup("momentum_threshold", p.momentum_threshold);
                          },
                          [&](MeanReversionParams& p) {
                              p.lookback_period =
                                  to_window(lookup("lookback_period", p.lookback_period));
                              p.std_dev = lookup("std_dev", p.std_dev);
                          },
                          [&](PairsTradingParams& p) {
                              p.spread_window = to_window(lookup("spread_window", p.spread_window));
                              p.entry_threshold = lookup("entry_threshold", p.entry_threshold);
                              p.exit_threshold = lookup("exit_threshold", p.exit_threshold);
                          }},
               copy.params);
    return copy;
}

int StrategyConfig::max_lookback() const {
    return std::visit(overloaded{[](const MomentumParams& p) { return p.lookback_period; },
                                 [](const MeanReversionParams& p) { return p.lookback_period; },
                                 [](const PairsTradingParams& p) { return p.spread_window; }},
                      params);
}

nlohmann::json StrategyConfig::to_json() const {
    nlohmann::json j;
    j["type"] = strategy_type_to_string(type);
    j["symbols"] = symbols;
    if (!name.empty()) {
        j["name"] = name;
    }
    for (const auto& [key, value] : parameters()) {
        if (key == "lookback_period" || key == "spread_window") {
            j[key] = static_cast<int>(value);
        } else {
            j[key] = value;
        }
    }
    return j;
}

void StrategyConfig::from_json(const nlohmann::json& j) {
    auto parsed = parse(j);
    *this = parsed.take_value();
}

}  // namespace quanttrade
