// src/core/config_loader.cpp

#include "quanttrade/core/config_loader.hpp"

#include <fstream>

#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {

Result<nlohmann::json> ConfigLoader::load_json_file(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                          "Failed to open config file: " + file_path.string(),
                                          "ConfigLoader");
    }

    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(
            ErrorCode::JSON_PARSE_ERROR,
            "Failed to parse JSON file " + file_path.string() + ": " + e.what(), "ConfigLoader");
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Error reading config file " + file_path.string() + ": " +
                                              e.what(),
                                          "ConfigLoader");
    }
}

void ConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();

        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<AppConfig> ConfigLoader::extract_config(const nlohmann::json& merged) {
    if (!merged.is_object()) {
        return make_error<AppConfig>(ErrorCode::INVALID_DATA,
                                     "Configuration root must be a JSON object", "ConfigLoader");
    }

    AppConfig config;
    try {
        if (merged.contains("logging")) {
            config.logging.from_json(merged.at("logging"));
        }
        if (merged.contains("data_source")) {
            config.data_source.from_json(merged.at("data_source"));
        }

        config.backtest_config =
            merged.contains("backtest") ? merged.at("backtest") : nlohmann::json::object();
        if (merged.contains("strategy")) {
            config.strategy_config = merged.at("strategy");
        }

        if (merged.contains("mode")) {
            config.mode = merged.at("mode").get<std::string>();
        }
        if (merged.contains("monte_carlo")) {
            config.monte_carlo.from_json(merged.at("monte_carlo"));
        }
        if (merged.contains("walk_forward")) {
            config.walk_forward.from_json(merged.at("walk_forward"));
        }
        if (merged.contains("optimizer")) {
            config.optimizer.from_json(merged.at("optimizer"));
        }
        if (merged.contains("fail_fast")) {
            config.fail_fast = merged.at("fail_fast").get<bool>();
        }
        if (merged.contains("output_path")) {
            config.output_path = merged.at("output_path").get<std::string>();
        }
    } catch (const std::exception& e) {
        return make_error<AppConfig>(ErrorCode::INVALID_DATA,
                                     "Failed to extract config: " + std::string(e.what()),
                                     "ConfigLoader");
    }

    auto backtest = backtest::BacktestConfig::parse(config.backtest_config);
    if (backtest.is_error()) {
        return forward_error<AppConfig>(*backtest.error());
    }
    config.backtest = backtest.take_value();

    auto strategy = StrategyConfig::parse(config.strategy_config);
    if (strategy.is_error()) {
        return forward_error<AppConfig>(*strategy.error());
    }
    config.strategy = strategy.take_value();

    return config;
}

Result<void> ConfigLoader::validate_config(const AppConfig& config) {
    if (config.mode != "backtest" && config.mode != "monte_carlo" &&
        config.mode != "walk_forward") {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "mode must be one of backtest, monte_carlo, walk_forward",
                                "ConfigLoader");
    }
    if (config.data_source.type == "csv") {
        if (config.data_source.csv_directory.empty()) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "data_source.csv_directory is required", "ConfigLoader");
        }
    } else if (config.data_source.type == "postgres") {
        if (config.data_source.connection_string.empty()) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "data_source.connection_string is required",
                                    "ConfigLoader");
        }
    } else {
        return make_error<void>(ErrorCode::INVALID_DATA,
                                "Unknown data_source.type: " + config.data_source.type,
                                "ConfigLoader");
    }

    auto mc = config.monte_carlo.validate();
    if (mc.is_error()) {
        return mc;
    }
    auto wf = config.walk_forward.validate();
    if (wf.is_error()) {
        return wf;
    }
    return config.optimizer.validate();
}

void ConfigLoader::log_config_summary(const AppConfig& config) {
    if (!Logger::instance().is_initialized()) {
        return;
    }
    INFO("Config summary: mode=" + config.mode + ", strategy=" +
         strategy_type_to_string(config.strategy.type) +
         ", symbols=" + std::to_string(config.strategy.symbols.size()));
    INFO("Config summary: data_source=" + config.data_source.type + ", period=" +
         core::format_date(config.backtest.start_date) + " to " +
         core::format_date(config.backtest.end_date) +
         ", initial_capital=" + std::to_string(config.backtest.initial_capital));
}

Result<AppConfig> ConfigLoader::load(const std::filesystem::path& config_path,
                                     const std::optional<std::filesystem::path>& override_path) {
    auto base = load_json_file(config_path);
    if (base.is_error()) {
        return forward_error<AppConfig>(*base.error());
    }
    nlohmann::json merged = base.take_value();

    if (override_path) {
        auto overrides = load_json_file(*override_path);
        if (overrides.is_error()) {
            return forward_error<AppConfig>(*overrides.error());
        }
        merge_json(merged, overrides.value());
    }

    auto config = extract_config(merged);
    if (config.is_error()) {
        return config;
    }

    auto valid = validate_config(config.value());
    if (valid.is_error()) {
        return forward_error<AppConfig>(*valid.error());
    }

    log_config_summary(config.value());
    return config;
}

}  // namespace quanttrade
