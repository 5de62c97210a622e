// include/quanttrade/core/config_loader.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "quanttrade/backtest/backtest_config.hpp"
#include "quanttrade/backtest/monte_carlo.hpp"
#include "quanttrade/backtest/walk_forward.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/logger.hpp"
#include "quanttrade/optimization/parameter_optimizer.hpp"

namespace quanttrade {

/**
 * @brief Where market data comes from
 */
struct DataSourceConfig {
    std::string type{"csv"};            // "csv" or "postgres"
    std::string csv_directory{"data"};  // One <SYMBOL>.csv per symbol
    std::string connection_string;      // libpq connection URI
    std::string table{"market_data.daily_bars"};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["type"] = type;
        j["csv_directory"] = csv_directory;
        j["connection_string"] = connection_string;
        j["table"] = table;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("type"))
            type = j.at("type").get<std::string>();
        if (j.contains("csv_directory"))
            csv_directory = j.at("csv_directory").get<std::string>();
        if (j.contains("connection_string"))
            connection_string = j.at("connection_string").get<std::string>();
        if (j.contains("table"))
            table = j.at("table").get<std::string>();
    }
};

/**
 * @brief Consolidated application configuration
 *
 * The strategy and backtest sections are kept as raw JSON as well so they can
 * be handed to the engine's JSON drivers and echoed in reports.
 */
struct AppConfig {
    LoggerConfig logging;
    DataSourceConfig data_source;

    // Validated on load
    nlohmann::json backtest_config;
    nlohmann::json strategy_config;
    backtest::BacktestConfig backtest;
    StrategyConfig strategy;

    std::string mode{"backtest"};  // backtest | monte_carlo | walk_forward
    backtest::MonteCarloConfig monte_carlo;
    backtest::WalkForwardConfig walk_forward;
    OptimizerConfig optimizer;

    bool fail_fast{false};
    std::string output_path;  // Empty writes the report to stdout

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["logging"] = logging.to_json();
        j["data_source"] = data_source.to_json();
        j["backtest"] = backtest_config;
        j["strategy"] = strategy_config;
        j["mode"] = mode;
        j["monte_carlo"] = monte_carlo.to_json();
        j["walk_forward"] = walk_forward.to_json();
        j["optimizer"] = optimizer.to_json();
        j["fail_fast"] = fail_fast;
        j["output_path"] = output_path;
        return j;
    }
};

/**
 * @brief Loads the application configuration
 *
 * Loads a base JSON file and optionally deep-merges an override file on top
 * of it. Values in the override file win.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration
     * @param config_path Base configuration file
     * @param override_path Optional file merged over the base
     * @return Result containing AppConfig or error
     */
    static Result<AppConfig> load(
        const std::filesystem::path& config_path,
        const std::optional<std::filesystem::path>& override_path = std::nullopt);

    /**
     * @brief Build an AppConfig from an already merged document
     */
    static Result<AppConfig> extract_config(const nlohmann::json& merged);

    /**
     * @brief Load and parse a JSON file
     * @param file_path Path to JSON file
     * @return Result containing parsed JSON or error
     */
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);

    /**
     * @brief Recursively merge JSON objects
     * @param target Target JSON object (modified in place)
     * @param source Source JSON object to merge from
     *
     * For nested objects, performs deep merge. For other types, source overwrites target.
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

private:
    static Result<void> validate_config(const AppConfig& config);

    static void log_config_summary(const AppConfig& config);
};

}  // namespace quanttrade
