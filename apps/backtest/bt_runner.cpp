#include <fstream>
#include <iomanip>
#include <iostream>
#include "quanttrade/backtest/backtest_engine.hpp"
#include "quanttrade/core/config_loader.hpp"
#include "quanttrade/core/logger.hpp"
#include "quanttrade/data/csv_market_data_service.hpp"
#ifdef QUANTTRADE_WITH_POSTGRES
#include "quanttrade/data/postgres_market_data_service.hpp"
#endif

using namespace quanttrade;
using namespace quanttrade::backtest;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json> [override.json]" << std::endl;
}

Result<std::shared_ptr<MarketDataService>> create_data_service(const DataSourceConfig& source) {
    if (source.type == "csv") {
        std::shared_ptr<MarketDataService> service =
            std::make_shared<CsvMarketDataService>(source.csv_directory);
        return service;
    }
#ifdef QUANTTRADE_WITH_POSTGRES
    if (source.type == "postgres") {
        auto postgres =
            std::make_shared<PostgresMarketDataService>(source.connection_string, source.table);
        auto connected = postgres->connect();
        if (connected.is_error()) {
            return forward_error<std::shared_ptr<MarketDataService>>(*connected.error());
        }
        std::shared_ptr<MarketDataService> service = postgres;
        return service;
    }
#endif
    return make_error<std::shared_ptr<MarketDataService>>(
        ErrorCode::INVALID_ARGUMENT, "Data source not available in this build: " + source.type,
        "bt_runner");
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        Logger::reset_for_tests();

        // Logging settings live in the config file, so load it before initializing
        std::optional<std::filesystem::path> override_path;
        if (argc == 3) {
            override_path = argv[2];
        }
        auto config_result = ConfigLoader::load(argv[1], override_path);
        if (config_result.is_error()) {
            std::cerr << "Failed to load configuration: " << config_result.error()->what()
                      << std::endl;
            return 1;
        }
        const AppConfig& app = config_result.value();

        Logger::instance().initialize(app.logging);
        Logger::register_component("bt_runner");
        INFO("Logger initialized successfully");

        auto service = create_data_service(app.data_source);
        if (service.is_error()) {
            ERROR("Failed to create market data service: " << service.error()->what());
            return 1;
        }

        EngineOptions options;
        options.fail_fast = app.fail_fast;
        options.monte_carlo = app.monte_carlo;
        options.walk_forward = app.walk_forward;
        options.optimizer = app.optimizer;

        BacktestEngine engine(service.value(), options);

        INFO("Running " << app.mode << " for " << strategy_type_to_string(app.strategy.type));
        nlohmann::json report;
        if (app.mode == "monte_carlo") {
            report = engine.monte_carlo_backtest(app.strategy_config, app.backtest_config,
                                                 app.monte_carlo.num_simulations);
        } else if (app.mode == "walk_forward") {
            report = engine.walk_forward_analysis(app.strategy_config, app.backtest_config,
                                                  app.walk_forward.train_months,
                                                  app.walk_forward.test_months);
        } else {
            report = engine.backtest_strategy(app.strategy_config, app.backtest_config);
        }

        if (app.output_path.empty()) {
            std::cout << std::setw(2) << report << std::endl;
        } else {
            std::ofstream out(app.output_path);
            if (!out.is_open()) {
                ERROR("Failed to open output file: " << app.output_path);
                return 1;
            }
            out << std::setw(2) << report << std::endl;
            INFO("Report written to " << app.output_path);
        }

        if (report.contains("error")) {
            ERROR(report.at("error").get<std::string>());
            return 1;
        }
        return 0;

    } catch (const BacktestError& e) {
        std::cerr << e.to_string() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
