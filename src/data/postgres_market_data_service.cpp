// src/data/postgres_market_data_service.cpp

#include "quanttrade/data/postgres_market_data_service.hpp"
#include <regex>
#include "quanttrade/core/logger.hpp"
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {

PostgresMarketDataService::PostgresMarketDataService(std::string connection_string,
                                                     std::string table_name)
    : connection_string_(std::move(connection_string)),
      table_name_(std::move(table_name)),
      connection_(nullptr) {
    Logger::register_component("PostgresMarketData");
}

PostgresMarketDataService::~PostgresMarketDataService() {
    disconnect();
}

Result<void> PostgresMarketDataService::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        return Result<void>();
    }

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection",
                                    "PostgresMarketDataService");
        }
        INFO("Connected to PostgreSQL market data source");
        return Result<void>();
    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                "PostgresMarketDataService");
    }
}

void PostgresMarketDataService::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_) {
        connection_.reset();
    }
}

bool PostgresMarketDataService::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_ && connection_->is_open();
}

Result<void> PostgresMarketDataService::validate_table_name(const std::string& table_name) {
    static const std::regex pattern("^[A-Za-z_][A-Za-z0-9_]*(\\.[A-Za-z_][A-Za-z0-9_]*)?$");
    if (!std::regex_match(table_name, pattern)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid table name: " + table_name,
                                "PostgresMarketDataService");
    }
    return Result<void>();
}

Result<PriceSeries> PostgresMarketDataService::get_historical_data(const std::string& symbol,
                                                                   const Timestamp& start_date,
                                                                   const Timestamp& end_date) {
    auto table_validation = validate_table_name(table_name_);
    if (table_validation.is_error()) {
        return forward_error<PriceSeries>(*table_validation.error());
    }

    auto connected = connect();
    if (connected.is_error()) {
        return forward_error<PriceSeries>(*connected.error());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        pqxx::work txn(*connection_);

        std::string query = "SELECT DATE(time)::text, close FROM " + table_name_ +
                            " WHERE symbol = $1 AND DATE(time) BETWEEN $2::date AND $3::date"
                            " ORDER BY time";

        auto result = txn.exec_params(query, symbol, core::format_date(start_date),
                                      core::format_date(end_date));
        txn.commit();

        PriceSeries series;
        series.reserve(result.size());
        for (const auto& row : result) {
            if (row[1].is_null()) {
                continue;
            }
            auto date = core::parse_date(row[0].as<std::string>());
            if (date.is_error()) {
                continue;
            }
            series.emplace_back(date.value(), row[1].as<double>());
        }

        DEBUG("Retrieved " << series.size() << " rows for " << symbol << " from " << table_name_);
        return series;
    } catch (const std::exception& e) {
        return make_error<PriceSeries>(ErrorCode::DATABASE_ERROR,
                                       "Failed to query market data for " + symbol + ": " +
                                           std::string(e.what()),
                                       "PostgresMarketDataService");
    }
}

}  // namespace quanttrade
