// include/quanttrade/data/postgres_market_data_service.hpp
#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "quanttrade/data/market_data_service.hpp"

namespace quanttrade {

/**
 * @brief Market data read from a PostgreSQL table of daily bars
 *
 * The table must have columns symbol, time and close. The connection is
 * opened lazily on first use; queries are serialised through a mutex.
 */
class PostgresMarketDataService : public MarketDataService {
public:
    /**
     * @brief Constructor
     * @param connection_string libpq connection string
     * @param table_name Source table, optionally schema-qualified
     */
    PostgresMarketDataService(std::string connection_string,
                              std::string table_name = "market_data.daily_bars");

    ~PostgresMarketDataService() override;

    PostgresMarketDataService(const PostgresMarketDataService&) = delete;
    PostgresMarketDataService& operator=(const PostgresMarketDataService&) = delete;

    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    Result<PriceSeries> get_historical_data(const std::string& symbol,
                                            const Timestamp& start_date,
                                            const Timestamp& end_date) override;

    /**
     * @brief Check that a table name is a plain or schema-qualified identifier
     */
    static Result<void> validate_table_name(const std::string& table_name);

private:
    std::string connection_string_;
    std::string table_name_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace quanttrade
