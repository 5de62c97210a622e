// include/quanttrade/data/csv_market_data_service.hpp
#pragma once

#include <string>
#include "quanttrade/data/market_data_service.hpp"

namespace quanttrade {

/**
 * @brief Market data read from one CSV file per symbol
 *
 * Files are named <directory>/<SYMBOL>.csv. The header row must contain a
 * "Date" column (YYYY-MM-DD) and either "Adj Close" or "Close"; "Adj Close"
 * wins when both are present. Blank or unparseable price cells are skipped.
 */
class CsvMarketDataService : public MarketDataService {
public:
    explicit CsvMarketDataService(std::string directory);

    Result<PriceSeries> get_historical_data(const std::string& symbol,
                                            const Timestamp& start_date,
                                            const Timestamp& end_date) override;

    /**
     * @brief Check that a symbol names a file inside the data directory
     */
    static Result<void> validate_symbol(const std::string& symbol);

    const std::string& directory() const {
        return directory_;
    }

private:
    std::string directory_;
};

}  // namespace quanttrade
