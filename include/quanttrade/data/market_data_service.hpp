// include/quanttrade/data/market_data_service.hpp
#pragma once

#include <string>
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"

namespace quanttrade {

/**
 * @brief Abstract source of historical close prices
 * Implementations must be safe to call from several threads
 */
class MarketDataService {
public:
    virtual ~MarketDataService() = default;

    /**
     * @brief Close prices of one symbol between two dates (both inclusive)
     * @param symbol Ticker symbol
     * @param start_date First date of the range
     * @param end_date Last date of the range
     * @return Date-ordered series; an error or an empty series means the symbol is missing
     */
    virtual Result<PriceSeries> get_historical_data(const std::string& symbol,
                                                    const Timestamp& start_date,
                                                    const Timestamp& end_date) = 0;
};

}  // namespace quanttrade
