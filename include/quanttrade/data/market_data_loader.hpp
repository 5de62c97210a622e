// include/quanttrade/data/market_data_loader.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"
#include "quanttrade/data/market_data_service.hpp"
#include "quanttrade/data/price_panel.hpp"

namespace quanttrade {

/**
 * @brief Builds aligned price panels from a market data service
 */
class MarketDataLoader {
public:
    explicit MarketDataLoader(std::shared_ptr<MarketDataService> service);

    /**
     * @brief Fetch every symbol and align them on a common date index
     *
     * Symbols that fail to load or return no rows are logged and left out.
     * The index is the union of all dates; gaps are forward-filled and rows
     * that still have a missing price (before a symbol's first quote) are
     * dropped.
     *
     * @return The panel, or NO_MARKET_DATA if nothing usable remains
     */
    Result<PricePanel> load_price_panel(const std::vector<std::string>& symbols,
                                        const Timestamp& start_date,
                                        const Timestamp& end_date) const;

    /**
     * @brief Fetch a single symbol's cleaned series (finite positive prices, unique dates)
     */
    Result<PriceSeries> load_series(const std::string& symbol, const Timestamp& start_date,
                                    const Timestamp& end_date) const;

private:
    std::shared_ptr<MarketDataService> service_;
};

}  // namespace quanttrade
