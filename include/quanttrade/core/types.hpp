// include/quanttrade/core/types.hpp

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace quanttrade {

/**
 * @brief Timestamp type for consistent time representation
 * Trading dates are stored as midnight UTC time points
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for position sizes
 * Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief A single symbol's close prices, ordered by date
 */
using PriceSeries = std::vector<std::pair<Timestamp, Price>>;

/**
 * @brief Named numeric strategy parameters (e.g. "lookback_period" -> 20)
 */
using ParameterSet = std::map<std::string, double>;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

/**
 * @brief Sampling granularity for rebalancing and returns
 */
enum class RebalanceFrequency {
    DAILY,   // 1D
    WEEKLY,  // 1W
    MONTHLY  // 1M
};

inline std::string rebalance_frequency_to_string(RebalanceFrequency freq) {
    switch (freq) {
        case RebalanceFrequency::WEEKLY:
            return "1W";
        case RebalanceFrequency::MONTHLY:
            return "1M";
        default:
            return "1D";
    }
}

/**
 * @brief Number of sampling periods per year, used for annualisation
 */
inline double periods_per_year(RebalanceFrequency freq) {
    switch (freq) {
        case RebalanceFrequency::WEEKLY:
            return 52.0;
        case RebalanceFrequency::MONTHLY:
            return 12.0;
        default:
            return 252.0;
    }
}

}  // namespace quanttrade
