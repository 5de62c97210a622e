// include/quanttrade/backtest/resampler.hpp
#pragma once

#include <random>
#include "quanttrade/core/error.hpp"
#include "quanttrade/data/price_panel.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief Produces an alternative price history for a Monte Carlo run
 */
class Resampler {
public:
    virtual ~Resampler() = default;

    /**
     * @brief Draw one resampled panel
     * @param prices Source panel
     * @param rng Generator owned by the calling simulation
     * @return Panel with the same dates and symbols as the source
     */
    virtual Result<PricePanel> resample(const PricePanel& prices, std::mt19937_64& rng) const = 0;
};

/**
 * @brief Moving-block bootstrap over price rows
 *
 * Blocks of block_size consecutive rows are drawn with replacement, start
 * index uniform in [0, rows - block_size), concatenated and trimmed to the
 * original length. The original date index is kept so calendar-based
 * sampling still applies.
 */
class BlockBootstrapResampler : public Resampler {
public:
    explicit BlockBootstrapResampler(size_t block_size = 20);

    Result<PricePanel> resample(const PricePanel& prices, std::mt19937_64& rng) const override;

    size_t block_size() const {
        return block_size_;
    }

private:
    size_t block_size_;
};

/**
 * @brief Returns the source panel unchanged
 */
class IdentityResampler : public Resampler {
public:
    Result<PricePanel> resample(const PricePanel& prices, std::mt19937_64& rng) const override;
};

}  // namespace backtest
}  // namespace quanttrade
