// src/backtest/resampler.cpp

#include "quanttrade/backtest/resampler.hpp"
#include <algorithm>

namespace quanttrade {
namespace backtest {

BlockBootstrapResampler::BlockBootstrapResampler(size_t block_size)
    : block_size_(std::max<size_t>(block_size, 1)) {}

Result<PricePanel> BlockBootstrapResampler::resample(const PricePanel& prices,
                                                     std::mt19937_64& rng) const {
    const size_t rows = prices.rows();
    if (rows == 0) {
        return make_error<PricePanel>(ErrorCode::INSUFFICIENT_DATA,
                                      "Cannot resample an empty price panel",
                                      "BlockBootstrapResampler");
    }

    const size_t block = std::min(block_size_, rows);
    const size_t max_start = rows > block ? rows - block - 1 : 0;
    std::uniform_int_distribution<size_t> start_dist(0, max_start);

    const Eigen::MatrixXd& source = prices.values();
    Eigen::MatrixXd values(source.rows(), source.cols());

    size_t filled = 0;
    while (filled < rows) {
        size_t start = start_dist(rng);
        size_t take = std::min(block, rows - filled);
        values.middleRows(static_cast<Eigen::Index>(filled), static_cast<Eigen::Index>(take)) =
            source.middleRows(static_cast<Eigen::Index>(start), static_cast<Eigen::Index>(take));
        filled += take;
    }

    return prices.with_values(std::move(values));
}

Result<PricePanel> IdentityResampler::resample(const PricePanel& prices,
                                               std::mt19937_64& /*rng*/) const {
    return prices.with_values(prices.values());
}

}  // namespace backtest
}  // namespace quanttrade
