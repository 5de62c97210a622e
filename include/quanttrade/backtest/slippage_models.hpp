// include/quanttrade/backtest/slippage_models.hpp
#pragma once

#include <memory>
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief Interface for slippage models
 */
class SlippageModel {
public:
    virtual ~SlippageModel() = default;

    /**
     * @brief Calculate price with slippage
     * @param price Reference (close) price
     * @param quantity Trade quantity
     * @param side Trade side
     * @return Fill price, never better than the reference price
     */
    virtual double calculate_slippage(double price, double quantity, Side side) const = 0;
};

/**
 * @brief Constant fractional slippage: buys fill at price * (1 + f), sells at price * (1 - f)
 */
class FixedSlippageModel : public SlippageModel {
public:
    explicit FixedSlippageModel(double fraction);

    double calculate_slippage(double price, double quantity, Side side) const override;

    double fraction() const {
        return fraction_;
    }

private:
    double fraction_;
};

/**
 * @brief Factory for creating slippage models
 */
class SlippageModelFactory {
public:
    static std::unique_ptr<SlippageModel> create_fixed_model(double fraction);
};

}  // namespace backtest
}  // namespace quanttrade
