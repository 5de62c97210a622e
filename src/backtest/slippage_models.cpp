// src/backtest/slippage_models.cpp

#include "quanttrade/backtest/slippage_models.hpp"

namespace quanttrade {
namespace backtest {

FixedSlippageModel::FixedSlippageModel(double fraction) : fraction_(fraction) {}

double FixedSlippageModel::calculate_slippage(double price, double /*quantity*/,
                                              Side side) const {
    switch (side) {
        case Side::BUY:
            return price * (1.0 + fraction_);
        case Side::SELL:
            return price * (1.0 - fraction_);
        default:
            return price;
    }
}

std::unique_ptr<SlippageModel> SlippageModelFactory::create_fixed_model(double fraction) {
    return std::make_unique<FixedSlippageModel>(fraction);
}

}  // namespace backtest
}  // namespace quanttrade
