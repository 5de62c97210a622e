// src/backtest/portfolio_simulator.cpp

#include "quanttrade/backtest/portfolio_simulator.hpp"
#include <cmath>
#include "quanttrade/core/time_utils.hpp"

namespace quanttrade {
namespace backtest {

namespace {

struct OpenPosition {
    double quantity{0.0};  // Signed: > 0 long, < 0 short
    double entry_price{0.0};
    double entry_fee{0.0};
    Timestamp entry_time;
};

TradeRecord close_trade(const std::string& symbol, const OpenPosition& position,
                        const Timestamp& exit_time, double exit_price, double exit_fee,
                        bool is_open) {
    TradeRecord trade;
    trade.symbol = symbol;
    trade.direction = position.quantity > 0.0 ? Side::BUY : Side::SELL;
    trade.entry_time = position.entry_time;
    trade.exit_time = exit_time;
    trade.entry_price = position.entry_price;
    trade.exit_price = exit_price;
    trade.quantity = std::abs(position.quantity);
    trade.entry_fee = position.entry_fee;
    trade.exit_fee = exit_fee;

    double gross = position.quantity * (exit_price - position.entry_price);
    trade.pnl = gross - position.entry_fee - exit_fee;

    double invested = trade.quantity * position.entry_price;
    trade.return_pct = invested > 0.0 ? trade.pnl / invested : 0.0;
    trade.duration_days = core::days_between(position.entry_time, exit_time);
    trade.is_open = is_open;
    return trade;
}

}  // anonymous namespace

SignalPortfolioSimulator::SignalPortfolioSimulator(
    std::shared_ptr<const SlippageModel> slippage_model)
    : slippage_model_(std::move(slippage_model)) {}

bool SignalPortfolioSimulator::is_rebalance_bar(const std::vector<Timestamp>& dates, size_t row,
                                                RebalanceFrequency frequency) {
    if (row + 1 >= dates.size()) {
        return true;
    }
    switch (frequency) {
        case RebalanceFrequency::WEEKLY:
            return core::week_index(dates[row]) != core::week_index(dates[row + 1]);
        case RebalanceFrequency::MONTHLY:
            return core::month_key(dates[row]) != core::month_key(dates[row + 1]);
        default:
            return true;
    }
}

Result<SimulatedPortfolio> SignalPortfolioSimulator::simulate(const PricePanel& prices,
                                                              const SignalPanel& signals,
                                                              const BacktestConfig& config) const {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<SimulatedPortfolio>(*valid.error());
    }

    if (signals.rows() != prices.rows() || signals.cols() != prices.cols() ||
        signals.values.rows() != static_cast<Eigen::Index>(prices.rows()) ||
        signals.values.cols() != static_cast<Eigen::Index>(prices.cols()) ||
        signals.dates != prices.dates() || signals.symbols != prices.symbols()) {
        return make_error<SimulatedPortfolio>(ErrorCode::INVALID_ARGUMENT,
                                              "Signal panel does not match the price panel",
                                              "PortfolioSimulator");
    }

    const size_t rows = prices.rows();
    const size_t required = static_cast<size_t>(std::max(signals.warmup_period, 0)) + 1;
    if (rows == 0 || rows < required) {
        return make_error<SimulatedPortfolio>(
            ErrorCode::INSUFFICIENT_DATA,
            "Insufficient data: " + std::to_string(rows) + " rows, at least " +
                std::to_string(required) + " required",
            "PortfolioSimulator");
    }

    std::shared_ptr<const SlippageModel> slippage = slippage_model_;
    if (!slippage) {
        slippage = SlippageModelFactory::create_fixed_model(config.slippage);
    }

    const auto& dates = prices.dates();
    const auto& symbols = prices.symbols();
    const size_t cols = prices.cols();

    SimulatedPortfolio portfolio;
    portfolio.initial_capital = config.initial_capital;
    portfolio.frequency = config.rebalance_freq;

    double cash = config.initial_capital;
    std::vector<OpenPosition> positions(cols);

    auto market_value = [&](size_t row) {
        double value = 0.0;
        for (size_t c = 0; c < cols; ++c) {
            value += positions[c].quantity * prices.at(row, c);
        }
        return value;
    };
    auto gross_exposure = [&](size_t row) {
        double exposure = 0.0;
        for (size_t c = 0; c < cols; ++c) {
            exposure += std::abs(positions[c].quantity) * prices.at(row, c);
        }
        return exposure;
    };

    for (size_t r = 0; r < rows; ++r) {
        if (!is_rebalance_bar(dates, r, config.rebalance_freq)) {
            continue;
        }

        // Exits
        for (size_t c = 0; c < cols; ++c) {
            OpenPosition& position = positions[c];
            int signal = signals.at(r, c);
            double close = prices.at(r, c);

            if (position.quantity > 0.0 && signal == -1) {
                double fill = slippage->calculate_slippage(close, position.quantity, Side::SELL);
                double proceeds = position.quantity * fill;
                double fee = proceeds * config.commission;
                cash += proceeds - fee;
                portfolio.trades.push_back(
                    close_trade(symbols[c], position, dates[r], fill, fee, false));
                position = OpenPosition{};
            } else if (position.quantity < 0.0 && signal == 1) {
                double units = -position.quantity;
                double fill = slippage->calculate_slippage(close, units, Side::BUY);
                double cost = units * fill;
                double fee = cost * config.commission;
                cash -= cost + fee;
                portfolio.trades.push_back(
                    close_trade(symbols[c], position, dates[r], fill, fee, false));
                position = OpenPosition{};
            }
        }

        // Entries
        for (size_t c = 0; c < cols; ++c) {
            OpenPosition& position = positions[c];
            if (position.quantity != 0.0) {
                continue;
            }
            int signal = signals.at(r, c);
            bool go_long = signal == 1;
            bool go_short = signal == -1 && config.allow_short;
            if (!go_long && !go_short) {
                continue;
            }

            double equity = cash + market_value(r);
            double headroom = config.max_leverage * equity - gross_exposure(r);
            double notional = std::min(config.position_size * equity, headroom);
            if (equity <= 0.0 || notional <= 0.0) {
                continue;
            }

            double close = prices.at(r, c);
            Side side = go_long ? Side::BUY : Side::SELL;
            double fill = slippage->calculate_slippage(close, notional / close, side);
            if (!(fill > 0.0)) {
                continue;
            }
            // Notional covers the commission as well as the units
            double units = notional / (fill * (1.0 + config.commission));
            double fee = units * fill * config.commission;

            if (go_long) {
                cash -= units * fill + fee;
                position.quantity = units;
            } else {
                cash += units * fill - fee;
                position.quantity = -units;
            }
            position.entry_price = fill;
            position.entry_fee = fee;
            position.entry_time = dates[r];
        }

        double equity = cash + market_value(r);
        double previous =
            portfolio.equity_curve.empty() ? config.initial_capital : portfolio.equity_curve.back();
        double period_return = previous > 0.0 ? equity / previous - 1.0 : 0.0;

        portfolio.timestamps.push_back(dates[r]);
        portfolio.equity_curve.push_back(equity);
        portfolio.returns.push_back(period_return);
    }

    // Positions still held are reported at the last close without an exit fee
    const size_t last = rows - 1;
    for (size_t c = 0; c < cols; ++c) {
        if (positions[c].quantity != 0.0) {
            portfolio.trades.push_back(close_trade(symbols[c], positions[c], dates[last],
                                                   prices.at(last, c), 0.0, true));
        }
    }

    return portfolio;
}

}  // namespace backtest
}  // namespace quanttrade
