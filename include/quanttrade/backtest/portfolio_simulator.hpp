// include/quanttrade/backtest/portfolio_simulator.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "quanttrade/backtest/backtest_config.hpp"
#include "quanttrade/backtest/slippage_models.hpp"
#include "quanttrade/core/error.hpp"
#include "quanttrade/core/types.hpp"
#include "quanttrade/data/price_panel.hpp"
#include "quanttrade/strategy/signal_panel.hpp"

namespace quanttrade {
namespace backtest {

/**
 * @brief One round trip in a single symbol
 */
struct TradeRecord {
    std::string symbol;
    Side direction{Side::BUY};  // BUY = long, SELL = short
    Timestamp entry_time;
    Timestamp exit_time;
    double entry_price{0.0};  // Fill price including slippage
    double exit_price{0.0};   // Fill price, or last close for open trades
    double quantity{0.0};     // Absolute number of units
    double entry_fee{0.0};
    double exit_fee{0.0};
    double pnl{0.0};         // Realised P&L net of both fees
    double return_pct{0.0};  // pnl / (quantity * entry_price)
    double duration_days{0.0};
    bool is_open{false};  // Still held at the end of the run
};

/**
 * @brief Output of a portfolio simulation
 *
 * equity_curve[i] is the portfolio value at timestamps[i]; returns[i] is the
 * change from the previous sample (from initial_capital for i = 0).
 */
struct SimulatedPortfolio {
    double initial_capital{0.0};
    RebalanceFrequency frequency{RebalanceFrequency::DAILY};
    std::vector<Timestamp> timestamps;
    std::vector<double> equity_curve;
    std::vector<double> returns;
    std::vector<TradeRecord> trades;

    double final_equity() const {
        return equity_curve.empty() ? initial_capital : equity_curve.back();
    }
};

/**
 * @brief Turns prices and signals into a simulated portfolio
 */
class PortfolioSimulator {
public:
    virtual ~PortfolioSimulator() = default;

    /**
     * @brief Run the simulation
     * @param prices Close prices
     * @param signals Signals on the same index as prices
     * @param config Capital, costs and sizing
     * @return The portfolio, INVALID_ARGUMENT on mismatched inputs or
     *         INSUFFICIENT_DATA when there are fewer rows than warm-up + 1
     */
    virtual Result<SimulatedPortfolio> simulate(const PricePanel& prices,
                                                const SignalPanel& signals,
                                                const BacktestConfig& config) const = 0;
};

/**
 * @brief Event-driven simulator acting on signal changes at rebalance bars
 *
 * On each rebalance bar exits are processed before entries:
 * - +1 opens a long when flat; -1 closes a long
 * - with allow_short, -1 opens a short when flat and +1 covers it
 * Entries are sized at position_size x equity and capped so that gross
 * exposure stays within max_leverage x equity. Every fill pays slippage and
 * commission.
 */
class SignalPortfolioSimulator : public PortfolioSimulator {
public:
    /**
     * @param slippage_model Override for the fill model; when null a
     *        FixedSlippageModel with config.slippage is used
     */
    explicit SignalPortfolioSimulator(std::shared_ptr<const SlippageModel> slippage_model = nullptr);

    Result<SimulatedPortfolio> simulate(const PricePanel& prices, const SignalPanel& signals,
                                        const BacktestConfig& config) const override;

    /**
     * @brief Whether row `row` of `dates` closes a rebalance period
     */
    static bool is_rebalance_bar(const std::vector<Timestamp>& dates, size_t row,
                                 RebalanceFrequency frequency);

private:
    std::shared_ptr<const SlippageModel> slippage_model_;
};

}  // namespace backtest
}  // namespace quanttrade
