#pragma once

#include "position.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ensemble {

/// Valuation snapshot recorded once per processed step.
struct EquityPoint {
    std::size_t step{0};
    std::string timestamp;
    double close{0};
    double cash{0};
    double equity{0};       // cash + market value of open positions
    double peak_equity{0};
    double drawdown{0};     // (peak - equity) / peak
    std::size_t open_positions{0};
};

/// Drawdown of equity from peak as a fraction (0 if peak <= 0).
double drawdownFraction(double peak_equity, double equity);

/// Tracks cash, open positions, realized P&L, peak equity, the trade log and the equity timeline
/// for one run. Opening deducts the entry notional from cash; closing credits notional + pnl.
class Portfolio {
public:
    explicit Portfolio(double initial_balance = 100000.0);

    /// Clear everything back to the initial balance.
    void reset();

    /// Open a long position and return its id. Throws std::invalid_argument on an invalid position.
    std::uint64_t open(double entry_price, double size, const std::string& timestamp, std::size_t step,
                       double stop_loss_price, double take_profit_price, double confidence);

    /// Close one open position at exit_price and append the trade.
    /// Throws std::out_of_range if no open position has that id.
    const Trade& close(std::uint64_t position_id, double exit_price, const std::string& timestamp,
                       std::size_t step, ExitReason reason);

    /// Close every open position (in opening order) at the same price. Returns the new trades.
    std::vector<Trade> closeAll(double exit_price, const std::string& timestamp, std::size_t step, ExitReason reason);

    /// Equity if open positions were valued at price.
    double equity(double price) const;

    /// Value positions at close, update the peak and append an EquityPoint.
    const EquityPoint& markToMarket(double close, const std::string& timestamp, std::size_t step);

    double initialBalance() const { return initial_balance_; }
    double cash() const { return cash_; }
    double realizedPnl() const { return realized_pnl_; }
    double peakEquity() const { return peak_equity_; }
    std::size_t openCount() const { return open_.size(); }
    const std::vector<Position>& openPositions() const { return open_; }
    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<EquityPoint>& equityCurve() const { return equity_curve_; }

private:
    double initial_balance_;
    double cash_;
    double realized_pnl_{0};
    double peak_equity_;
    std::uint64_t next_id_{1};

    std::vector<Position> open_;
    std::vector<Trade> trades_;
    std::vector<EquityPoint> equity_curve_;
};

} // namespace ensemble
