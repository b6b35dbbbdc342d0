#include "portfolio.hpp"
#include <algorithm>
#include <stdexcept>

namespace ensemble {

double drawdownFraction(double peak_equity, double equity) {
    if (peak_equity <= 0) return 0;
    return (peak_equity - equity) / peak_equity;
}

Portfolio::Portfolio(double initial_balance)
    : initial_balance_(initial_balance)
    , cash_(initial_balance)
    , peak_equity_(initial_balance)
{
}

void Portfolio::reset() {
    cash_ = initial_balance_;
    realized_pnl_ = 0;
    peak_equity_ = initial_balance_;
    next_id_ = 1;
    open_.clear();
    trades_.clear();
    equity_curve_.clear();
}

std::uint64_t Portfolio::open(double entry_price, double size, const std::string& timestamp, std::size_t step,
                              double stop_loss_price, double take_profit_price, double confidence) {
    Position p = Position::open(next_id_, entry_price, size, timestamp, step,
                                stop_loss_price, take_profit_price, confidence);
    ++next_id_;
    cash_ -= p.notional();
    open_.push_back(p);
    return p.id();
}

const Trade& Portfolio::close(std::uint64_t position_id, double exit_price, const std::string& timestamp,
                              std::size_t step, ExitReason reason) {
    auto it = std::find_if(open_.begin(), open_.end(),
                           [position_id](const Position& p) { return p.id() == position_id; });
    if (it == open_.end())
        throw std::out_of_range("no open position with id " + std::to_string(position_id));

    Trade t = it->close(exit_price, timestamp, step, reason);
    cash_ += it->notional() + t.pnl;
    realized_pnl_ += t.pnl;
    open_.erase(it);
    trades_.push_back(t);
    return trades_.back();
}

std::vector<Trade> Portfolio::closeAll(double exit_price, const std::string& timestamp, std::size_t step,
                                       ExitReason reason) {
    std::vector<std::uint64_t> ids;
    ids.reserve(open_.size());
    for (const auto& p : open_) ids.push_back(p.id());

    std::vector<Trade> closed;
    closed.reserve(ids.size());
    for (std::uint64_t id : ids)
        closed.push_back(close(id, exit_price, timestamp, step, reason));
    return closed;
}

double Portfolio::equity(double price) const {
    double value = cash_;
    for (const auto& p : open_) value += p.marketValue(price);
    return value;
}

const EquityPoint& Portfolio::markToMarket(double close, const std::string& timestamp, std::size_t step) {
    EquityPoint pt;
    pt.step = step;
    pt.timestamp = timestamp;
    pt.close = close;
    pt.cash = cash_;
    pt.equity = equity(close);
    peak_equity_ = std::max(peak_equity_, pt.equity);
    pt.peak_equity = peak_equity_;
    pt.drawdown = drawdownFraction(peak_equity_, pt.equity);
    pt.open_positions = open_.size();
    equity_curve_.push_back(pt);
    return equity_curve_.back();
}

} // namespace ensemble
