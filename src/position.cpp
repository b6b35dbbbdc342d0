#include "position.hpp"
#include <cmath>
#include <stdexcept>

namespace ensemble {

const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::SignalClose: return "signal_close";
        case ExitReason::StopLoss: return "stop_loss";
        case ExitReason::TakeProfit: return "take_profit";
        case ExitReason::ForcedCloseAtHorizon: return "forced_close_at_horizon";
    }
    return "unknown";
}

Position Position::open(std::uint64_t id, double entry_price, double size,
                        const std::string& opened_at, std::size_t opened_index,
                        double stop_loss_price, double take_profit_price, double confidence) {
    if (!(size > 0) || !std::isfinite(size))
        throw std::invalid_argument("position size must be positive");
    if (!(stop_loss_price < entry_price && entry_price < take_profit_price))
        throw std::invalid_argument("long position requires stop_loss < entry < take_profit");

    Position p;
    p.id_ = id;
    p.entry_price_ = entry_price;
    p.size_ = size;
    p.opened_at_ = opened_at;
    p.opened_index_ = opened_index;
    p.stop_loss_price_ = stop_loss_price;
    p.take_profit_price_ = take_profit_price;
    p.confidence_ = confidence;
    p.state_ = PositionState::Open;
    return p;
}

Trade Position::close(double exit_price, const std::string& exit_time, std::size_t exit_index, ExitReason reason) {
    if (state_ != PositionState::Open)
        throw std::logic_error("position " + std::to_string(id_) + " is already closed");
    state_ = PositionState::Closed;

    Trade t;
    t.position_id = id_;
    t.entry_time = opened_at_;
    t.exit_time = exit_time;
    t.entry_index = opened_index_;
    t.exit_index = exit_index;
    t.side = Side::Long;
    t.entry_price = entry_price_;
    t.exit_price = exit_price;
    t.size = size_;
    t.pnl = (exit_price - entry_price_) * size_;
    t.trade_return = t.pnl / notional();
    t.hold_bars = exit_index >= opened_index_ ? exit_index - opened_index_ : 0;
    t.confidence = confidence_;
    t.exit_reason = reason;
    return t;
}

} // namespace ensemble
