#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ensemble {

enum class Side { Long };

enum class ExitReason { SignalClose, StopLoss, TakeProfit, ForcedCloseAtHorizon };

const char* toString(ExitReason reason);

enum class PositionState { Open, Closed };

/// One completed position life-cycle. Appended to the trade log and never edited.
struct Trade {
    std::uint64_t position_id{0};
    std::string entry_time;
    std::string exit_time;
    std::size_t entry_index{0};   // step at which the position opened
    std::size_t exit_index{0};
    Side side{Side::Long};
    double entry_price{0};
    double exit_price{0};
    double size{0};               // base-asset units
    double pnl{0};
    double trade_return{0};       // pnl / entry notional, e.g. 0.06 = 6%
    std::size_t hold_bars{0};
    double confidence{0};         // ensemble confidence at entry
    ExitReason exit_reason{ExitReason::SignalClose};
};

/// An open long position. Every field except the state is fixed at open();
/// close() is the only transition and may happen once.
class Position {
public:
    /// Throws std::invalid_argument unless size > 0 and stop_loss < entry < take_profit.
    static Position open(std::uint64_t id, double entry_price, double size,
                         const std::string& opened_at, std::size_t opened_index,
                         double stop_loss_price, double take_profit_price, double confidence);

    /// Transition Open -> Closed and produce the trade record.
    /// Throws std::logic_error if the position is already closed.
    Trade close(double exit_price, const std::string& exit_time, std::size_t exit_index, ExitReason reason);

    std::uint64_t id() const { return id_; }
    Side side() const { return Side::Long; }
    double entryPrice() const { return entry_price_; }
    double size() const { return size_; }
    double notional() const { return entry_price_ * size_; }
    const std::string& openedAt() const { return opened_at_; }
    std::size_t openedIndex() const { return opened_index_; }
    double stopLossPrice() const { return stop_loss_price_; }
    double takeProfitPrice() const { return take_profit_price_; }
    double confidence() const { return confidence_; }
    PositionState state() const { return state_; }
    bool isOpen() const { return state_ == PositionState::Open; }

    double marketValue(double price) const { return size_ * price; }
    double unrealizedPnl(double price) const { return (price - entry_price_) * size_; }

private:
    Position() = default;

    std::uint64_t id_{0};
    double entry_price_{0};
    double size_{0};
    std::string opened_at_;
    std::size_t opened_index_{0};
    double stop_loss_price_{0};
    double take_profit_price_{0};
    double confidence_{0};
    PositionState state_{PositionState::Open};
};

} // namespace ensemble
