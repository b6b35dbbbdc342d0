#pragma once

#include "bar.hpp"
#include "config.hpp"
#include "ensemble.hpp"
#include "portfolio.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace ensemble {

enum class DecisionOutcome { Ignored, Opened, ClosedAll };

struct DecisionResult {
    DecisionOutcome outcome{DecisionOutcome::Ignored};
    std::uint64_t position_id{0};   // set when Opened
    std::vector<Trade> closed;      // set when ClosedAll
};

/// Turns ensemble decisions into position life-cycle transitions on a Portfolio.
///
/// Entry: Buy with fewer than max_positions open. Quote size = equity * risk_per_trade * confidence^2,
/// converted to base units at the bar close; stop and target at fixed offsets from entry.
/// A Sell closes every open long at the bar close. Stops and targets are tested against the
/// bar close (not intrabar high/low) and fill at the trigger level, which is optimistic on gaps.
class RiskManager {
public:
    static constexpr double PRICE_EPS = 1e-9;  // relative tolerance for level comparisons

    explicit RiskManager(const RunConfig& cfg);

    /// Close positions whose stop or target the close has reached. Call before onDecision().
    std::vector<Trade> checkExits(const MarketBar& bar, std::size_t step, Portfolio& portfolio) const;

    DecisionResult onDecision(const EnsembleDecision& decision, const MarketBar& bar, std::size_t step,
                              Portfolio& portfolio) const;

    /// Close everything still open at the end of the data (or of an interrupted run).
    std::vector<Trade> closeAtHorizon(const MarketBar& bar, std::size_t step, Portfolio& portfolio) const;

    /// Quote-currency size for an entry at the given equity and ensemble confidence.
    double positionNotional(double equity, double confidence) const;

    double stopLossPrice(double entry) const { return entry * (1.0 - stop_loss_pct_); }
    double takeProfitPrice(double entry) const { return entry * (1.0 + take_profit_pct_); }

private:
    double risk_per_trade_;
    int max_positions_;
    double stop_loss_pct_;
    double take_profit_pct_;
};

} // namespace ensemble
