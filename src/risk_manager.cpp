#include "risk_manager.hpp"
#include <cmath>

namespace ensemble {

RiskManager::RiskManager(const RunConfig& cfg)
    : risk_per_trade_(cfg.risk_per_trade)
    , max_positions_(cfg.max_positions)
    , stop_loss_pct_(cfg.stop_loss_pct)
    , take_profit_pct_(cfg.take_profit_pct)
{
}

double RiskManager::positionNotional(double equity, double confidence) const {
    return equity * risk_per_trade_ * confidence * confidence;
}

std::vector<Trade> RiskManager::checkExits(const MarketBar& bar, std::size_t step, Portfolio& portfolio) const {
    struct Exit {
        std::uint64_t id;
        double price;
        ExitReason reason;
    };
    const double price = bar.close();

    // Decide on a snapshot first; closing mutates the open set.
    std::vector<Exit> exits;
    for (const auto& p : portfolio.openPositions()) {
        if (price <= p.stopLossPrice() * (1.0 + PRICE_EPS))
            exits.push_back({ p.id(), p.stopLossPrice(), ExitReason::StopLoss });
        else if (price >= p.takeProfitPrice() * (1.0 - PRICE_EPS))
            exits.push_back({ p.id(), p.takeProfitPrice(), ExitReason::TakeProfit });
    }

    std::vector<Trade> closed;
    closed.reserve(exits.size());
    for (const auto& e : exits)
        closed.push_back(portfolio.close(e.id, e.price, bar.timestamp(), step, e.reason));
    return closed;
}

DecisionResult RiskManager::onDecision(const EnsembleDecision& decision, const MarketBar& bar, std::size_t step,
                                       Portfolio& portfolio) const {
    DecisionResult result;
    const double price = bar.close();

    if (decision.action == Action::Buy) {
        if (static_cast<int>(portfolio.openCount()) >= max_positions_) return result;
        double notional = positionNotional(portfolio.equity(price), decision.confidence);
        if (!(notional > 0) || !std::isfinite(notional) || price <= 0) return result;

        result.position_id = portfolio.open(price, notional / price, bar.timestamp(), step,
                                            stopLossPrice(price), takeProfitPrice(price), decision.confidence);
        result.outcome = DecisionOutcome::Opened;
    } else if (decision.action == Action::Sell) {
        if (portfolio.openCount() == 0) return result;
        result.closed = portfolio.closeAll(price, bar.timestamp(), step, ExitReason::SignalClose);
        result.outcome = DecisionOutcome::ClosedAll;
    }
    return result;
}

std::vector<Trade> RiskManager::closeAtHorizon(const MarketBar& bar, std::size_t step, Portfolio& portfolio) const {
    return portfolio.closeAll(bar.close(), bar.timestamp(), step, ExitReason::ForcedCloseAtHorizon);
}

} // namespace ensemble
