#pragma once

#include "bar.hpp"
#include "config.hpp"
#include "ensemble.hpp"
#include "indicators.hpp"
#include "performance.hpp"
#include "portfolio.hpp"
#include "risk_manager.hpp"
#include <atomic>
#include <cstddef>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace ensemble {

/// Runs one simulation: per step, check stops/targets, ask the ensemble, apply the decision,
/// mark to market. Owns its engine, portfolio and trade log, so independent Backtesters can run
/// on different threads.
class Backtester {
public:
    /// log may be nullptr to silence progress and incident messages.
    Backtester(EnsembleDecisionEngine engine,
               const RunConfig& config,
               const IndicatorParams& indicator_params = IndicatorParams{},
               std::ostream* log = &std::cerr);

    /// Compute indicators from raw bars, then simulate. Returns false (see error()) if the config
    /// is invalid or the data is malformed or too short; nothing is simulated in that case.
    bool run(const std::vector<Bar>& bars);

    /// Simulate over bars whose indicators are already computed.
    bool runPrepared(const std::vector<MarketBar>& bars);

    /// Externally owned flag checked once per step; when set the run stops and keeps partial results.
    void setCancelFlag(const std::atomic<bool>* flag) { cancel_flag_ = flag; }

    /// Summary of the trade log and equity timeline produced so far.
    Metrics analyze() const;

    const RunConfig& config() const { return config_; }
    const EnsembleDecisionEngine& engine() const { return engine_; }
    const Portfolio& portfolio() const { return portfolio_; }
    const std::vector<Trade>& trades() const { return portfolio_.trades(); }
    const std::vector<EquityPoint>& equityCurve() const { return portfolio_.equityCurve(); }
    const std::vector<MarketBar>& marketBars() const { return market_bars_; }

    std::size_t stepsProcessed() const { return steps_processed_; }
    std::size_t incidents() const { return incidents_; }
    bool stoppedEarly() const { return stopped_early_; }
    const std::string& stopReason() const { return stop_reason_; }
    const std::string& error() const { return error_; }

private:
    void resetRunState();
    void simulate(const std::vector<MarketBar>& bars);

    EnsembleDecisionEngine engine_;
    RunConfig config_;
    IndicatorEngine indicators_;
    RiskManager risk_;
    Portfolio portfolio_;
    std::ostream* log_;
    const std::atomic<bool>* cancel_flag_{nullptr};

    std::vector<MarketBar> market_bars_;
    std::size_t steps_processed_{0};
    std::size_t incidents_{0};
    bool stopped_early_{false};
    std::string stop_reason_;
    std::string error_;
};

} // namespace ensemble
