#include "backtester.hpp"
#include <iomanip>
#include <utility>

namespace ensemble {

Backtester::Backtester(EnsembleDecisionEngine engine,
                       const RunConfig& config,
                       const IndicatorParams& indicator_params,
                       std::ostream* log)
    : engine_(std::move(engine))
    , config_(config)
    , indicators_(indicator_params)
    , risk_(config)
    , portfolio_(config.initial_balance)
    , log_(log)
{
}

void Backtester::resetRunState() {
    portfolio_ = Portfolio(config_.initial_balance);
    steps_processed_ = 0;
    incidents_ = 0;
    stopped_early_ = false;
    stop_reason_.clear();
    error_.clear();
}

bool Backtester::run(const std::vector<Bar>& bars) {
    resetRunState();
    market_bars_.clear();

    std::string msg;
    if (!validateConfig(config_, msg)) {
        error_ = "invalid configuration: " + msg;
        return false;
    }
    if (!indicators_.compute(bars, market_bars_, msg)) {
        error_ = msg;
        return false;
    }
    simulate(market_bars_);
    return true;
}

bool Backtester::runPrepared(const std::vector<MarketBar>& bars) {
    resetRunState();
    market_bars_ = bars;

    std::string msg;
    if (!validateConfig(config_, msg)) {
        error_ = "invalid configuration: " + msg;
        return false;
    }
    if (market_bars_.empty()) {
        error_ = "no market data";
        return false;
    }
    simulate(market_bars_);
    return true;
}

void Backtester::simulate(const std::vector<MarketBar>& bars) {
    engine_.setConfidenceThreshold(config_.confidence_threshold);
    const double capital_floor = config_.initial_balance * config_.capital_floor_fraction;

    std::size_t last_step = 0;
    for (std::size_t i = 0; i < bars.size(); ++i) {
        if (cancel_flag_ && cancel_flag_->load()) {
            stopped_early_ = true;
            stop_reason_ = "cancelled";
            break;
        }
        const MarketBar& bar = bars[i];

        // 1. Stops and targets before any new signal
        risk_.checkExits(bar, i, portfolio_);

        // 2. Fuse provider signals; an unusable signal makes this step a hold
        EnsembleDecision decision = engine_.evaluate(bar);
        if (decision.degraded) {
            ++incidents_;
            if (log_) *log_ << "[incident] step " << i << ": " << decision.note << " (holding)\n";
        }

        // 3. Open or close positions
        risk_.onDecision(decision, bar, i, portfolio_);

        // 4. Valuation and drawdown for this step
        const EquityPoint& pt = portfolio_.markToMarket(bar.close(), bar.timestamp(), i);
        last_step = i;
        ++steps_processed_;

        if (log_ && config_.progress_interval > 0 && i % config_.progress_interval == 0) {
            *log_ << "progress: step " << i << "/" << bars.size() << " ("
                  << std::fixed << std::setprecision(1) << (100.0 * i / bars.size()) << "%) equity "
                  << std::setprecision(2) << pt.equity << "\n";
        }

        if (pt.equity <= capital_floor) {
            stopped_early_ = true;
            stop_reason_ = "capital exhausted";
            break;
        }
    }

    if (steps_processed_ == 0) return;

    std::vector<Trade> closed = risk_.closeAtHorizon(bars[last_step], last_step, portfolio_);
    if (log_) {
        if (stopped_early_)
            *log_ << "run stopped at step " << last_step << ": " << stop_reason_ << "\n";
        if (!closed.empty())
            *log_ << "closed " << closed.size() << " position(s) at horizon, price "
                  << std::fixed << std::setprecision(2) << bars[last_step].close() << "\n";
    }
}

Metrics Backtester::analyze() const {
    PerformanceAnalyzer analyzer(config_.initial_balance, config_.baseline);
    return analyzer.summarize(portfolio_.trades(), portfolio_.equityCurve());
}

} // namespace ensemble
