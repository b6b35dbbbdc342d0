#include "performance.hpp"
#include "data_source.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace ensemble {

namespace {

constexpr double HIGH_CONFIDENCE = 0.8;
constexpr double LOW_CONFIDENCE = 0.5;
constexpr double DRAWDOWN_FLOOR = 0.01;  // keeps risk-adjusted return finite on flat curves

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

// population (n) standard deviation
double stddev(const std::vector<double>& v) {
    if (v.empty()) return 0;
    double m = mean(v);
    double sq_sum = 0;
    for (double x : v) sq_sum += (x - m) * (x - m);
    return std::sqrt(sq_sum / static_cast<double>(v.size()));
}

} // namespace

const char* toString(MetricsStatus status) {
    switch (status) {
        case MetricsStatus::Ok: return "ok";
        case MetricsStatus::NoTrades: return "no_trades";
        case MetricsStatus::UndefinedSharpe: return "undefined_sharpe";
    }
    return "unknown";
}

PerformanceAnalyzer::PerformanceAnalyzer(double initial_balance, const BaselineScorecard& baseline)
    : initial_balance_(initial_balance), baseline_(baseline) {}

double PerformanceAnalyzer::performanceScore(double sharpe, double win_rate, double max_drawdown) {
    double score = 50.0 + sharpe * 10.0 + win_rate * 30.0 - max_drawdown * 100.0;
    return std::min(100.0, std::max(0.0, score));
}

std::string PerformanceAnalyzer::grade(double score) {
    if (score >= 90) return "A+";
    if (score >= 85) return "A";
    if (score >= 80) return "A-";
    if (score >= 75) return "B+";
    if (score >= 70) return "B";
    if (score >= 65) return "B-";
    if (score >= 60) return "C+";
    if (score >= 55) return "C";
    if (score >= 50) return "C-";
    return "D";
}

double PerformanceAnalyzer::maxDrawdown(const std::vector<EquityPoint>& equity_curve) {
    double max_dd = 0;
    for (const auto& pt : equity_curve) max_dd = std::max(max_dd, pt.drawdown);
    return max_dd;
}

BaselineComparison PerformanceAnalyzer::compareToBaseline(double total_return, double sharpe, double win_rate,
                                                          double max_drawdown) const {
    BaselineComparison c;
    c.baseline = baseline_;
    c.total_return_improvement = (total_return - baseline_.total_return) / baseline_.total_return;
    c.sharpe_improvement = (sharpe - baseline_.sharpe_ratio) / baseline_.sharpe_ratio;
    c.win_rate_improvement = (win_rate - baseline_.win_rate) / baseline_.win_rate;
    c.drawdown_improvement = -(max_drawdown - baseline_.max_drawdown) / baseline_.max_drawdown;
    c.sharpe_target_met = c.sharpe_improvement >= baseline_.sharpe_target;
    c.win_rate_target_met = c.win_rate_improvement >= baseline_.win_rate_target;
    c.drawdown_target_met = c.drawdown_improvement >= baseline_.drawdown_target;
    return c;
}

Metrics PerformanceAnalyzer::summarize(const std::vector<Trade>& trades,
                                       const std::vector<EquityPoint>& equity_curve) const {
    Metrics m;
    m.initial_balance = initial_balance_;
    m.final_equity = equity_curve.empty() ? initial_balance_ : equity_curve.back().equity;

    if (trades.empty()) {
        m.status = MetricsStatus::NoTrades;
        m.message = "No trades executed - insufficient signal confidence";
        m.grade = "D";
        return m;
    }

    if (equity_curve.empty()) {
        double pnl_sum = 0;
        for (const auto& t : trades) pnl_sum += t.pnl;
        m.final_equity = initial_balance_ + pnl_sum;
    }
    m.total_return = (initial_balance_ != 0) ? (m.final_equity - initial_balance_) / initial_balance_ : 0;

    std::vector<double> returns;
    std::vector<double> confidences;
    returns.reserve(trades.size());
    confidences.reserve(trades.size());
    double win_sum = 0;
    double loss_sum = 0;
    int stop_losses = 0;
    int take_profits = 0;
    for (const auto& t : trades) {
        if (t.pnl > 0) {
            ++m.winning_trades;
            win_sum += t.pnl;
        } else {
            ++m.losing_trades;
            loss_sum += t.pnl;
        }
        if (t.exit_reason == ExitReason::StopLoss) ++stop_losses;
        if (t.exit_reason == ExitReason::TakeProfit) ++take_profits;
        returns.push_back(t.trade_return);
        confidences.push_back(t.confidence);

        auto tp = parseTimestamp(t.exit_time);
        ++m.trades_by_hour[tp ? tp->hour : 0];
    }

    const double n = static_cast<double>(trades.size());
    m.total_trades = static_cast<int>(trades.size());
    m.win_rate = m.winning_trades / n;
    m.avg_win = m.winning_trades > 0 ? win_sum / m.winning_trades : 0;
    m.avg_loss = m.losing_trades > 0 ? loss_sum / m.losing_trades : 0;
    m.profit_factor = (m.losing_trades > 0 && loss_sum != 0)
        ? std::abs(win_sum / loss_sum)
        : std::numeric_limits<double>::infinity();

    m.return_volatility = stddev(returns);
    if (m.return_volatility > 0) {
        m.sharpe_ratio = mean(returns) / m.return_volatility;
    } else {
        m.sharpe_ratio = 0;
        m.status = MetricsStatus::UndefinedSharpe;
        m.message = "Sharpe ratio undefined: trade returns have zero variance";
    }

    m.max_drawdown = maxDrawdown(equity_curve);

    double conf_total = std::accumulate(confidences.begin(), confidences.end(), 0.0);
    if (conf_total > 0) {
        double weighted = 0;
        for (std::size_t i = 0; i < returns.size(); ++i) weighted += returns[i] * confidences[i];
        m.confidence_weighted_return = weighted / conf_total;
    }

    m.stop_loss_rate = stop_losses / n;
    m.take_profit_rate = take_profits / n;
    m.risk_adjusted_return = m.total_return / (m.max_drawdown + DRAWDOWN_FLOOR);

    m.confidence.mean = mean(confidences);
    m.confidence.min = *std::min_element(confidences.begin(), confidences.end());
    m.confidence.max = *std::max_element(confidences.begin(), confidences.end());
    m.confidence.stddev = stddev(confidences);
    for (double c : confidences) {
        if (c > HIGH_CONFIDENCE) ++m.confidence.high_confidence_trades;
        if (c < LOW_CONFIDENCE) ++m.confidence.low_confidence_trades;
    }

    m.performance_score = performanceScore(m.sharpe_ratio, m.win_rate, m.max_drawdown);
    m.grade = grade(m.performance_score);

    m.has_baseline_comparison = true;
    m.baseline_comparison = compareToBaseline(m.total_return, m.sharpe_ratio, m.win_rate, m.max_drawdown);
    return m;
}

} // namespace ensemble
