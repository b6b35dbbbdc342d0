#pragma once

#include "config.hpp"
#include "portfolio.hpp"
#include "position.hpp"
#include <map>
#include <string>
#include <vector>

namespace ensemble {

enum class MetricsStatus { Ok, NoTrades, UndefinedSharpe };

const char* toString(MetricsStatus status);

/// Relative change of each headline metric against the baseline scorecard.
struct BaselineComparison {
    BaselineScorecard baseline;
    double total_return_improvement{0};   // (x - b) / b
    double sharpe_improvement{0};
    double win_rate_improvement{0};
    double drawdown_improvement{0};       // -(x - b) / b, positive = shallower drawdown
    bool sharpe_target_met{false};
    bool win_rate_target_met{false};
    bool drawdown_target_met{false};
};

struct ConfidenceStats {
    double mean{0};
    double min{0};
    double max{0};
    double stddev{0};
    int high_confidence_trades{0};  // confidence > 0.8
    int low_confidence_trades{0};   // confidence < 0.5
};

/// Run summary. All fractions (0.06 = 6%) unless the name says otherwise.
struct Metrics {
    MetricsStatus status{MetricsStatus::Ok};
    std::string message;

    double initial_balance{0};
    double final_equity{0};
    double total_return{0};

    int total_trades{0};
    int winning_trades{0};
    int losing_trades{0};         // pnl <= 0
    double win_rate{0};
    double avg_win{0};
    double avg_loss{0};
    double profit_factor{0};      // +inf when nothing was lost

    double sharpe_ratio{0};       // per-trade, not annualized
    double return_volatility{0};  // population std of trade returns
    double max_drawdown{0};
    double confidence_weighted_return{0};
    double stop_loss_rate{0};
    double take_profit_rate{0};
    double risk_adjusted_return{0};

    double performance_score{0};  // 0..100
    std::string grade{"D"};

    bool has_baseline_comparison{false};
    BaselineComparison baseline_comparison;
    ConfidenceStats confidence;
    std::map<int, int> trades_by_hour;  // exit hour of day -> trade count
};

/// Pure summary of a trade log and equity timeline. Same inputs, same Metrics.
class PerformanceAnalyzer {
public:
    explicit PerformanceAnalyzer(double initial_balance, const BaselineScorecard& baseline = BaselineScorecard{});

    Metrics summarize(const std::vector<Trade>& trades, const std::vector<EquityPoint>& equity_curve) const;

    BaselineComparison compareToBaseline(double total_return, double sharpe, double win_rate, double max_drawdown) const;

    /// clamp(50 + 10*sharpe + 30*win_rate - 100*max_drawdown, 0, 100)
    static double performanceScore(double sharpe, double win_rate, double max_drawdown);

    /// A+ (>= 90) down to C- (>= 50), else D.
    static std::string grade(double score);

    /// Largest drawdown in the timeline (0 if empty).
    static double maxDrawdown(const std::vector<EquityPoint>& equity_curve);

private:
    double initial_balance_;
    BaselineScorecard baseline_;
};

} // namespace ensemble
