#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ensemble {

/// Fixed reference results every run is compared against, plus the improvement targets.
struct BaselineScorecard {
    double total_return = 0.1014;
    double sharpe_ratio = 0.197;
    double win_rate = 0.375;
    double max_drawdown = 0.106;

    double sharpe_target = 1.29;    // +129% Sharpe
    double win_rate_target = 0.47;  // +47% win rate
    double drawdown_target = 0.25;  // 25% drawdown reduction
};

/// Static parameters of one simulation run.
struct RunConfig {
    double initial_balance = 100000.0;
    double risk_per_trade = 0.02;       // fraction of equity per entry, scaled by confidence^2
    int max_positions = 3;
    double stop_loss_pct = 0.03;
    double take_profit_pct = 0.06;
    double confidence_threshold = 0.45;
    std::vector<double> provider_weights{0.3, 0.4, 0.3};
    BaselineScorecard baseline;

    double capital_floor_fraction = 0.10;  // stop when equity <= this * initial_balance
    std::size_t progress_interval = 168;   // steps between progress log lines (0 = off)
};

/// Returns false and sets error_msg if the config cannot describe a valid experiment.
bool validateConfig(const RunConfig& cfg, std::string& error_msg);

/// Set one option by key (same keys as the config file). Returns false on unknown key or bad value.
bool applyConfigValue(RunConfig& cfg, const std::string& key, const std::string& value, std::string& error_msg);

/// Load "key,value" lines into cfg. Blank lines and lines starting with '#' are ignored.
/// Keys: initial_balance, risk_per_trade, max_positions, stop_loss_pct, take_profit_pct,
/// confidence_threshold, provider_weights (a,b,c), capital_floor_fraction, progress_interval,
/// baseline.total_return, baseline.sharpe_ratio, baseline.win_rate, baseline.max_drawdown,
/// baseline.sharpe_target, baseline.win_rate_target, baseline.drawdown_target.
bool loadConfigFile(const std::string& path, RunConfig& cfg, std::string& error_msg);

/// Parse a list of numbers separated by ',', ';' or whitespace. Returns false on any bad element.
bool parseDoubleList(const std::string& text, std::vector<double>& out);

} // namespace ensemble
