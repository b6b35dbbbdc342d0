#include "config.hpp"
#include "text_util.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace ensemble {

namespace {

bool inUnitInterval(double v) { return v >= 0.0 && v <= 1.0; }

} // namespace

bool parseDoubleList(const std::string& text, std::vector<double>& out) {
    out.clear();
    std::string normalized = text;
    for (auto& c : normalized) if (c == ',' || c == ';') c = ' ';
    std::istringstream iss(normalized);
    std::string tok;
    while (iss >> tok) {
        double v = 0;
        if (!parseDouble(tok, v)) return false;
        out.push_back(v);
    }
    return !out.empty();
}

bool validateConfig(const RunConfig& cfg, std::string& error_msg) {
    if (!(cfg.initial_balance > 0) || !std::isfinite(cfg.initial_balance)) { error_msg = "initial_balance must be > 0"; return false; }
    if (!(cfg.risk_per_trade > 0 && cfg.risk_per_trade <= 1)) { error_msg = "risk_per_trade must be in (0, 1]"; return false; }
    if (cfg.max_positions <= 0) { error_msg = "max_positions must be >= 1"; return false; }
    if (!(cfg.stop_loss_pct > 0 && cfg.stop_loss_pct < 1)) { error_msg = "stop_loss_pct must be in (0, 1)"; return false; }
    if (!(cfg.take_profit_pct > 0) || !std::isfinite(cfg.take_profit_pct)) { error_msg = "take_profit_pct must be > 0"; return false; }
    if (!inUnitInterval(cfg.confidence_threshold)) { error_msg = "confidence_threshold must be in [0, 1]"; return false; }
    if (!(cfg.capital_floor_fraction >= 0 && cfg.capital_floor_fraction < 1)) { error_msg = "capital_floor_fraction must be in [0, 1)"; return false; }

    if (cfg.provider_weights.empty()) { error_msg = "provider_weights must not be empty"; return false; }
    double weight_sum = 0;
    for (double w : cfg.provider_weights) {
        if (!(w >= 0) || !std::isfinite(w)) { error_msg = "provider_weights must be finite and >= 0"; return false; }
        weight_sum += w;
    }
    if (!(weight_sum > 0)) { error_msg = "provider_weights must not all be zero"; return false; }

    const BaselineScorecard& b = cfg.baseline;
    if (b.total_return == 0 || b.sharpe_ratio == 0 || b.win_rate == 0 || b.max_drawdown == 0) {
        error_msg = "baseline metrics must be non-zero (they are used as divisors)";
        return false;
    }
    return true;
}

bool applyConfigValue(RunConfig& cfg, const std::string& key, const std::string& value, std::string& error_msg) {
    double d = 0;
    long long i = 0;
    auto bad = [&](const char* expected) {
        error_msg = "invalid value for " + key + ": \"" + value + "\" (expected " + expected + ")";
        return false;
    };
    auto setDouble = [&](double& field) {
        if (!parseDouble(value, d)) return bad("number");
        field = d;
        return true;
    };

    if (key == "initial_balance") return setDouble(cfg.initial_balance);
    if (key == "risk_per_trade") return setDouble(cfg.risk_per_trade);
    if (key == "stop_loss_pct") return setDouble(cfg.stop_loss_pct);
    if (key == "take_profit_pct") return setDouble(cfg.take_profit_pct);
    if (key == "confidence_threshold") return setDouble(cfg.confidence_threshold);
    if (key == "capital_floor_fraction") return setDouble(cfg.capital_floor_fraction);
    if (key == "baseline.total_return") return setDouble(cfg.baseline.total_return);
    if (key == "baseline.sharpe_ratio") return setDouble(cfg.baseline.sharpe_ratio);
    if (key == "baseline.win_rate") return setDouble(cfg.baseline.win_rate);
    if (key == "baseline.max_drawdown") return setDouble(cfg.baseline.max_drawdown);
    if (key == "baseline.sharpe_target") return setDouble(cfg.baseline.sharpe_target);
    if (key == "baseline.win_rate_target") return setDouble(cfg.baseline.win_rate_target);
    if (key == "baseline.drawdown_target") return setDouble(cfg.baseline.drawdown_target);
    if (key == "max_positions") {
        if (!parseInteger(value, i) || i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max())
            return bad("integer");
        cfg.max_positions = static_cast<int>(i);
        return true;
    }
    if (key == "progress_interval") {
        if (!parseInteger(value, i) || i < 0) return bad("non-negative integer");
        cfg.progress_interval = static_cast<std::size_t>(i);
        return true;
    }
    if (key == "provider_weights") {
        std::vector<double> w;
        if (!parseDoubleList(value, w)) return bad("list of numbers");
        cfg.provider_weights = w;
        return true;
    }
    error_msg = "unknown config key: " + key;
    return false;
}

bool loadConfigFile(const std::string& path, RunConfig& cfg, std::string& error_msg) {
    std::ifstream f(path);
    if (!f.is_open()) {
        error_msg = "cannot open config file: " + path;
        return false;
    }
    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto comma = line.find(',');
        if (comma == std::string::npos) {
            error_msg = path + ":" + std::to_string(line_no) + ": expected key,value";
            return false;
        }
        std::string key = trim(line.substr(0, comma));
        std::string value = trim(line.substr(comma + 1));
        std::string err;
        if (!applyConfigValue(cfg, key, value, err)) {
            error_msg = path + ":" + std::to_string(line_no) + ": " + err;
            return false;
        }
    }
    return true;
}

} // namespace ensemble
