#include "backtester.hpp"
#include "config.hpp"
#include "data_source.hpp"
#include "default_ensemble.hpp"
#include "indicators.hpp"
#include "report.hpp"
#include "sweep.hpp"
#include "synthetic_data.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <filesystem>
#include <vector>
#include <memory>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr int DEFAULT_SYNTHETIC_DAYS = 30;
constexpr unsigned long long DEFAULT_SEED = 42;
constexpr std::size_t DEFAULT_THREADS = 4;

//-----------------------------------------------------------------------------
// Options: input selection, output location and run-config overrides
//-----------------------------------------------------------------------------
struct Options {
    std::string data_path;                   // empty = synthetic data
    int synthetic_days = DEFAULT_SYNTHETIC_DAYS;
    unsigned long long seed = DEFAULT_SEED;
    std::string config_path;
    std::string reports_dir = "reports";
    std::vector<std::pair<std::string, std::string>> overrides;  // applied after the config file
    std::vector<double> sweep_thresholds;
    std::size_t threads = DEFAULT_THREADS;
};

bool parseInt(const char* s, long long& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoll(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument(s);
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

void printUsage(std::ostream& out) {
    out << "Usage: ensemble_backtest [options]\n"
        << "  --data FILE                 OHLCV CSV (default: synthetic data)\n"
        << "  --synthetic-days N          days of hourly synthetic bars (default 30)\n"
        << "  --seed N                    synthetic data seed (default 42)\n"
        << "  --config FILE               key,value run config\n"
        << "  --cash X  --risk X  --max-positions N  --stop-loss X  --take-profit X\n"
        << "  --confidence-threshold X    --weights a,b,c\n"
        << "  --sweep-thresholds a,b,...  run one config per confidence threshold\n"
        << "  --threads N                 parallel runs in sweep mode (default 4)\n"
        << "  --reports-dir DIR           output directory (default reports)\n";
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Options& opt, std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };
        auto setOverride = [&](const char* key) {
            const char* v = next();
            if (!v) { error_msg = "Missing value for " + arg; return false; }
            opt.overrides.emplace_back(key, v);
            return true;
        };
        long long n = 0;

        if (arg == "--data") { const char* v = next(); if (!v) { error_msg = "Missing value for --data"; return false; } opt.data_path = v; }
        else if (arg == "--config") { const char* v = next(); if (!v) { error_msg = "Missing value for --config"; return false; } opt.config_path = v; }
        else if (arg == "--reports-dir") { const char* v = next(); if (!v) { error_msg = "Missing value for --reports-dir"; return false; } opt.reports_dir = v; }
        else if (arg == "--synthetic-days") { const char* v = next(); if (!v || !parseInt(v, n, error_msg, "--synthetic-days")) return false; opt.synthetic_days = static_cast<int>(n); }
        else if (arg == "--seed") { const char* v = next(); if (!v || !parseInt(v, n, error_msg, "--seed")) return false; opt.seed = static_cast<unsigned long long>(n); }
        else if (arg == "--threads") { const char* v = next(); if (!v || !parseInt(v, n, error_msg, "--threads") ) return false; opt.threads = n > 0 ? static_cast<std::size_t>(n) : 1; }
        else if (arg == "--cash") { if (!setOverride("initial_balance")) return false; }
        else if (arg == "--risk") { if (!setOverride("risk_per_trade")) return false; }
        else if (arg == "--max-positions") { if (!setOverride("max_positions")) return false; }
        else if (arg == "--stop-loss") { if (!setOverride("stop_loss_pct")) return false; }
        else if (arg == "--take-profit") { if (!setOverride("take_profit_pct")) return false; }
        else if (arg == "--confidence-threshold") { if (!setOverride("confidence_threshold")) return false; }
        else if (arg == "--weights") { if (!setOverride("provider_weights")) return false; }
        else if (arg == "--sweep-thresholds") {
            const char* v = next();
            if (!v || !ensemble::parseDoubleList(v, opt.sweep_thresholds)) {
                error_msg = "Invalid value for --sweep-thresholds (expected a,b,...)";
                return false;
            }
        }
        else if (arg == "--help" || arg == "-h") { printUsage(std::cout); std::exit(0); }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    if (opt.synthetic_days <= 0) { error_msg = "--synthetic-days must be >= 1"; return false; }
    return true;
}

/// Config file first, then command-line overrides, then validation.
bool buildRunConfig(const Options& opt, ensemble::RunConfig& cfg, std::string& error_msg) {
    if (!opt.config_path.empty() && !ensemble::loadConfigFile(opt.config_path, cfg, error_msg))
        return false;
    for (const auto& kv : opt.overrides) {
        if (!ensemble::applyConfigValue(cfg, kv.first, kv.second, error_msg)) return false;
    }
    return ensemble::validateConfig(cfg, error_msg);
}

/// Loads CSV or generates synthetic bars. Returns false and sets error_msg on failure.
bool loadBars(const Options& opt, std::vector<ensemble::Bar>& bars, std::string& label, std::string& error_msg) {
    using namespace ensemble;
    if (!opt.data_path.empty()) {
        DataSource ds(opt.data_path);
        if (!ds.load()) {
            error_msg = ds.error();
            return false;
        }
        bars = ds.bars();
        label = opt.data_path;
        return true;
    }
    SyntheticParams sp;
    sp.days = opt.synthetic_days;
    sp.seed = opt.seed;
    bars = generateSyntheticBars(sp);
    label = "synthetic days=" + std::to_string(sp.days) + " seed=" + std::to_string(sp.seed);
    return true;
}

//-----------------------------------------------------------------------------
// Single run: simulate, report, write files
//-----------------------------------------------------------------------------
int runSingle(const Options& opt, const ensemble::RunConfig& cfg,
              const std::vector<ensemble::Bar>& bars, const std::string& data_label) {
    using namespace ensemble;
    Backtester bt(createDefaultEnsemble(cfg), cfg);
    if (!bt.run(bars)) {
        std::cerr << "Failed to run backtest: " << bt.error() << "\n";
        return 1;
    }

    Report report(bt, data_label, "default ensemble");
    report.setMetrics(report.computeMetrics());
    report.printSummary(std::cout);

    std::error_code ec;
    fs::create_directories(opt.reports_dir, ec);
    if (ec) {
        std::cerr << "Cannot create reports directory " << opt.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    bool ok = report.writeTradeLog((fs::path(opt.reports_dir) / "trades.csv").string());
    ok = report.writeEquityCurve((fs::path(opt.reports_dir) / "equity_curve.csv").string()) && ok;
    ok = report.writeReport((fs::path(opt.reports_dir) / "report.txt").string()) && ok;
    ok = report.writeResultsJson((fs::path(opt.reports_dir) / "results.json").string()) && ok;
    if (!ok) return 1;
    std::cout << "Reports written to " << opt.reports_dir << "/\n";
    return 0;
}

//-----------------------------------------------------------------------------
// Sweep: one run per confidence threshold, in parallel, compared in a table
//-----------------------------------------------------------------------------
int runThresholdSweep(const Options& opt, const ensemble::RunConfig& base,
                      const std::vector<ensemble::Bar>& bars) {
    using namespace ensemble;
    IndicatorEngine indicators;
    std::vector<MarketBar> prepared;
    std::string error_msg;
    if (!indicators.compute(bars, prepared, error_msg)) {
        std::cerr << "Failed to prepare market data: " << error_msg << "\n";
        return 1;
    }

    std::vector<RunConfig> configs;
    for (double t : opt.sweep_thresholds) {
        RunConfig c = base;
        c.confidence_threshold = t;
        configs.push_back(c);
    }

    std::vector<SweepResult> results = runSweep(configs, prepared, createDefaultEnsemble, opt.threads);
    printSweepTable(std::cout, results);

    std::error_code ec;
    fs::create_directories(opt.reports_dir, ec);
    if (ec) {
        std::cerr << "Cannot create reports directory " << opt.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    std::string path = (fs::path(opt.reports_dir) / "sweep_summary.txt").string();
    if (!writeSweepSummary(path, results)) return 1;
    std::cout << "Summary written to " << path << "\n";

    for (const auto& r : results)
        if (!r.ok) return 1;
    return 0;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Options opt;
    std::string error_msg;
    if (!parseArgs(argc, argv, opt, error_msg)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }

    ensemble::RunConfig cfg;
    if (!buildRunConfig(opt, cfg, error_msg)) {
        std::cerr << "Invalid configuration: " << error_msg << "\n";
        return 1;
    }
    if (cfg.provider_weights.size() != 3) {
        std::cerr << "Invalid configuration: the default ensemble needs exactly 3 provider weights\n";
        return 1;
    }

    std::vector<ensemble::Bar> bars;
    std::string data_label;
    if (!loadBars(opt, bars, data_label, error_msg)) {
        std::cerr << "Failed to load market data: " << error_msg << "\n";
        return 1;
    }

    if (!opt.sweep_thresholds.empty())
        return runThresholdSweep(opt, cfg, bars);

    return runSingle(opt, cfg, bars, data_label);
}
