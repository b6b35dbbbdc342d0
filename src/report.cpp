#include "report.hpp"
#include <fstream>
#include <iomanip>
#include <cmath>
#include <algorithm>
#include <iostream>

namespace ensemble {

namespace {
    void writeCsvQuoted(std::ostream& out, const std::string& s) {
        out << '"';
        for (char c : s) {
            if (c == '"') out << "\"\"";
            else out << c;
        }
        out << '"';
    }

    void writeJsonString(std::ostream& out, const std::string& s) {
        out << '"';
        for (char c : s) {
            if (c == '"') out << "\\\"";
            else if (c == '\\') out << "\\\\";
            else if (c == '\n') out << "\\n";
            else if (c == '\r') out << "\\r";
            else out << c;
        }
        out << '"';
    }

    // JSON has no infinity; profit factor without losses is written as null
    void writeJsonNumber(std::ostream& out, double v) {
        if (std::isfinite(v)) out << v;
        else out << "null";
    }

    void writeProfitFactor(std::ostream& out, double pf) {
        if (std::isinf(pf)) out << "inf";
        else out << pf;
    }

    const char* yesNo(bool b) { return b ? "ACHIEVED" : "not achieved"; }
}

Report::Report(const Backtester& bt, const std::string& data_label, const std::string& run_label)
    : bt_(bt), data_label_(data_label), run_label_(run_label) {}

Metrics Report::computeMetrics() const {
    return bt_.analyze();
}

void Report::printHeader(std::ostream& out) const {
    if (!run_label_.empty()) out << "Run: " << run_label_ << "\n";
    if (!data_label_.empty()) out << "Data: " << data_label_ << "\n";
    const RunConfig& c = bt_.config();
    out << std::fixed << std::setprecision(4);
    out << "Config: risk=" << c.risk_per_trade << " max_positions=" << c.max_positions
        << " stop=" << c.stop_loss_pct << " target=" << c.take_profit_pct
        << " confidence>" << c.confidence_threshold << "\n";
    if (bt_.stoppedEarly())
        out << "*** Run stopped: " << bt_.stopReason() << " ***\n";
    out << "\n";
}

void Report::printBody(std::ostream& out) const {
    const Metrics& m = metrics_;
    out << std::fixed << std::setprecision(2);
    out << "Steps simulated:  " << bt_.stepsProcessed() << "\n";
    out << "Initial equity:   " << m.initial_balance << "\n";
    out << "Final equity:     " << m.final_equity << "\n";
    out << "Total return:     " << m.total_return * 100.0 << "%\n";
    out << "Score:            " << std::setprecision(1) << m.performance_score << "/100 (" << m.grade << ")\n";
    if (!m.message.empty())
        out << "Status:           " << toString(m.status) << " - " << m.message << "\n";
    out << std::setprecision(2);
    out << "Trades:           " << m.total_trades << " (" << m.winning_trades << " won, "
        << m.losing_trades << " lost)\n";
    out << "Win rate:         " << m.win_rate * 100.0 << "%\n";
    out << "Profit factor:    ";
    writeProfitFactor(out, m.profit_factor);
    out << "\n";
    out << "Avg win / loss:   " << m.avg_win << " / " << m.avg_loss << "\n";
    out << std::setprecision(3);
    out << "Sharpe (trade):   " << m.sharpe_ratio << "\n";
    out << std::setprecision(2);
    out << "Max drawdown:     " << m.max_drawdown * 100.0 << "%\n";
    out << "Stop / target:    " << m.stop_loss_rate * 100.0 << "% / " << m.take_profit_rate * 100.0 << "%\n";
    out << std::setprecision(4);
    out << "Conf-weighted return: " << m.confidence_weighted_return << "\n";
    if (bt_.incidents() > 0)
        out << "Provider incidents: " << bt_.incidents() << "\n";

    if (m.has_baseline_comparison) {
        const BaselineComparison& b = m.baseline_comparison;
        out << std::showpos << std::setprecision(1);
        out << "\nvs baseline:\n";
        out << "  Total return:   " << b.total_return_improvement * 100.0 << "%\n";
        out << "  Sharpe ratio:   " << b.sharpe_improvement * 100.0 << "%\n";
        out << "  Win rate:       " << b.win_rate_improvement * 100.0 << "%\n";
        out << "  Drawdown:       " << b.drawdown_improvement * 100.0 << "% (reduction)\n";
        out << std::noshowpos;
        out << "  Sharpe target (+" << b.baseline.sharpe_target * 100.0 << "%):   " << yesNo(b.sharpe_target_met) << "\n";
        out << "  Win rate target (+" << b.baseline.win_rate_target * 100.0 << "%):  " << yesNo(b.win_rate_target_met) << "\n";
        out << "  Drawdown target (-" << b.baseline.drawdown_target * 100.0 << "%):  " << yesNo(b.drawdown_target_met) << "\n";
    }
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== Ensemble Backtest Report ==========\n";
    printHeader(out);
    printBody(out);
    out << "==============================================\n\n";
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
    f << "position_id,entry_time,exit_time,entry_step,exit_step,entry_price,exit_price,size,pnl,return,hold_bars,confidence,exit_reason\n";
    for (const auto& t : bt_.trades()) {
        f << t.position_id << ',';
        writeCsvQuoted(f, t.entry_time);
        f << ',';
        writeCsvQuoted(f, t.exit_time);
        f << ',' << t.entry_index << ',' << t.exit_index << ','
          << std::fixed << std::setprecision(4) << t.entry_price << ',' << t.exit_price << ','
          << std::setprecision(8) << t.size << ','
          << std::setprecision(4) << t.pnl << ',' << std::setprecision(6) << t.trade_return << ','
          << t.hold_bars << ',' << std::setprecision(4) << t.confidence << ','
          << toString(t.exit_reason) << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write trade log: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeEquityCurve(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
    f << "step,timestamp,close,cash,equity,peak_equity,drawdown,open_positions\n";
    for (const auto& pt : bt_.equityCurve()) {
        f << pt.step << ',';
        writeCsvQuoted(f, pt.timestamp);
        f << std::fixed << std::setprecision(2)
          << ',' << pt.close << ',' << pt.cash << ',' << pt.equity << ',' << pt.peak_equity << ','
          << std::setprecision(6) << pt.drawdown << ',' << pt.open_positions << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write equity curve: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Ensemble Backtest Report\n";
    f << "========================\n\n";
    printHeader(f);
    printBody(f);

    const Metrics& m = metrics_;
    if (m.total_trades > 0) {
        f << std::noshowpos << std::fixed << std::setprecision(3);
        f << "\nConfidence at entry: mean " << m.confidence.mean << ", min " << m.confidence.min
          << ", max " << m.confidence.max << ", std " << m.confidence.stddev << "\n";
        f << "  high (>0.8): " << m.confidence.high_confidence_trades
          << "  low (<0.5): " << m.confidence.low_confidence_trades << "\n";
        f << "\nTrades by exit hour:\n";
        for (const auto& kv : m.trades_by_hour)
            f << "  " << std::setw(2) << std::setfill('0') << kv.first << std::setfill(' ') << ":00  " << kv.second << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write report: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeResultsJson(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    const Metrics& m = metrics_;
    const RunConfig& c = bt_.config();
    f << std::setprecision(10);
    f << "{\n  \"data\": ";
    writeJsonString(f, data_label_);
    f << ",\n  \"run\": ";
    writeJsonString(f, run_label_);
    f << ",\n  \"config\": {\"initial_balance\": " << c.initial_balance
      << ", \"risk_per_trade\": " << c.risk_per_trade
      << ", \"max_positions\": " << c.max_positions
      << ", \"stop_loss_pct\": " << c.stop_loss_pct
      << ", \"take_profit_pct\": " << c.take_profit_pct
      << ", \"confidence_threshold\": " << c.confidence_threshold << "}";
    f << ",\n  \"stopped_early\": " << (bt_.stoppedEarly() ? "true" : "false");
    f << ",\n  \"stop_reason\": ";
    writeJsonString(f, bt_.stopReason());
    f << ",\n  \"steps\": " << bt_.stepsProcessed();
    f << ",\n  \"incidents\": " << bt_.incidents();
    f << ",\n  \"metrics\": {\n";
    f << "    \"status\": ";
    writeJsonString(f, toString(m.status));
    f << ",\n    \"message\": ";
    writeJsonString(f, m.message);
    f << ",\n    \"final_equity\": " << m.final_equity;
    f << ",\n    \"total_return\": " << m.total_return;
    f << ",\n    \"total_trades\": " << m.total_trades;
    f << ",\n    \"winning_trades\": " << m.winning_trades;
    f << ",\n    \"losing_trades\": " << m.losing_trades;
    f << ",\n    \"win_rate\": " << m.win_rate;
    f << ",\n    \"avg_win\": " << m.avg_win;
    f << ",\n    \"avg_loss\": " << m.avg_loss;
    f << ",\n    \"profit_factor\": ";
    writeJsonNumber(f, m.profit_factor);
    f << ",\n    \"sharpe_ratio\": " << m.sharpe_ratio;
    f << ",\n    \"volatility\": " << m.return_volatility;
    f << ",\n    \"max_drawdown\": " << m.max_drawdown;
    f << ",\n    \"confidence_weighted_return\": " << m.confidence_weighted_return;
    f << ",\n    \"stop_loss_rate\": " << m.stop_loss_rate;
    f << ",\n    \"take_profit_rate\": " << m.take_profit_rate;
    f << ",\n    \"risk_adjusted_return\": " << m.risk_adjusted_return;
    f << ",\n    \"performance_score\": " << m.performance_score;
    f << ",\n    \"grade\": ";
    writeJsonString(f, m.grade);
    f << "\n  }";
    if (m.has_baseline_comparison) {
        const BaselineComparison& b = m.baseline_comparison;
        f << ",\n  \"baseline_comparison\": {\n";
        f << "    \"baseline\": {\"total_return\": " << b.baseline.total_return
          << ", \"sharpe_ratio\": " << b.baseline.sharpe_ratio
          << ", \"win_rate\": " << b.baseline.win_rate
          << ", \"max_drawdown\": " << b.baseline.max_drawdown << "},\n";
        f << "    \"improvements\": {\"total_return\": " << b.total_return_improvement
          << ", \"sharpe\": " << b.sharpe_improvement
          << ", \"win_rate\": " << b.win_rate_improvement
          << ", \"drawdown\": " << b.drawdown_improvement << "},\n";
        f << "    \"target_achieved\": {\"sharpe\": " << (b.sharpe_target_met ? "true" : "false")
          << ", \"win_rate\": " << (b.win_rate_target_met ? "true" : "false")
          << ", \"drawdown\": " << (b.drawdown_target_met ? "true" : "false") << "}\n  }";
    }
    f << "\n}\n";
    if (!f) {
        std::cerr << "Failed to write results JSON: " << filepath << "\n";
        return false;
    }
    return true;
}

namespace {

void writeSweepRows(std::ostream& out, const std::vector<SweepResult>& results) {
    out << std::fixed << std::setprecision(2);
    out << std::setw(6) << "Conf>" << std::setw(8) << "Risk" << std::setw(12) << "Return %"
        << std::setw(10) << "MaxDD %" << std::setw(9) << "Sharpe" << std::setw(8) << "Trades"
        << std::setw(8) << "Score" << std::setw(6) << "Grade" << "  Stopped\n";
    out << std::string(80, '-') << "\n";
    for (const auto& r : results) {
        out << std::setw(6) << r.config.confidence_threshold << std::setw(8) << r.config.risk_per_trade;
        if (!r.ok) {
            out << "  failed: " << r.error << "\n";
            continue;
        }
        const Metrics& m = r.metrics;
        out << std::setw(12) << m.total_return * 100.0 << std::setw(10) << m.max_drawdown * 100.0
            << std::setw(9) << std::setprecision(3) << m.sharpe_ratio << std::setprecision(2)
            << std::setw(8) << m.total_trades << std::setw(8) << std::setprecision(1) << m.performance_score
            << std::setprecision(2) << std::setw(6) << m.grade << "  "
            << (r.stopped_early ? r.stop_reason : "-") << "\n";
    }
    out << std::string(80, '-') << "\n";
}

} // namespace

void printSweepTable(std::ostream& out, const std::vector<SweepResult>& results) {
    out << "\n========== Ensemble sweep ==========\n";
    writeSweepRows(out, results);
    out << "====================================\n\n";
}

bool writeSweepSummary(const std::string& filepath, const std::vector<SweepResult>& results) {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Ensemble sweep\n\n";
    writeSweepRows(f, results);
    if (!f) {
        std::cerr << "Failed to write sweep summary: " << filepath << "\n";
        return false;
    }
    return true;
}

} // namespace ensemble
