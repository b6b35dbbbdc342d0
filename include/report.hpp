#pragma once

#include "backtester.hpp"
#include "performance.hpp"
#include "sweep.hpp"
#include <string>
#include <ostream>
#include <iostream>
#include <vector>

namespace ensemble {

class Report {
public:
    /// data_label and run_label are included in report output (e.g. "synthetic seed=42", "default ensemble").
    Report(const Backtester& bt, const std::string& data_label = "", const std::string& run_label = "");

    /// Compute all metrics from the backtester's trade log and equity curve.
    Metrics computeMetrics() const;

    /// Print summary to console.
    void printSummary(std::ostream& out = std::cout) const;

    /// Write trade log CSV to file. Returns false and logs to stderr on failure.
    bool writeTradeLog(const std::string& filepath) const;

    /// Write equity/drawdown timeline CSV to file. Returns false and logs to stderr on failure.
    bool writeEquityCurve(const std::string& filepath) const;

    /// Write full report to a text file. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

    /// Write metrics, baseline comparison and config as JSON. Returns false on failure.
    bool writeResultsJson(const std::string& filepath) const;

    void setMetrics(const Metrics& m) { metrics_ = m; }
    const Metrics& metrics() const { return metrics_; }

private:
    void printHeader(std::ostream& out) const;
    void printBody(std::ostream& out) const;

    const Backtester& bt_;
    std::string data_label_;
    std::string run_label_;
    Metrics metrics_;
};

/// Comparison table of sweep results (one row per config).
void printSweepTable(std::ostream& out, const std::vector<SweepResult>& results);

/// Same table written to a file. Returns false and logs to stderr on failure.
bool writeSweepSummary(const std::string& filepath, const std::vector<SweepResult>& results);

} // namespace ensemble
