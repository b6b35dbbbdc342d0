#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace ensemble {

/// Lookback windows for the indicator engine (defaults are hourly-bar settings).
struct IndicatorParams {
    int rsi_period = 14;
    int ma_fast = 10;
    int ma_slow = 30;
    int macd_fast_span = 12;
    int macd_slow_span = 26;
    int macd_signal_span = 9;
    int bb_period = 20;
    double bb_stddev = 2.0;
    int volatility_window = 24;       // one-bar returns per volatility sample
    int atr_period = 14;
    int trend_lookback = 48;          // bars for trend_strength percentage change
    int volatility_rank_window = 168; // volatility samples ranked against
};

/// Computes derived fields for every bar of a series. Pure: same bars in, same MarketBars out.
/// Bars inside the warm-up window (any indicator still undefined) are not emitted, so the
/// output starts at index warmupBars() of the input.
class IndicatorEngine {
public:
    explicit IndicatorEngine(const IndicatorParams& params = IndicatorParams{});

    /// Index of the first bar at which every indicator is defined.
    std::size_t warmupBars() const;

    /// Minimum input length that yields at least one MarketBar.
    std::size_t minBars() const { return warmupBars() + 1; }

    /// Fails (returns false, sets error_msg) on invalid params, bad prices, or too few bars.
    bool compute(const std::vector<Bar>& bars, std::vector<MarketBar>& out, std::string& error_msg) const;

    const IndicatorParams& params() const { return p_; }

private:
    IndicatorParams p_;
};

namespace indicators {

/// Simple moving average of values[end-period+1 .. end]. Caller guarantees end >= period-1.
double windowMean(const std::vector<double>& values, std::size_t end, int period);

/// Sample (n-1) standard deviation over the same window.
double windowStdDev(const std::vector<double>& values, std::size_t end, int period);

/// Adjusted exponentially weighted mean (alpha = 2 / (span + 1)), defined from the first value.
std::vector<double> ewma(const std::vector<double>& values, int span);

/// Percentile rank of values[end] within the window; ties get the average rank. Result in (0, 1].
double percentileRank(const std::vector<double>& values, std::size_t end, int window);

} // namespace indicators

} // namespace ensemble
