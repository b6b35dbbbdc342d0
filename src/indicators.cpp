#include "indicators.hpp"
#include <algorithm>
#include <cmath>

namespace ensemble {

namespace indicators {

double windowMean(const std::vector<double>& values, std::size_t end, int period) {
    double sum = 0;
    for (int i = 0; i < period; ++i) sum += values[end - static_cast<std::size_t>(i)];
    return sum / period;
}

double windowStdDev(const std::vector<double>& values, std::size_t end, int period) {
    if (period < 2) return 0;
    double mean = windowMean(values, end, period);
    double sq_sum = 0;
    for (int i = 0; i < period; ++i) {
        double d = values[end - static_cast<std::size_t>(i)] - mean;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / (period - 1));
}

std::vector<double> ewma(const std::vector<double>& values, int span) {
    std::vector<double> out(values.size(), 0.0);
    const double decay = 1.0 - 2.0 / (span + 1.0);
    double num = 0;
    double den = 0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        num = values[i] + decay * num;
        den = 1.0 + decay * den;
        out[i] = num / den;
    }
    return out;
}

double percentileRank(const std::vector<double>& values, std::size_t end, int window) {
    const double x = values[end];
    int less = 0;
    int equal = 0;
    for (int i = 0; i < window; ++i) {
        double v = values[end - static_cast<std::size_t>(i)];
        if (v < x) ++less;
        else if (v == x) ++equal;
    }
    // average rank of the tied block, 1-based
    double rank = less + (equal + 1) / 2.0;
    return rank / window;
}

} // namespace indicators

IndicatorEngine::IndicatorEngine(const IndicatorParams& params) : p_(params) {}

std::size_t IndicatorEngine::warmupBars() const {
    int first = 0;
    first = std::max(first, p_.rsi_period - 1);  // index 0 counts as a zero change
    first = std::max(first, p_.ma_fast - 1);
    first = std::max(first, p_.ma_slow - 1);
    first = std::max(first, p_.bb_period - 1);
    first = std::max(first, p_.atr_period - 1);
    first = std::max(first, p_.trend_lookback);
    first = std::max(first, p_.volatility_window + p_.volatility_rank_window - 1);
    return static_cast<std::size_t>(first);
}

bool IndicatorEngine::compute(const std::vector<Bar>& bars, std::vector<MarketBar>& out,
                              std::string& error_msg) const {
    out.clear();
    if (p_.rsi_period < 1 || p_.ma_fast < 1 || p_.ma_slow < 1 || p_.bb_period < 2
        || p_.macd_fast_span < 1 || p_.macd_slow_span < 1 || p_.macd_signal_span < 1
        || p_.volatility_window < 2 || p_.atr_period < 1 || p_.trend_lookback < 1
        || p_.volatility_rank_window < 1 || !(p_.bb_stddev > 0)) {
        error_msg = "invalid indicator parameters";
        return false;
    }

    const std::size_t n = bars.size();
    if (n < minBars()) {
        error_msg = "insufficient market data: " + std::to_string(n) + " bars, indicators need at least "
            + std::to_string(minBars());
        return false;
    }

    std::vector<double> close(n), tr(n), gains(n, 0.0), losses(n, 0.0), returns(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        const Bar& b = bars[i];
        if (!std::isfinite(b.open) || !std::isfinite(b.high) || !std::isfinite(b.low) || !std::isfinite(b.close)
            || b.open <= 0 || b.high <= 0 || b.low <= 0 || b.close <= 0) {
            error_msg = "malformed bar at index " + std::to_string(i) + " (" + b.timestamp
                + "): prices must be positive and finite";
            return false;
        }
        if (b.high < b.low) {
            error_msg = "malformed bar at index " + std::to_string(i) + " (" + b.timestamp + "): high < low";
            return false;
        }
        close[i] = b.close;
        tr[i] = b.high - b.low;
        if (i > 0) {
            double prev = bars[i - 1].close;
            tr[i] = std::max({ b.high - b.low, std::abs(b.high - prev), std::abs(b.low - prev) });
            double delta = b.close - prev;
            if (delta > 0) gains[i] = delta;
            else if (delta < 0) losses[i] = -delta;
            returns[i] = b.close / prev - 1.0;
        }
    }

    const std::vector<double> ema_fast = indicators::ewma(close, p_.macd_fast_span);
    const std::vector<double> ema_slow = indicators::ewma(close, p_.macd_slow_span);
    std::vector<double> macd(n);
    for (std::size_t i = 0; i < n; ++i) macd[i] = ema_fast[i] - ema_slow[i];
    const std::vector<double> macd_signal = indicators::ewma(macd, p_.macd_signal_span);

    // volatility is defined from index volatility_window (returns start at 1)
    const std::size_t vol_start = static_cast<std::size_t>(p_.volatility_window);
    std::vector<double> volatility(n, 0.0);
    for (std::size_t i = vol_start; i < n; ++i)
        volatility[i] = indicators::windowStdDev(returns, i, p_.volatility_window);

    const std::size_t first = warmupBars();
    out.reserve(n - first);
    for (std::size_t i = first; i < n; ++i) {
        MarketBar mb;
        mb.bar = bars[i];
        mb.source_index = i;

        double avg_gain = indicators::windowMean(gains, i, p_.rsi_period);
        double avg_loss = indicators::windowMean(losses, i, p_.rsi_period);
        if (avg_loss > 0) mb.rsi = 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
        else mb.rsi = (avg_gain > 0) ? 100.0 : 50.0;  // flat window: neutral

        mb.ma_fast = indicators::windowMean(close, i, p_.ma_fast);
        mb.ma_slow = indicators::windowMean(close, i, p_.ma_slow);
        mb.ma_crossover = mb.ma_fast > mb.ma_slow;

        mb.macd = macd[i];
        mb.macd_signal = macd_signal[i];
        mb.macd_histogram = macd[i] - macd_signal[i];

        mb.bb_middle = indicators::windowMean(close, i, p_.bb_period);
        double bb_sd = indicators::windowStdDev(close, i, p_.bb_period);
        mb.bb_upper = mb.bb_middle + p_.bb_stddev * bb_sd;
        mb.bb_lower = mb.bb_middle - p_.bb_stddev * bb_sd;
        double width = mb.bb_upper - mb.bb_lower;
        mb.bb_position = (width > 0) ? (close[i] - mb.bb_lower) / width : 0.5;

        mb.volatility = volatility[i];
        mb.atr = indicators::windowMean(tr, i, p_.atr_period);
        mb.trend_strength = close[i] / close[i - static_cast<std::size_t>(p_.trend_lookback)] - 1.0;
        mb.volatility_rank = indicators::percentileRank(volatility, i, p_.volatility_rank_window);

        out.push_back(mb);
    }
    return true;
}

} // namespace ensemble
