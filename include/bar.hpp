#pragma once

#include <string>
#include <cstddef>

namespace ensemble {

/// Single OHLCV bar as loaded or generated.
struct Bar {
    std::string timestamp;  // e.g. "2024-01-02T13:00" or "2024-01-02"
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};       // optional
    std::string regime;     // optional market-regime label ("high", "low", "normal")

    double typical_price() const { return (high + low + close) / 3.0; }
};

/// Bar plus every derived indicator field. Produced once by the indicator engine,
/// read-only afterwards.
struct MarketBar {
    Bar bar;
    std::size_t source_index{0};  // index in the raw series

    double rsi{0};
    double ma_fast{0};            // SMA 10
    double ma_slow{0};            // SMA 30
    bool ma_crossover{false};     // ma_fast > ma_slow
    double macd{0};
    double macd_signal{0};
    double macd_histogram{0};
    double bb_middle{0};
    double bb_upper{0};
    double bb_lower{0};
    double bb_position{0};        // 0 at lower band, 1 at upper band
    double volatility{0};         // std of one-bar returns
    double atr{0};
    double trend_strength{0};     // multi-bar percentage change
    double volatility_rank{0};    // percentile of volatility in (0, 1]

    const std::string& timestamp() const { return bar.timestamp; }
    double close() const { return bar.close; }
};

} // namespace ensemble
