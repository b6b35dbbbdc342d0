#pragma once

#include "bar.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ensemble {

/// Seeded hourly OHLCV generator for development and tests. Not used by the simulation core.
/// Every regime_period bars a new volatility regime (high x2.5 / low x0.5 / normal) and a new
/// drift are drawn. Trading hours 08-16 are 1.5x more volatile, weekends 0.7x. Rare spikes of
/// 5-15% in either direction. Same params, same bars.
struct SyntheticParams {
    int days = 30;
    std::uint64_t seed = 42;
    double start_price = 50000.0;
    std::string start_date = "2024-01-01";   // YYYY-MM-DD, first bar at 00:00
    int regime_period = 168;
    double base_volatility = 0.015;
    double max_drift = 0.002;                // drift drawn uniformly from [-max_drift, max_drift]
    double spike_probability = 0.002;
    double spike_min = 0.05;
    double spike_max = 0.15;
};

/// Returns days * 24 bars, or an empty vector if days <= 0 or start_date is unparseable.
std::vector<Bar> generateSyntheticBars(const SyntheticParams& params = SyntheticParams{});

} // namespace ensemble
