#pragma once

#include "signal_provider.hpp"
#include <memory>

namespace ensemble {

/// Population-trained stand-in: volatility-adjusted momentum,
/// trend_strength / (volatility + vol_floor), compared against +/- threshold.
struct PbtEvolvedParams {
    double vol_floor = 0.01;
    double threshold = 1.0;
    double active_confidence = 0.9;
    double idle_confidence = 0.75;
};

std::unique_ptr<ISignalProvider> createPbtEvolvedProvider(const PbtEvolvedParams& params = PbtEvolvedParams{});

} // namespace ensemble
