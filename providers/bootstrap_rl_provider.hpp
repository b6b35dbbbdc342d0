#pragma once

#include "signal_provider.hpp"
#include <memory>

namespace ensemble {

/// RL-policy stand-in: buy dips in an uptrend, sell rallies in a downtrend.
/// Momentum is trend_strength; the dip/rally test uses the Bollinger position.
struct BootstrapRlParams {
    double momentum_threshold = 0.02;
    double dip_bb_position = 0.2;
    double rally_bb_position = 0.8;
    double active_confidence = 0.85;
    double idle_confidence = 0.7;
};

std::unique_ptr<ISignalProvider> createBootstrapRlProvider(const BootstrapRlParams& params = BootstrapRlParams{});

} // namespace ensemble
