#pragma once

#include "signal_provider.hpp"
#include <memory>

namespace ensemble {

/// Imitation-learning stand-in: RSI extremes confirmed by the MA crossover.
/// Long: RSI below oversold while fast MA is above slow MA. Short: RSI above overbought while it is not.
struct BehaviorCloningParams {
    double rsi_oversold = 30.0;
    double rsi_overbought = 70.0;
    double active_confidence = 0.8;
    double idle_confidence = 0.6;
};

std::unique_ptr<ISignalProvider> createBehaviorCloningProvider(const BehaviorCloningParams& params = BehaviorCloningParams{});

} // namespace ensemble
