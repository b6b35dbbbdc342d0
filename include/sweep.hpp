#pragma once

#include "bar.hpp"
#include "config.hpp"
#include "ensemble.hpp"
#include "performance.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace ensemble {

/// Outcome of one configuration in a sweep.
struct SweepResult {
    RunConfig config;
    bool ok{false};
    std::string error;
    Metrics metrics;
    std::size_t steps{0};
    bool stopped_early{false};
    std::string stop_reason;
};

/// Builds a fresh engine (with its own providers) for one run.
using EngineFactory = std::function<EnsembleDecisionEngine(const RunConfig&)>;

/// Run every config over the same prepared bars, at most max_threads at a time.
/// Runs share only the read-only bars; results come back in config order.
/// A factory that throws marks that run as failed without affecting the others.
std::vector<SweepResult> runSweep(const std::vector<RunConfig>& configs,
                                  const std::vector<MarketBar>& bars,
                                  const EngineFactory& factory,
                                  std::size_t max_threads = 4);

} // namespace ensemble
