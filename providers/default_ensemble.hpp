#pragma once

#include "ensemble.hpp"
#include "config.hpp"

namespace ensemble {

/// The three canonical providers (behavior_cloning, bootstrap_rl, pbt_evolved) in that order,
/// weighted by cfg.provider_weights and gated by cfg.confidence_threshold.
/// Throws std::invalid_argument unless cfg.provider_weights has exactly three entries.
EnsembleDecisionEngine createDefaultEnsemble(const RunConfig& cfg);

} // namespace ensemble
