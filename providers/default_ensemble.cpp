#include "default_ensemble.hpp"
#include "behavior_cloning_provider.hpp"
#include "bootstrap_rl_provider.hpp"
#include "pbt_evolved_provider.hpp"
#include <stdexcept>
#include <string>

namespace ensemble {

EnsembleDecisionEngine createDefaultEnsemble(const RunConfig& cfg) {
    if (cfg.provider_weights.size() != 3)
        throw std::invalid_argument("default ensemble needs 3 provider weights, got "
            + std::to_string(cfg.provider_weights.size()));

    EnsembleDecisionEngine engine(cfg.confidence_threshold);
    engine.addProvider(createBehaviorCloningProvider(), cfg.provider_weights[0]);
    engine.addProvider(createBootstrapRlProvider(), cfg.provider_weights[1]);
    engine.addProvider(createPbtEvolvedProvider(), cfg.provider_weights[2]);
    return engine;
}

} // namespace ensemble
