#pragma once

#include "bar.hpp"
#include "signal.hpp"
#include "signal_provider.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ensemble {

enum class Action { Hold, Buy, Sell };

const char* toString(Action action);

/// Fused result for one bar. Derived only from the signal set; carries no hidden state.
struct EnsembleDecision {
    Action action{Action::Hold};
    double score{0};              // signed weighted vote in [-1, 1]
    double signal_strength{0};    // |score|
    double confidence{0};         // mean effective weight
    std::vector<Signal> signals;  // per-source, in provider order
    bool degraded{false};         // a signal was unusable; action forced to Hold
    std::string note;             // why the decision was degraded
};

/// Confidence-weighted voting over an ordered list of providers.
/// Each provider has a structural weight; its effective weight is structural * confidence.
///   score      = sum(direction_i * w_i) / sum(w_i)   (0 if sum(w_i) == 0)
///   confidence = sum(w_i) / n                        (0.5 if sum(w_i) == 0)
/// Buy if score > +0.2 and confidence > threshold, Sell on the mirror condition, else Hold.
/// The engine never looks at positions or balances.
class EnsembleDecisionEngine {
public:
    static constexpr double SCORE_THRESHOLD = 0.2;
    static constexpr double NEUTRAL_CONFIDENCE = 0.5;

    explicit EnsembleDecisionEngine(double confidence_threshold = 0.45);

    /// Append a provider with its structural weight (must be >= 0).
    void addProvider(std::unique_ptr<ISignalProvider> provider, double weight);

    /// Remove by id. Returns false if no provider has that id.
    bool removeProvider(const std::string& id);

    /// Change a provider's structural weight. Returns false if the id is unknown or weight < 0.
    bool setWeight(const std::string& id, double weight);

    std::size_t size() const { return entries_.size(); }
    std::vector<std::string> providerIds() const;
    std::vector<double> weights() const;

    double confidenceThreshold() const { return confidence_threshold_; }
    void setConfidenceThreshold(double t) { confidence_threshold_ = t; }

    /// Pure fusion of an already collected signal set (one signal per provider, same order).
    /// A size mismatch or any unusable signal yields a degraded Hold.
    EnsembleDecision decide(const MarketBar& bar, const std::vector<Signal>& signals) const;

    /// Query every provider for this bar, then decide(). A provider that throws yields a degraded Hold.
    EnsembleDecision evaluate(const MarketBar& bar);

private:
    struct Entry {
        std::unique_ptr<ISignalProvider> provider;
        double weight{0};
    };

    std::vector<Entry> entries_;
    double confidence_threshold_;
};

} // namespace ensemble
