#include "ensemble.hpp"
#include <cmath>
#include <stdexcept>

namespace ensemble {

namespace {

EnsembleDecision degradedHold(std::vector<Signal> signals, const std::string& note) {
    EnsembleDecision d;
    d.signals = std::move(signals);
    d.degraded = true;
    d.note = note;
    return d;
}

} // namespace

const char* toString(Action action) {
    switch (action) {
        case Action::Buy: return "buy";
        case Action::Sell: return "sell";
        case Action::Hold: break;
    }
    return "hold";
}

EnsembleDecisionEngine::EnsembleDecisionEngine(double confidence_threshold)
    : confidence_threshold_(confidence_threshold) {}

void EnsembleDecisionEngine::addProvider(std::unique_ptr<ISignalProvider> provider, double weight) {
    if (!provider) throw std::invalid_argument("addProvider: null provider");
    if (!(weight >= 0) || !std::isfinite(weight))
        throw std::invalid_argument("addProvider: weight for " + provider->id() + " must be finite and >= 0");
    entries_.push_back({ std::move(provider), weight });
}

bool EnsembleDecisionEngine::removeProvider(const std::string& id) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->provider->id() == id) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

bool EnsembleDecisionEngine::setWeight(const std::string& id, double weight) {
    if (!(weight >= 0) || !std::isfinite(weight)) return false;
    for (auto& e : entries_) {
        if (e.provider->id() == id) {
            e.weight = weight;
            return true;
        }
    }
    return false;
}

std::vector<std::string> EnsembleDecisionEngine::providerIds() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& e : entries_) ids.push_back(e.provider->id());
    return ids;
}

std::vector<double> EnsembleDecisionEngine::weights() const {
    std::vector<double> w;
    w.reserve(entries_.size());
    for (const auto& e : entries_) w.push_back(e.weight);
    return w;
}

EnsembleDecision EnsembleDecisionEngine::decide(const MarketBar& bar, const std::vector<Signal>& signals) const {
    if (entries_.empty())
        return degradedHold(signals, "no signal providers registered");
    if (signals.size() != entries_.size())
        return degradedHold(signals, "expected " + std::to_string(entries_.size()) + " signals at "
            + bar.timestamp() + ", got " + std::to_string(signals.size()));

    double weighted_sum = 0;
    double weight_total = 0;
    for (std::size_t i = 0; i < signals.size(); ++i) {
        const Signal& s = signals[i];
        if (!isUsable(s))
            return degradedHold(signals, "unusable signal from " + s.source_id + " at " + bar.timestamp());
        double w = entries_[i].weight * s.confidence;
        weighted_sum += s.sign() * w;
        weight_total += w;
    }

    EnsembleDecision d;
    d.signals = signals;
    if (weight_total > 0) {
        d.score = weighted_sum / weight_total;
        d.confidence = weight_total / static_cast<double>(signals.size());
    } else {
        d.score = 0;
        d.confidence = NEUTRAL_CONFIDENCE;
    }
    d.signal_strength = std::abs(d.score);

    // strict on both sides: exactly at a threshold is Hold
    if (d.confidence > confidence_threshold_) {
        if (d.score > SCORE_THRESHOLD) d.action = Action::Buy;
        else if (d.score < -SCORE_THRESHOLD) d.action = Action::Sell;
    }
    return d;
}

EnsembleDecision EnsembleDecisionEngine::evaluate(const MarketBar& bar) {
    std::vector<Signal> signals;
    signals.reserve(entries_.size());
    for (auto& e : entries_) {
        try {
            signals.push_back(e.provider->score(bar));
        } catch (const std::exception& ex) {
            return degradedHold(std::move(signals), "provider " + e.provider->id() + " failed at "
                + bar.timestamp() + ": " + ex.what());
        }
    }
    return decide(bar, signals);
}

} // namespace ensemble
