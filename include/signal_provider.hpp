#pragma once

#include "bar.hpp"
#include "signal.hpp"
#include <string>

namespace ensemble {

/// Interface every signal source must implement (statistical filter, classifier, learned policy...).
/// score() is called once per step with the current bar only; it must return in bounded time.
/// A provider may throw; the ensemble treats that step as unusable.
class ISignalProvider {
public:
    virtual ~ISignalProvider() = default;

    /// Stable identifier reported in Signal::source_id.
    virtual const std::string& id() const = 0;

    virtual Signal score(const MarketBar& bar) = 0;
};

} // namespace ensemble
