#include "behavior_cloning_provider.hpp"
#include <memory>
#include <string>

namespace ensemble {

class BehaviorCloningProvider : public ISignalProvider {
public:
    explicit BehaviorCloningProvider(const BehaviorCloningParams& params) : p_(params) {}

    const std::string& id() const override { return id_; }

    Signal score(const MarketBar& bar) override {
        Signal s;
        s.source_id = id_;
        s.confidence = p_.idle_confidence;

        if (bar.rsi < p_.rsi_oversold && bar.ma_crossover) {
            s.direction = Direction::Up;
            s.confidence = p_.active_confidence;
        } else if (bar.rsi > p_.rsi_overbought && !bar.ma_crossover) {
            s.direction = Direction::Down;
            s.confidence = p_.active_confidence;
        }
        return s;
    }

private:
    BehaviorCloningParams p_;
    std::string id_{"behavior_cloning"};
};

std::unique_ptr<ISignalProvider> createBehaviorCloningProvider(const BehaviorCloningParams& params) {
    return std::make_unique<BehaviorCloningProvider>(params);
}

} // namespace ensemble
