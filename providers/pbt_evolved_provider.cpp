#include "pbt_evolved_provider.hpp"
#include <memory>
#include <string>

namespace ensemble {

class PbtEvolvedProvider : public ISignalProvider {
public:
    explicit PbtEvolvedProvider(const PbtEvolvedParams& params) : p_(params) {}

    const std::string& id() const override { return id_; }

    Signal score(const MarketBar& bar) override {
        Signal s;
        s.source_id = id_;
        s.confidence = p_.idle_confidence;

        double adjusted = bar.trend_strength / (bar.volatility + p_.vol_floor);
        if (adjusted > p_.threshold) {
            s.direction = Direction::Up;
            s.confidence = p_.active_confidence;
        } else if (adjusted < -p_.threshold) {
            s.direction = Direction::Down;
            s.confidence = p_.active_confidence;
        }
        return s;
    }

private:
    PbtEvolvedParams p_;
    std::string id_{"pbt_evolved"};
};

std::unique_ptr<ISignalProvider> createPbtEvolvedProvider(const PbtEvolvedParams& params) {
    return std::make_unique<PbtEvolvedProvider>(params);
}

} // namespace ensemble
