#include "bootstrap_rl_provider.hpp"
#include <memory>
#include <string>

namespace ensemble {

class BootstrapRlProvider : public ISignalProvider {
public:
    explicit BootstrapRlProvider(const BootstrapRlParams& params) : p_(params) {}

    const std::string& id() const override { return id_; }

    Signal score(const MarketBar& bar) override {
        Signal s;
        s.source_id = id_;
        s.confidence = p_.idle_confidence;

        const double momentum = bar.trend_strength;
        const double reversion = bar.bb_position;

        if (momentum > p_.momentum_threshold && reversion < p_.dip_bb_position) {
            s.direction = Direction::Up;
            s.confidence = p_.active_confidence;
        } else if (momentum < -p_.momentum_threshold && reversion > p_.rally_bb_position) {
            s.direction = Direction::Down;
            s.confidence = p_.active_confidence;
        }
        return s;
    }

private:
    BootstrapRlParams p_;
    std::string id_{"bootstrap_rl"};
};

std::unique_ptr<ISignalProvider> createBootstrapRlProvider(const BootstrapRlParams& params) {
    return std::make_unique<BootstrapRlProvider>(params);
}

} // namespace ensemble
