#include "signal.hpp"
#include <cmath>

namespace ensemble {

bool isUsable(const Signal& s) {
    const int dir = static_cast<int>(s.direction);
    if (dir < -1 || dir > 1) return false;
    return std::isfinite(s.confidence) && s.confidence >= 0.0 && s.confidence <= 1.0;
}

} // namespace ensemble
