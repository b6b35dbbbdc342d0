#pragma once

#include <string>

namespace ensemble {

enum class Direction : int { Down = -1, Flat = 0, Up = 1 };

/// One provider's opinion about one bar. Ephemeral.
struct Signal {
    std::string source_id;
    Direction direction{Direction::Flat};
    double confidence{0};   // [0, 1]

    int sign() const { return static_cast<int>(direction); }
};

/// True if direction is one of -1/0/+1 and confidence is finite and within [0, 1].
bool isUsable(const Signal& s);

} // namespace ensemble
