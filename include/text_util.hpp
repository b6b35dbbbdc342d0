#pragma once

#include <string>

namespace ensemble {

/// Strip leading and trailing spaces, tabs and line endings.
std::string trim(const std::string& s);

/// Whole-string, finite number. "101abc", "", "nan" and "inf" are rejected.
bool parseDouble(const std::string& s, double& out);

/// Whole-string integer.
bool parseInteger(const std::string& s, long long& out);

} // namespace ensemble
