#pragma once
#include <string>

namespace dk {

constexpr int kRomanMin = 1;
constexpr int kRomanMax = 3999;

// Subtractive Roman notation. Returns "" outside [1, 3999].
std::string toRoman(int value);

} // namespace dk
