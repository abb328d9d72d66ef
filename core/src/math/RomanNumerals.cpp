#include "dk/math/RomanNumerals.hpp"

namespace dk {

std::string toRoman(int value) {
  if (value < kRomanMin || value > kRomanMax) return {};

  static const struct { int v; const char* s; } kTable[] = {
    {1000, "M"}, {900, "CM"}, {500, "D"}, {400, "CD"},
    {100, "C"},  {90, "XC"},  {50, "L"},  {40, "XL"},
    {10, "X"},   {9, "IX"},   {5, "V"},   {4, "IV"},
    {1, "I"}
  };

  std::string out;
  for (const auto& e : kTable) {
    while (value >= e.v) {
      out += e.s;
      value -= e.v;
    }
  }
  return out;
}

} // namespace dk
