#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace lobr {

// Prices and sizes travel as scaled integers everywhere inside the engine.
using Price = int64_t;
using Qty = int64_t;

inline constexpr int64_t kDefaultScale = 100000000;  // 1e8

// Number of decimal digits in a power-of-ten scale (1e8 -> 8).
// Throws std::invalid_argument if scale is not a positive power of ten.
int scale_digits(int64_t scale);

// Exact decimal text -> scaled integer ("30000.5" @1e8 -> 3000050000000).
// Rejects malformed text, more fractional digits than the scale carries,
// and values that do not fit in int64.
int64_t parse_scaled(std::string_view text, int64_t scale = kDefaultScale);

// Output boundary only.
inline double to_double(int64_t v, int64_t scale = kDefaultScale) {
  return static_cast<double>(v) / static_cast<double>(scale);
}

// Exact scaled integer -> decimal text, trailing zeros trimmed ("30000.5").
std::string to_decimal_string(int64_t v, int64_t scale = kDefaultScale);

}  // namespace lobr
