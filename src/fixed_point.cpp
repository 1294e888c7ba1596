#include "lobr/fixed_point.hpp"

#include <limits>
#include <stdexcept>

namespace lobr {

int scale_digits(int64_t scale) {
  if (scale <= 0)
    throw std::invalid_argument("scale must be positive: " +
                                std::to_string(scale));
  int digits = 0;
  int64_t s = scale;
  while (s % 10 == 0) {
    s /= 10;
    ++digits;
  }
  if (s != 1)
    throw std::invalid_argument("scale must be a power of ten: " +
                                std::to_string(scale));
  return digits;
}

int64_t parse_scaled(std::string_view text, int64_t scale) {
  const int digits = scale_digits(scale);
  if (text.empty()) throw std::invalid_argument("empty decimal");

  std::size_t pos = 0;
  bool negative = false;
  if (text[0] == '-' || text[0] == '+') {
    negative = text[0] == '-';
    ++pos;
  }

  constexpr uint64_t kLimit =
      static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  uint64_t acc = 0;
  bool any_digit = false;
  int frac = -1;  // -1 until the '.' is seen

  auto push_digit = [&](char c) {
    const uint64_t d = static_cast<uint64_t>(c - '0');
    if (acc > (kLimit - d) / 10)
      throw std::invalid_argument("decimal out of range: " + std::string(text));
    acc = acc * 10 + d;
  };

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c == '.') {
      if (frac >= 0)
        throw std::invalid_argument("malformed decimal: " + std::string(text));
      frac = 0;
      continue;
    }
    if (c < '0' || c > '9')
      throw std::invalid_argument("malformed decimal: " + std::string(text));
    any_digit = true;
    if (frac >= 0) {
      if (frac == digits) {
        // Extra fractional digits are only acceptable if they are zero.
        if (c != '0')
          throw std::invalid_argument("decimal finer than scale: " +
                                      std::string(text));
        continue;
      }
      ++frac;
    }
    push_digit(c);
  }
  if (!any_digit)
    throw std::invalid_argument("malformed decimal: " + std::string(text));

  for (int i = (frac < 0 ? 0 : frac); i < digits; ++i) push_digit('0');

  const int64_t v = static_cast<int64_t>(acc);
  return negative ? -v : v;
}

std::string to_decimal_string(int64_t v, int64_t scale) {
  const int digits = scale_digits(scale);
  const bool negative = v < 0;
  // Work in unsigned so INT64_MIN does not overflow on negation.
  uint64_t mag = negative ? 0 - static_cast<uint64_t>(v)
                          : static_cast<uint64_t>(v);
  const uint64_t uscale = static_cast<uint64_t>(scale);
  std::string out = std::to_string(mag / uscale);
  uint64_t rem = mag % uscale;
  if (rem != 0) {
    std::string frac(static_cast<std::size_t>(digits), '0');
    for (int i = digits - 1; i >= 0; --i) {
      frac[static_cast<std::size_t>(i)] = static_cast<char>('0' + rem % 10);
      rem /= 10;
    }
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    out += '.';
    out += frac;
  }
  return negative ? "-" + out : out;
}

}  // namespace lobr
