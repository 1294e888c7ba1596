#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "lobr/fixed_point.hpp"

static bool throws(const std::string& text, int64_t scale = lobr::kDefaultScale) {
  try {
    lobr::parse_scaled(text, scale);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

static void test_parse_exact() {
  assert(lobr::parse_scaled("30000") == 3000000000000LL);
  assert(lobr::parse_scaled("30000.5") == 3000050000000LL);
  assert(lobr::parse_scaled("0.5") == 50000000);
  assert(lobr::parse_scaled("0.00000001") == 1);
  assert(lobr::parse_scaled("-1.25") == -125000000);
  assert(lobr::parse_scaled(".5") == 50000000);
  // trailing zeros past the scale are harmless
  assert(lobr::parse_scaled("1.000000000") == 100000000);
  assert(lobr::parse_scaled("12.34", 100) == 1234);
}

static void test_parse_rejects() {
  assert(throws(""));
  assert(throws("-"));
  assert(throws("1.2.3"));
  assert(throws("12a"));
  assert(throws("0.000000001"));  // finer than 1e-8
  assert(throws("99999999999999"));  // overflows int64 once scaled
  assert(throws("1", 3));            // not a power of ten
}

static void test_format() {
  assert(lobr::to_decimal_string(3000050000000LL) == "30000.5");
  assert(lobr::to_decimal_string(3000000000000LL) == "30000");
  assert(lobr::to_decimal_string(1) == "0.00000001");
  assert(lobr::to_decimal_string(-125000000) == "-1.25");
  assert(lobr::to_decimal_string(0) == "0");
  assert(lobr::scale_digits(100000000) == 8);
  assert(lobr::scale_digits(1) == 0);

  const char* samples[] = {"0.1", "123.45678901", "-7", "42.00000001"};
  for (const char* s : samples)
    assert(lobr::to_decimal_string(lobr::parse_scaled(s)) == s);
}

int main() {
  test_parse_exact();
  test_parse_rejects();
  test_format();
  std::cout << "OK: fixed_point\n";
  return 0;
}
