#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "lobr/book_state.hpp"
#include "lobr/fixed_point.hpp"

namespace lobr {

// Decimal rendering of one level; only produced at the output boundary.
struct DecimalLevel {
  double price;
  double size;
  std::string price_text;  // exact
  std::string size_text;   // exact
};

// Read-only, self-contained copy of the top of the book. Safe to hand to
// other threads; it never aliases live state.
struct BookView {
  std::string instrument_id;
  uint64_t applied_through = 0;
  int64_t scale = kDefaultScale;
  std::optional<LevelView> best_bid;
  std::optional<LevelView> best_ask;
  std::vector<LevelView> bids;  // near tier, best-first
  std::vector<LevelView> asks;

  std::optional<int64_t> spread() const {
    if (!best_bid || !best_ask) return std::nullopt;
    return best_ask->price - best_bid->price;
  }

  DecimalLevel to_decimal(const LevelView& lv) const {
    return DecimalLevel{to_double(lv.price, scale), to_double(lv.volume, scale),
                        to_decimal_string(lv.price, scale),
                        to_decimal_string(lv.volume, scale)};
  }
};

// Every level of both sides, sorted best-first. Built on request only.
struct DeepBookView {
  uint64_t applied_through = 0;
  int64_t scale = kDefaultScale;
  std::vector<LevelView> bids;
  std::vector<LevelView> asks;
};

// Ladder text for the CLI: the k best asks (worst of them first, so the
// touch sits in the middle), the spread, then the k best bids.
std::string format_ladder(const BookView& v, std::size_t k);

BookView make_view(const BookState& state, const std::string& instrument_id,
                   int64_t scale);
DeepBookView make_deep_view(const BookState& state, int64_t scale);

}  // namespace lobr
