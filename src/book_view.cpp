#include "lobr/book_view.hpp"

#include <sstream>

namespace lobr {

BookView make_view(const BookState& state, const std::string& instrument_id,
                   int64_t scale) {
  BookView v;
  v.instrument_id = instrument_id;
  v.applied_through = state.applied_through();
  v.scale = scale;
  v.best_bid = state.bids().best();
  v.best_ask = state.asks().best();
  v.bids = state.bids().near_levels();
  v.asks = state.asks().near_levels();
  return v;
}

DeepBookView make_deep_view(const BookState& state, int64_t scale) {
  DeepBookView v;
  v.applied_through = state.applied_through();
  v.scale = scale;
  v.bids = state.bids().all_levels();
  v.asks = state.asks().all_levels();
  return v;
}

std::string format_ladder(const BookView& v, std::size_t k) {
  std::ostringstream out;
  auto line = [&](const char* name, const LevelView& lv) {
    const auto d = v.to_decimal(lv);
    out << "  " << name << " " << d.price_text << " x " << d.size_text << "\n";
  };
  const std::size_t asks = v.asks.size() < k ? v.asks.size() : k;
  for (std::size_t i = asks; i-- > 0;) line("ASK", v.asks[i]);
  if (auto s = v.spread())
    out << "  --- spread " << to_decimal_string(*s, v.scale) << "\n";
  for (std::size_t i = 0; i < v.bids.size() && i < k; ++i) line("BID", v.bids[i]);
  return out.str();
}

}  // namespace lobr
