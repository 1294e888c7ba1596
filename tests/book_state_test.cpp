#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory_resource>
#include <stdexcept>
#include <string>

#include "lobr/book_state.hpp"
#include "lobr/book_view.hpp"
#include "lobr/errors.hpp"

using lobr::ApplyOutcome;
using lobr::BookState;
using lobr::Side;

static void test_add_update_cancel() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(20, &pool);

  const int64_t px = 3000000000000LL;  // 30000.0
  assert(book.add_order(1, Side::BID, px, 50000000, 1) == ApplyOutcome::APPLIED);
  assert(book.bids().volume_at(px) == 50000000);

  assert(book.update_order(1, px, 30000000) == ApplyOutcome::APPLIED);
  assert(book.bids().volume_at(px) == 30000000);

  assert(book.cancel_order(1) == ApplyOutcome::APPLIED);
  assert(book.bids().depth() == 0);
  assert(book.order_count() == 0);
  book.check_conservation();
}

static void test_anomalies_are_not_fatal() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(5, &pool);
  assert(book.add_order(1, Side::ASK, 101, 4, 0) == ApplyOutcome::APPLIED);
  assert(book.add_order(1, Side::ASK, 102, 9, 0) == ApplyOutcome::DUPLICATE_ADD);
  assert(book.asks().volume_at(101) == 4);
  assert(book.asks().volume_at(102) == 0);

  assert(book.update_order(2, 101, 1) == ApplyOutcome::UNKNOWN_ORDER);
  assert(book.cancel_order(2) == ApplyOutcome::UNKNOWN_ORDER);
  book.check_conservation();
}

static void test_update_moves_price_and_keeps_side() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(2, &pool);
  book.add_order(1, Side::BID, 100, 10, 0);
  book.add_order(2, Side::BID, 100, 5, 0);
  book.add_order(3, Side::BID, 99, 1, 0);
  book.add_order(4, Side::BID, 98, 1, 0);

  book.update_order(1, 97, 10);
  assert(book.bids().volume_at(100) == 5);
  assert(book.bids().volume_at(97) == 10);
  assert(book.find(1)->side == Side::BID);
  assert(book.bids().tier_of(97) == lobr::Tier::DEEP);
  book.check_conservation();
}

static void test_negative_size_rejected_without_trace() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(5, &pool);
  book.add_order(1, Side::BID, 100, 10, 0);

  bool threw = false;
  try {
    book.update_order(1, 100, -20);
  } catch (const lobr::ConsistencyError&) {
    threw = true;
  }
  assert(threw);
  assert(book.find(1)->size == 10);
  assert(book.bids().volume_at(100) == 10);

  threw = false;
  try {
    book.add_order(2, Side::ASK, 105, -1, 0);
  } catch (const lobr::ConsistencyError&) {
    threw = true;
  }
  assert(threw);
  assert(book.find(2) == nullptr);
  book.check_conservation();
}

static void test_sizes_must_be_positive() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(5, &pool);
  book.add_order(1, Side::BID, 100, 50, 0);

  // Enough volume at 100 to absorb it, still refused.
  for (int64_t bad : {int64_t{-20}, int64_t{0}}) {
    bool threw = false;
    try {
      book.add_order(2, Side::BID, 100, bad, 0);
    } catch (const lobr::ConsistencyError&) {
      threw = true;
    }
    assert(threw);
    threw = false;
    try {
      book.update_order(1, 101, bad);
    } catch (const lobr::ConsistencyError&) {
      threw = true;
    }
    assert(threw);
  }
  assert(book.find(2) == nullptr);
  assert(book.find(1)->price == 100 && book.find(1)->size == 50);
  assert(book.bids().volume_at(100) == 50);
  assert(book.bids().depth() == 1);
  book.check_conservation();
}

static void test_clone_equals_and_is_independent() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(3, &pool);
  for (uint64_t i = 1; i <= 50; ++i) {
    const Side s = (i % 2) ? Side::BID : Side::ASK;
    const int64_t px = s == Side::BID ? 1000 - static_cast<int64_t>(i)
                                      : 1000 + static_cast<int64_t>(i);
    book.add_order(i, s, px, static_cast<int64_t>(i) * 10, i);
  }
  book.mark_applied(50);

  auto copy = book.clone(std::pmr::new_delete_resource());
  assert(copy->equals(book));
  assert(copy->applied_through() == 50);
  copy->check_conservation();

  book.cancel_order(1);
  assert(!copy->equals(book));
  assert(copy->find(1) != nullptr);
}

static void test_watermark_is_monotonic() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(5, &pool);
  book.mark_applied(10);
  assert(book.expected_next() == 11);
  bool threw = false;
  try {
    book.mark_applied(9);
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
  assert(book.applied_through() == 10);
}

static void test_views() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(2, &pool);
  book.add_order(1, Side::BID, 3000000000000LL, 50000000, 0);
  book.add_order(2, Side::BID, 2999900000000LL, 100000000, 0);
  book.add_order(3, Side::BID, 2999800000000LL, 100000000, 0);
  book.add_order(4, Side::ASK, 3000050000000LL, 25000000, 0);
  book.mark_applied(4);

  auto v = lobr::make_view(book, "BTCUSDT", lobr::kDefaultScale);
  assert(v.applied_through == 4);
  assert(v.bids.size() == 2);  // near tier only
  assert(*v.spread() == 50000000);
  auto d = v.to_decimal(*v.best_bid);
  assert(d.price_text == "30000");
  assert(d.size_text == "0.5");

  auto deep = lobr::make_deep_view(book, lobr::kDefaultScale);
  assert(deep.bids.size() == 3);
  assert(deep.bids.back().price == 2999800000000LL);
  assert(v.instrument_id == "BTCUSDT");
}

// Twenty asks, five shown: the five nearest the touch, best one last.
static void test_ladder_shows_best_levels() {
  std::pmr::unsynchronized_pool_resource pool;
  BookState book(20, &pool);
  for (uint64_t i = 1; i <= 20; ++i)
    book.add_order(i, Side::ASK, 100 + static_cast<int64_t>(i), 1, 0);
  book.add_order(21, Side::BID, 99, 2, 0);
  book.add_order(22, Side::BID, 98, 3, 0);

  const auto v = lobr::make_view(book, "X", 1);
  const std::string text = lobr::format_ladder(v, 5);
  assert(text ==
         "  ASK 105 x 1\n"
         "  ASK 104 x 1\n"
         "  ASK 103 x 1\n"
         "  ASK 102 x 1\n"
         "  ASK 101 x 1\n"
         "  --- spread 2\n"
         "  BID 99 x 2\n"
         "  BID 98 x 3\n");
  assert(lobr::format_ladder(v, 0) == "  --- spread 2\n");
}

int main() {
  test_add_update_cancel();
  test_anomalies_are_not_fatal();
  test_update_moves_price_and_keeps_side();
  test_negative_size_rejected_without_trace();
  test_sizes_must_be_positive();
  test_clone_equals_and_is_independent();
  test_watermark_is_monotonic();
  test_views();
  test_ladder_shows_best_levels();
  std::cout << "OK: book_state\n";
  return 0;
}
