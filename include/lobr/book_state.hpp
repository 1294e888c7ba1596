#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <memory_resource>

#include "lobr/event.hpp"
#include "lobr/flat_hash.hpp"
#include "lobr/price_levels.hpp"

namespace lobr {

// A resting order as the index knows it.
struct OrderEntry {
  Side side{Side::BID};
  int64_t price{};
  int64_t size{};
  uint64_t ts_ns{};
};

enum class ApplyOutcome : uint8_t { APPLIED, DUPLICATE_ADD, UNKNOWN_ORDER };

// Resting orders always have a positive size; removal is a CANCEL. Throws
// ConsistencyError otherwise.
void require_positive_size(uint64_t id, int64_t size);

// Full per-instrument book: order index, both sides' level tiers and the
// sequence watermarks. Mutated only by the replayer; copies for checkpoints
// are taken with clone().
//
// Every mutator is strongly exception-safe: a ConsistencyError leaves the
// state exactly as it was.
class BookState {
 public:
  BookState(std::size_t top_n, std::pmr::memory_resource* mr,
            std::size_t index_capacity = 1024);

  BookState(const BookState&) = delete;
  BookState& operator=(const BookState&) = delete;

  // Structural deep copy whose storage comes from mr.
  std::unique_ptr<BookState> clone(std::pmr::memory_resource* mr) const;

  ApplyOutcome add_order(uint64_t id, Side side, int64_t price, int64_t size,
                         uint64_t ts_ns);
  // Keeps the order's side; the level tier is re-derived at the new price.
  ApplyOutcome update_order(uint64_t id, int64_t new_price, int64_t new_size);
  ApplyOutcome cancel_order(uint64_t id);

  const OrderEntry* find(uint64_t id) const { return index_.find_ptr(id); }
  std::size_t order_count() const { return index_.size(); }

  template <typename Fn>
  void for_each_order(Fn&& fn) const {
    index_.for_each(std::forward<Fn>(fn));
  }

  const SideLevels& bids() const { return bids_; }
  const SideLevels& asks() const { return asks_; }
  const SideLevels& levels(Side s) const {
    return s == Side::BID ? bids_ : asks_;
  }
  std::size_t top_n() const { return bids_.top_n(); }

  // applied_through is monotonic within one state object.
  uint64_t applied_through() const { return applied_through_; }
  uint64_t expected_next() const { return applied_through_ + 1; }
  void mark_applied(uint64_t seq);

  // Recomputes every level from the order index and checks it against the
  // stored tiers; throws ConsistencyError on any mismatch.
  void check_conservation() const;

  // Same orders, same levels in the same tiers, same watermark.
  bool equals(const BookState& other) const;

  std::pmr::memory_resource* resource() const { return mr_; }

 private:
  SideLevels& levels_mut(Side s) { return s == Side::BID ? bids_ : asks_; }

  std::pmr::memory_resource* mr_;
  FlatHashMap<uint64_t, OrderEntry> index_;
  SideLevels bids_;
  SideLevels asks_;
  uint64_t applied_through_ = 0;

  BookState(const BookState& other, std::pmr::memory_resource* mr);
};

}  // namespace lobr
