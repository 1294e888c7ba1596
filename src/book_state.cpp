#include "lobr/book_state.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <utility>

#include "lobr/errors.hpp"

namespace lobr {

BookState::BookState(std::size_t top_n, std::pmr::memory_resource* mr,
                     std::size_t index_capacity)
    : mr_(mr),
      index_(mr, index_capacity, /*allow_grow=*/true),
      bids_(Side::BID, top_n, mr),
      asks_(Side::ASK, top_n, mr) {}

BookState::BookState(const BookState& other, std::pmr::memory_resource* mr)
    : mr_(mr),
      index_(other.index_, mr),
      bids_(other.bids_, mr),
      asks_(other.asks_, mr),
      applied_through_(other.applied_through_) {}

std::unique_ptr<BookState> BookState::clone(
    std::pmr::memory_resource* mr) const {
  return std::unique_ptr<BookState>(new BookState(*this, mr));
}

void require_positive_size(uint64_t id, int64_t size) {
  if (size <= 0)
    throw ConsistencyError("order " + std::to_string(id) +
                           " has non-positive size " + std::to_string(size));
}

ApplyOutcome BookState::add_order(uint64_t id, Side side, int64_t price,
                                  int64_t size, uint64_t ts_ns) {
  if (index_.contains(id)) return ApplyOutcome::DUPLICATE_ADD;
  require_positive_size(id, size);
  auto& lv = levels_mut(side);
  lv.adjust(price, size);  // throws before anything is touched
  try {
    index_.insert(id, OrderEntry{side, price, size, ts_ns});
  } catch (...) {
    lv.adjust(price, -size);
    throw;
  }
  return ApplyOutcome::APPLIED;
}

ApplyOutcome BookState::update_order(uint64_t id, int64_t new_price,
                                     int64_t new_size) {
  OrderEntry* o = index_.find_ptr(id);
  if (!o) return ApplyOutcome::UNKNOWN_ORDER;
  require_positive_size(id, new_size);
  auto& lv = levels_mut(o->side);

  // Validate both halves before mutating so a failure leaves no trace.
  const int64_t old_after = lv.volume_at(o->price) - o->size;
  const int64_t new_after =
      (new_price == o->price ? old_after : lv.volume_at(new_price)) + new_size;
  if (old_after < 0 || new_after < 0) {
    throw ConsistencyError(
        "negative volume updating order " + std::to_string(id) + " (" +
        std::to_string(o->price) + " x " + std::to_string(o->size) + " -> " +
        std::to_string(new_price) + " x " + std::to_string(new_size) + ")");
  }

  lv.adjust(o->price, -o->size);
  lv.adjust(new_price, new_size);
  o->price = new_price;
  o->size = new_size;
  return ApplyOutcome::APPLIED;
}

ApplyOutcome BookState::cancel_order(uint64_t id) {
  const OrderEntry* o = index_.find_ptr(id);
  if (!o) return ApplyOutcome::UNKNOWN_ORDER;
  levels_mut(o->side).adjust(o->price, -o->size);
  index_.erase(id);
  return ApplyOutcome::APPLIED;
}

void BookState::mark_applied(uint64_t seq) {
  if (seq < applied_through_)
    throw std::logic_error("applied-through watermark moving backwards: " +
                           std::to_string(applied_through_) + " -> " +
                           std::to_string(seq));
  applied_through_ = seq;
}

void BookState::check_conservation() const {
  bids_.check_invariants();
  asks_.check_invariants();

  std::map<std::pair<Side, int64_t>, int64_t> expected;
  index_.for_each([&](uint64_t, const OrderEntry& o) {
    expected[{o.side, o.price}] += o.size;
  });

  std::size_t nonzero = 0;
  for (const auto& kv : expected) {
    const int64_t stored = levels(kv.first.first).volume_at(kv.first.second);
    if (stored != kv.second) {
      throw ConsistencyError(std::string("level ") + to_cstr(kv.first.first) +
                             " " + std::to_string(kv.first.second) +
                             " holds " + std::to_string(stored) +
                             " but orders sum to " +
                             std::to_string(kv.second));
    }
    if (kv.second != 0) ++nonzero;
  }
  if (nonzero != bids_.depth() + asks_.depth())
    throw ConsistencyError("book holds levels with no resting orders");
}

bool BookState::equals(const BookState& other) const {
  if (applied_through_ != other.applied_through_) return false;
  if (index_.size() != other.index_.size()) return false;
  bool same = true;
  index_.for_each([&](uint64_t id, const OrderEntry& o) {
    if (!same) return;
    const OrderEntry* p = other.find(id);
    same = p && p->side == o.side && p->price == o.price &&
           p->size == o.size && p->ts_ns == o.ts_ns;
  });
  if (!same) return false;
  for (Side s : {Side::BID, Side::ASK}) {
    if (levels(s).near_levels() != other.levels(s).near_levels()) return false;
    if (levels(s).sorted_deep() != other.levels(s).sorted_deep()) return false;
  }
  return true;
}

}  // namespace lobr
