#pragma once
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <unordered_map>
#include <vector>

#include "lobr/event.hpp"

namespace lobr {

struct LevelView {
  int64_t price;
  int64_t volume;

  bool operator==(const LevelView& o) const {
    return price == o.price && volume == o.volume;
  }
};

enum class Tier : uint8_t { NONE = 0, NEAR = 1, DEEP = 2 };

// Aggregated volume per price for one side of the book, in two tiers:
//   near: the top_n best levels, a contiguous array addressed by rank
//         (slot 0 is the best price), sorted best-first
//   deep: every other level, unordered price -> volume
// Invariants (check_invariants):
//   - every volume is > 0
//   - near is strictly sorted best-first
//   - every deep price is worse than the worst near price
//   - deep is empty unless near is full
class SideLevels {
 public:
  SideLevels(Side side, std::size_t top_n, std::pmr::memory_resource* mr);
  SideLevels(const SideLevels& other, std::pmr::memory_resource* mr);

  SideLevels(const SideLevels&) = delete;
  SideLevels& operator=(const SideLevels&) = delete;

  // Adds delta (signed) to the level at price. A result of zero removes the
  // level; a negative result throws ConsistencyError and leaves the side
  // untouched. Crossing the top_n boundary moves levels between tiers with
  // their volume unchanged.
  void adjust(int64_t price, int64_t delta);

  int64_t volume_at(int64_t price) const;
  Tier tier_of(int64_t price) const;

  std::optional<LevelView> best() const;
  Side side() const { return side_; }
  std::size_t top_n() const { return top_n_; }
  std::size_t near_count() const { return near_count_; }
  std::size_t deep_count() const { return deep_.size(); }
  std::size_t depth() const { return near_count_ + deep_.size(); }
  const LevelView& near_at(std::size_t rank) const { return near_[rank]; }

  std::vector<LevelView> near_levels() const;
  // Sorted on demand, best-first. Never maintained incrementally.
  std::vector<LevelView> sorted_deep() const;
  std::vector<LevelView> all_levels() const;

  uint64_t migrations() const { return migrations_; }

  void clear();
  void check_invariants() const;

  // True if a is a strictly better price than b on this side.
  bool better(int64_t a, int64_t b) const {
    return side_ == Side::BID ? a > b : a < b;
  }

 private:
  std::size_t near_find(int64_t price) const;
  void near_insert(int64_t price, int64_t volume);
  void near_erase(std::size_t rank);
  void set_level(int64_t price, int64_t volume);
  void remove_level(int64_t price);
  void promote_best_deep();

  Side side_;
  std::size_t top_n_;
  std::size_t near_count_ = 0;
  std::pmr::vector<LevelView> near_;
  std::pmr::unordered_map<int64_t, int64_t> deep_;
  uint64_t migrations_ = 0;
};

}  // namespace lobr
