#include "lobr/price_levels.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "lobr/errors.hpp"

namespace lobr {

namespace {
constexpr std::size_t kNotFound = std::numeric_limits<std::size_t>::max();
}

SideLevels::SideLevels(Side side, std::size_t top_n,
                       std::pmr::memory_resource* mr)
    : side_(side), top_n_(top_n), near_(top_n, LevelView{0, 0}, mr), deep_(mr) {}

SideLevels::SideLevels(const SideLevels& other, std::pmr::memory_resource* mr)
    : side_(other.side_),
      top_n_(other.top_n_),
      near_count_(other.near_count_),
      near_(other.near_, mr),
      deep_(other.deep_, mr),
      migrations_(other.migrations_) {}

std::size_t SideLevels::near_find(int64_t price) const {
  const auto first = near_.begin();
  const auto last = near_.begin() + static_cast<std::ptrdiff_t>(near_count_);
  auto it = std::lower_bound(first, last, price,
                             [this](const LevelView& lv, int64_t px) {
                               return better(lv.price, px);
                             });
  if (it == last || it->price != price) return kNotFound;
  return static_cast<std::size_t>(it - first);
}

int64_t SideLevels::volume_at(int64_t price) const {
  const std::size_t rank = near_find(price);
  if (rank != kNotFound) return near_[rank].volume;
  auto it = deep_.find(price);
  return it == deep_.end() ? 0 : it->second;
}

Tier SideLevels::tier_of(int64_t price) const {
  if (near_find(price) != kNotFound) return Tier::NEAR;
  if (deep_.count(price)) return Tier::DEEP;
  return Tier::NONE;
}

void SideLevels::adjust(int64_t price, int64_t delta) {
  if (delta == 0) return;
  const int64_t current = volume_at(price);
  const int64_t next = current + delta;
  if (next < 0) {
    throw ConsistencyError(std::string("negative volume on ") +
                           to_cstr(side_) + " level " + std::to_string(price) +
                           ": " + std::to_string(current) + " + " +
                           std::to_string(delta));
  }
  if (next == 0)
    remove_level(price);
  else
    set_level(price, next);
}

void SideLevels::near_insert(int64_t price, int64_t volume) {
  const auto first = near_.begin();
  const auto last = near_.begin() + static_cast<std::ptrdiff_t>(near_count_);
  auto it = std::lower_bound(first, last, price,
                             [this](const LevelView& lv, int64_t px) {
                               return better(lv.price, px);
                             });
  const std::size_t pos = static_cast<std::size_t>(it - first);
  for (std::size_t i = near_count_; i > pos; --i) near_[i] = near_[i - 1];
  near_[pos] = LevelView{price, volume};
  ++near_count_;
}

void SideLevels::near_erase(std::size_t rank) {
  for (std::size_t i = rank; i + 1 < near_count_; ++i) near_[i] = near_[i + 1];
  --near_count_;
  near_[near_count_] = LevelView{0, 0};
}

void SideLevels::set_level(int64_t price, int64_t volume) {
  const std::size_t rank = near_find(price);
  if (rank != kNotFound) {
    near_[rank].volume = volume;
    return;
  }
  auto it = deep_.find(price);
  if (it != deep_.end()) {
    // Deep prices are all worse than the near boundary; a volume change
    // alone cannot move them across it.
    it->second = volume;
    return;
  }

  if (top_n_ == 0) {
    deep_.emplace(price, volume);
    return;
  }
  if (near_count_ < top_n_) {
    near_insert(price, volume);
    return;
  }
  const LevelView worst = near_[near_count_ - 1];
  if (better(price, worst.price)) {
    // New level inside the window pushes the worst near level out.
    near_erase(near_count_ - 1);
    deep_.emplace(worst.price, worst.volume);
    ++migrations_;
    near_insert(price, volume);
  } else {
    deep_.emplace(price, volume);
  }
}

void SideLevels::remove_level(int64_t price) {
  const std::size_t rank = near_find(price);
  if (rank != kNotFound) {
    near_erase(rank);
    promote_best_deep();
    return;
  }
  deep_.erase(price);
}

void SideLevels::promote_best_deep() {
  if (deep_.empty() || near_count_ >= top_n_) return;
  auto best_it = deep_.begin();
  for (auto it = deep_.begin(); it != deep_.end(); ++it)
    if (better(it->first, best_it->first)) best_it = it;
  const LevelView lv{best_it->first, best_it->second};
  deep_.erase(best_it);
  near_insert(lv.price, lv.volume);
  ++migrations_;
}

std::optional<LevelView> SideLevels::best() const {
  if (near_count_ > 0) return near_[0];
  // top_n == 0 keeps everything deep.
  if (deep_.empty()) return std::nullopt;
  auto best_it = deep_.begin();
  for (auto it = deep_.begin(); it != deep_.end(); ++it)
    if (better(it->first, best_it->first)) best_it = it;
  return LevelView{best_it->first, best_it->second};
}

std::vector<LevelView> SideLevels::near_levels() const {
  return std::vector<LevelView>(
      near_.begin(), near_.begin() + static_cast<std::ptrdiff_t>(near_count_));
}

std::vector<LevelView> SideLevels::sorted_deep() const {
  std::vector<LevelView> out;
  out.reserve(deep_.size());
  for (const auto& kv : deep_) out.push_back(LevelView{kv.first, kv.second});
  std::sort(out.begin(), out.end(),
            [this](const LevelView& a, const LevelView& b) {
              return better(a.price, b.price);
            });
  return out;
}

std::vector<LevelView> SideLevels::all_levels() const {
  std::vector<LevelView> out = near_levels();
  auto deep = sorted_deep();
  out.insert(out.end(), deep.begin(), deep.end());
  return out;
}

void SideLevels::clear() {
  for (auto& lv : near_) lv = LevelView{0, 0};
  near_count_ = 0;
  deep_.clear();
}

void SideLevels::check_invariants() const {
  const std::string tag = std::string(to_cstr(side_)) + " side: ";
  for (std::size_t i = 0; i < near_count_; ++i) {
    if (near_[i].volume <= 0)
      throw ConsistencyError(tag + "non-positive near volume at " +
                             std::to_string(near_[i].price));
    if (i > 0 && !better(near_[i - 1].price, near_[i].price))
      throw ConsistencyError(tag + "near tier out of order at rank " +
                             std::to_string(i));
  }
  if (!deep_.empty() && near_count_ < top_n_)
    throw ConsistencyError(tag + "deep tier populated while near tier has room");
  for (const auto& kv : deep_) {
    if (kv.second <= 0)
      throw ConsistencyError(tag + "non-positive deep volume at " +
                             std::to_string(kv.first));
    if (near_count_ > 0 && !better(near_[near_count_ - 1].price, kv.first))
      throw ConsistencyError(tag + "deep level " + std::to_string(kv.first) +
                             " inside the near window");
  }
}

}  // namespace lobr
