#pragma once

#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "lobr/rng.hpp"

namespace lobr {

// Open-addressing map for integral keys (order ids). Slot states live in a
// separate control array so probing only touches one byte per slot. Erase
// leaves a tombstone; insert reuses the first one on its probe path.
// Tombstones are compacted by a rebuild at the same capacity, and the table
// doubles at 80% load unless growth is disabled, in which case insert throws
// std::length_error. All storage comes from the supplied resource.
template <typename K, typename V>
class FlatHashMap {
  static_assert(std::is_integral_v<K>, "FlatHashMap requires integral keys");

 public:
  FlatHashMap(std::pmr::memory_resource* mr, std::size_t min_capacity,
              bool allow_grow = true)
      : mr_(mr), allow_grow_(allow_grow), ctrl_(mr), slots_(mr) {
    rebuild(round_up(min_capacity));
  }

  // Deep copy into another resource.
  FlatHashMap(const FlatHashMap& other, std::pmr::memory_resource* mr)
      : mr_(mr),
        allow_grow_(other.allow_grow_),
        size_(other.size_),
        tombs_(other.tombs_),
        ctrl_(other.ctrl_, mr),
        slots_(other.slots_, mr) {}

  FlatHashMap(const FlatHashMap&) = delete;
  FlatHashMap& operator=(const FlatHashMap&) = delete;
  FlatHashMap(FlatHashMap&&) = default;
  FlatHashMap& operator=(FlatHashMap&&) = default;

  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  std::size_t tombs() const noexcept { return tombs_; }
  std::size_t capacity() const noexcept { return ctrl_.size(); }

  V* find_ptr(K key) noexcept {
    const std::size_t i = locate(key);
    return i == kMissing ? nullptr : &slots_[i].value;
  }
  const V* find_ptr(K key) const noexcept {
    const std::size_t i = locate(key);
    return i == kMissing ? nullptr : &slots_[i].value;
  }

  bool contains(K key) const noexcept { return locate(key) != kMissing; }

  // Returns false and leaves the map alone if the key is present.
  bool insert(K key, const V& value) { return put(key, value); }
  bool insert(K key, V&& value) { return put(key, std::move(value)); }

  bool erase(K key) noexcept {
    const std::size_t i = locate(key);
    if (i == kMissing) return false;
    ctrl_[i] = kTomb;
    slots_[i].value = V{};
    --size_;
    ++tombs_;
    return true;
  }

  void clear() noexcept {
    for (auto& c : ctrl_) c = kEmpty;
    size_ = 0;
    tombs_ = 0;
  }

  // Visits live entries in slot order: fn(key, const V&).
  template <typename Fn>
  void for_each(Fn&& fn) const {
    for (std::size_t i = 0; i < ctrl_.size(); ++i)
      if (ctrl_[i] == kFull) fn(slots_[i].key, slots_[i].value);
  }

 private:
  static constexpr uint8_t kEmpty = 0;
  static constexpr uint8_t kFull = 1;
  static constexpr uint8_t kTomb = 2;
  static constexpr std::size_t kMissing = ~std::size_t{0};

  struct Slot {
    K key{};
    V value{};
  };

  static std::size_t round_up(std::size_t n) {
    std::size_t cap = 8;
    while (cap < n) cap <<= 1;
    return cap;
  }

  std::size_t home(K key) const noexcept {
    return static_cast<std::size_t>(
               splitmix_finalize(static_cast<uint64_t>(key))) &
           (ctrl_.size() - 1);
  }

  std::size_t locate(K key) const noexcept {
    const std::size_t mask = ctrl_.size() - 1;
    for (std::size_t i = home(key);; i = (i + 1) & mask) {
      if (ctrl_[i] == kEmpty) return kMissing;
      if (ctrl_[i] == kFull && slots_[i].key == key) return i;
    }
  }

  // Re-inserts every live entry into fresh arrays of `cap` slots.
  void rebuild(std::size_t cap) {
    std::pmr::vector<uint8_t> old_ctrl(cap, kEmpty, mr_);
    std::pmr::vector<Slot> old_slots(cap, mr_);
    old_ctrl.swap(ctrl_);
    old_slots.swap(slots_);
    size_ = 0;
    tombs_ = 0;
    const std::size_t mask = cap - 1;
    for (std::size_t j = 0; j < old_ctrl.size(); ++j) {
      if (old_ctrl[j] != kFull) continue;
      std::size_t i = home(old_slots[j].key);
      while (ctrl_[i] != kEmpty) i = (i + 1) & mask;
      ctrl_[i] = kFull;
      slots_[i] = std::move(old_slots[j]);
      ++size_;
    }
  }

  void reserve_one() {
    const std::size_t cap = ctrl_.size();
    if ((size_ + tombs_ + 1) * 10 < cap * 8 && tombs_ <= cap / 4) return;
    if ((size_ + 1) * 10 < cap * 8) {
      rebuild(cap);
      return;
    }
    if (!allow_grow_)
      throw std::length_error("FlatHashMap full: size=" +
                              std::to_string(size_) +
                              " cap=" + std::to_string(cap));
    rebuild(cap * 2);
  }

  template <typename VV>
  bool put(K key, VV&& value) {
    if (contains(key)) return false;
    reserve_one();
    const std::size_t mask = ctrl_.size() - 1;
    std::size_t i = home(key);
    while (ctrl_[i] == kFull) i = (i + 1) & mask;
    if (ctrl_[i] == kTomb) --tombs_;
    ctrl_[i] = kFull;
    slots_[i].key = key;
    slots_[i].value = std::forward<VV>(value);
    ++size_;
    return true;
  }

  std::pmr::memory_resource* mr_;
  bool allow_grow_;
  std::size_t size_ = 0;
  std::size_t tombs_ = 0;
  std::pmr::vector<uint8_t> ctrl_;
  std::pmr::vector<Slot> slots_;
};

}  // namespace lobr
