#pragma once

#include <atomic>
#include <cstddef>
#include <new>
#include <type_traits>
#include <utility>

namespace lobr {

// Fixed-size single-producer / single-consumer hand-off. The pipeline thread
// pushes checkpoint jobs, the persistence worker pops them; neither blocks.
//
// head_ and tail_ only ever increase. The producer publishes a constructed
// slot with a release store of head_; the consumer destroys the slot before a
// release store of tail_. Each side keeps a stale copy of the other side's
// counter and only reloads it when the copy says full / empty.
template <typename T, std::size_t Capacity>
class SpscRing {
  static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                "Capacity must be a power of two >= 2");
  static_assert(std::is_move_constructible_v<T>, "T must be move-constructible");

 public:
  SpscRing() = default;
  SpscRing(const SpscRing&) = delete;
  SpscRing& operator=(const SpscRing&) = delete;
  ~SpscRing() { clear(); }

  static constexpr std::size_t capacity() noexcept { return Capacity; }

  // A full ring returns false and leaves the argument untouched.
  bool try_push(T&& v) { return try_emplace(std::move(v)); }
  bool try_push(const T& v) { return try_emplace(v); }

  template <typename... Args>
  bool try_emplace(Args&&... args) {
    const std::size_t head = prod_.head.load(std::memory_order_relaxed);
    if (head - prod_.tail_seen == Capacity) {
      prod_.tail_seen = cons_.tail.load(std::memory_order_acquire);
      if (head - prod_.tail_seen == Capacity) return false;
    }
    ::new (static_cast<void*>(at(head))) T(std::forward<Args>(args)...);
    prod_.head.store(head + 1, std::memory_order_release);
    return true;
  }

  bool try_pop(T& out) {
    const std::size_t tail = cons_.tail.load(std::memory_order_relaxed);
    if (tail == cons_.head_seen) {
      cons_.head_seen = prod_.head.load(std::memory_order_acquire);
      if (tail == cons_.head_seen) return false;
    }
    T* p = at(tail);
    out = std::move(*p);
    p->~T();
    cons_.tail.store(tail + 1, std::memory_order_release);
    return true;
  }

  // Exact only on an endpoint thread; a snapshot elsewhere.
  std::size_t size() const noexcept {
    return prod_.head.load(std::memory_order_acquire) -
           cons_.tail.load(std::memory_order_acquire);
  }
  bool empty() const noexcept { return size() == 0; }
  bool full() const noexcept { return size() == Capacity; }

  // Both endpoints must be idle.
  void clear() noexcept {
    const std::size_t head = prod_.head.load(std::memory_order_relaxed);
    std::size_t tail = cons_.tail.load(std::memory_order_relaxed);
    while (tail != head) at(tail++)->~T();
    cons_.tail.store(head, std::memory_order_relaxed);
    cons_.head_seen = head;
    prod_.tail_seen = head;
  }

 private:
  struct alignas(64) Producer {
    std::atomic<std::size_t> head{0};
    std::size_t tail_seen = 0;
  };
  struct alignas(64) Consumer {
    std::atomic<std::size_t> tail{0};
    std::size_t head_seen = 0;
  };
  struct Cell {
    alignas(T) unsigned char bytes[sizeof(T)];
  };

  T* at(std::size_t n) noexcept {
    return std::launder(reinterpret_cast<T*>(cells_[n & (Capacity - 1)].bytes));
  }

  Producer prod_;
  Consumer cons_;
  Cell cells_[Capacity];
};

}  // namespace lobr
