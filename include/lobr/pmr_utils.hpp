#pragma once
#include <cstddef>
#include <memory_resource>

namespace lobr {

// Pooled storage for one pipeline's book: order index slots and level map
// nodes are recycled here instead of going back to the global heap. What
// the pool itself takes from upstream is tallied for the health report.
// Single-threaded, like the pipeline that owns it.
class PipelinePool {
 public:
  explicit PipelinePool(std::size_t largest_pooled_block = 1 << 16)
      : tally_(std::pmr::new_delete_resource()),
        pool_(std::pmr::pool_options{0, largest_pooled_block}, &tally_) {}

  PipelinePool(const PipelinePool&) = delete;
  PipelinePool& operator=(const PipelinePool&) = delete;

  std::pmr::memory_resource* resource() noexcept { return &pool_; }

  std::size_t bytes_live() const noexcept { return tally_.live; }
  std::size_t bytes_peak() const noexcept { return tally_.peak; }

 private:
  struct Tally : std::pmr::memory_resource {
    explicit Tally(std::pmr::memory_resource* up) : upstream(up) {}

    std::pmr::memory_resource* upstream;
    std::size_t live = 0;
    std::size_t peak = 0;

    void* do_allocate(std::size_t bytes, std::size_t align) override {
      void* p = upstream->allocate(bytes, align);
      live += bytes;
      if (live > peak) peak = live;
      return p;
    }
    void do_deallocate(void* p, std::size_t bytes, std::size_t align) override {
      upstream->deallocate(p, bytes, align);
      live -= bytes;
    }
    bool do_is_equal(const std::pmr::memory_resource& o) const noexcept override {
      return this == &o;
    }
  };

  // Declared first: the pool releases into it on destruction.
  Tally tally_;
  std::pmr::unsynchronized_pool_resource pool_;
};

}  // namespace lobr
