#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "lobr/event.hpp"

namespace lobr {

// Where deltas come from. resume() and request_snapshot() may throw
// FeedError for transient failures; recovery retries those with backoff.
class FeedSource {
 public:
  virtual ~FeedSource() = default;

  // Restarts the live stream at seq. Returns false if the source cannot
  // serve that position (no longer retained, not supported).
  virtual bool resume(uint64_t seq) = 0;

  // Queues one full snapshot frame ahead of further live events.
  virtual void request_snapshot() = 0;

  // Next event, waiting at most `timeout`. nullopt on timeout or when the
  // source is exhausted.
  virtual std::optional<DeltaEvent> next(std::chrono::milliseconds timeout) = 0;

  // A finite source has delivered everything it will ever deliver.
  virtual bool exhausted() const = 0;
};

struct FeedStats {
  uint64_t delivered = 0;
  uint64_t resumes = 0;
  uint64_t snapshots = 0;
  uint64_t injected_failures = 0;
};

// Replays a recorded stream from memory. `arrivals` is what the live stream
// delivers, in delivery order (it may be reordered, duplicated or have
// holes). `history` is the complete record the source can resume from and
// snapshot; it defaults to the arrivals sorted by sequence. Never blocks.
class VectorFeedSource : public FeedSource {
 public:
  explicit VectorFeedSource(std::vector<DeltaEvent> arrivals,
                            std::vector<DeltaEvent> history = {},
                            std::size_t top_n = 20);

  bool resume(uint64_t seq) override;
  void request_snapshot() override;
  std::optional<DeltaEvent> next(std::chrono::milliseconds timeout) override;
  bool exhausted() const override { return queue_.empty(); }

  // Positions before this sequence can no longer be resumed.
  void set_retained_from(uint64_t seq) { retained_from_ = seq; }
  void set_resume_supported(bool on) { resume_supported_ = on; }
  // The next n resume / snapshot calls throw FeedError.
  void fail_next_requests(int n) { failures_left_ = n; }

  uint64_t high_watermark() const { return high_watermark_; }
  const FeedStats& stats() const { return stats_; }

 private:
  void maybe_fail(const char* what);

  std::deque<DeltaEvent> queue_;
  std::vector<DeltaEvent> history_;
  std::size_t top_n_;
  uint64_t high_watermark_ = 0;
  uint64_t retained_from_ = 0;
  bool resume_supported_ = true;
  int failures_left_ = 0;
  FeedStats stats_;
};

}  // namespace lobr
