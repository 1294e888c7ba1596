#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lobr/book_state.hpp"
#include "lobr/config.hpp"
#include "lobr/sequencer.hpp"

namespace lobr {

enum class ReplayerState : uint8_t { LIVE, SNAPSHOT_REBUILD, HALTED };

inline const char* to_cstr(ReplayerState s) {
  switch (s) {
    case ReplayerState::LIVE:
      return "LIVE";
    case ReplayerState::SNAPSHOT_REBUILD:
      return "SNAPSHOT_REBUILD";
    case ReplayerState::HALTED:
      return "HALTED";
  }
  return "?";
}

enum class BatchResult : uint8_t {
  APPLIED,   // committed (possibly only skips and counted anomalies)
  IGNORED,   // halted or rebuilding, nothing touched
  GAP,       // live event ahead of expected_next, nothing touched
  FATAL      // consistency violation, nothing touched, now HALTED
};

struct ReplayerStats {
  uint64_t events_applied = 0;
  uint64_t batches_committed = 0;
  uint64_t unknown_orders = 0;
  uint64_t duplicate_adds = 0;
  uint64_t duplicates_skipped = 0;   // seq < expected_next
  uint64_t rejected_halted = 0;
  uint64_t dropped_rebuilding = 0;
  uint64_t gaps_rejected = 0;
  uint64_t fatal_errors = 0;
  uint64_t snapshots_installed = 0;
  uint64_t stale_snapshots = 0;
  uint64_t incomplete_frames = 0;
  uint64_t drift_checks = 0;
  uint64_t drift_detected = 0;
};

// Near-tier comparison between the state a snapshot replaces and the one it
// installs.
struct DriftReport {
  uint64_t through = 0;
  std::size_t missing_levels = 0;     // present on one side only
  std::size_t volume_mismatches = 0;  // same price, different volume
  int64_t max_abs_deviation = 0;

  bool clean() const { return missing_levels == 0 && volume_mismatches == 0; }
};

DriftReport compare_near_levels(const BookState& before,
                                const BookState& after);

// Staged batch on top of an unmodified BookState. Every event is validated
// against the base plus what earlier staged events did to the orders and
// levels they touched; only a fully validated batch is committed.
class PendingQueue {
 public:
  void reset(const BookState* base);

  // Throws ConsistencyError if the event would drive a level negative.
  ApplyOutcome stage(const DeltaEvent& e);

  const std::vector<DeltaEvent>& staged() const { return staged_; }
  uint64_t unknown_orders() const { return unknown_orders_; }
  uint64_t duplicate_adds() const { return duplicate_adds_; }

 private:
  std::optional<OrderEntry> order(uint64_t id) const;
  int64_t volume(Side side, int64_t price) const;
  void set_volume(Side side, int64_t price, int64_t delta, uint64_t id);

  const BookState* base_ = nullptr;
  // nullopt marks an order cancelled inside the batch.
  std::unordered_map<uint64_t, std::optional<OrderEntry>> orders_;
  std::unordered_map<int64_t, int64_t> bid_volumes_;
  std::unordered_map<int64_t, int64_t> ask_volumes_;
  std::vector<DeltaEvent> staged_;
  uint64_t unknown_orders_ = 0;
  uint64_t duplicate_adds_ = 0;
};

// Applies sequenced batches to the book. Single-threaded; readers on other
// threads only ever see views published after apply_batch() returns.
class Replayer {
 public:
  Replayer(const ReplayConfig& cfg, std::pmr::memory_resource* mr);

  BatchResult apply_batch(const Batch& batch);

  // Replaces the book wholesale (checkpoint restore) and goes LIVE.
  void install(std::unique_ptr<BookState> state);

  // Waits for a snapshot frame. The current book stays readable.
  void begin_rebuild();

  ReplayerState state() const { return state_; }
  const BookState& book() const { return *book_; }
  uint64_t applied_through() const { return book_->applied_through(); }
  uint64_t expected_next() const { return book_->expected_next(); }
  const std::string& last_fatal() const { return last_fatal_; }
  const ReplayerStats& stats() const { return stats_; }
  const DriftReport& last_drift() const { return last_drift_; }
  std::pmr::memory_resource* resource() const { return mr_; }

 private:
  BatchResult apply_live(const Batch& batch);
  BatchResult apply_frame(const Batch& batch);
  void halt(const std::string& why);
  std::unique_ptr<BookState> fresh_state() const;

  std::size_t top_n_;
  std::size_t index_capacity_;
  std::pmr::memory_resource* mr_;
  std::unique_ptr<BookState> book_;
  ReplayerState state_ = ReplayerState::SNAPSHOT_REBUILD;
  bool installed_once_ = false;
  PendingQueue pending_;
  ReplayerStats stats_;
  DriftReport last_drift_;
  std::string last_fatal_;
};

}  // namespace lobr
