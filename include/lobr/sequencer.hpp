#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <utility>
#include <variant>
#include <vector>

#include "lobr/config.hpp"
#include "lobr/event.hpp"

namespace lobr {

using Clock = std::chrono::steady_clock;

// A run of admitted events in strictly increasing sequence order, or one
// complete snapshot frame (BEGIN, body, END sharing one sequence number).
struct Batch {
  std::vector<DeltaEvent> events;

  bool is_snapshot() const {
    return !events.empty() &&
           events.front().type == EventType::SNAPSHOT_BEGIN;
  }
  uint64_t first_seq() const { return events.front().seq; }
  uint64_t last_seq() const { return events.back().seq; }
};

enum class GapReason : uint8_t { WINDOW_EXCEEDED, REORDER_TIMEOUT };

struct GapInfo {
  uint64_t expected = 0;  // first missing sequence
  uint64_t observed = 0;  // lowest sequence seen past the hole
  uint64_t size = 0;      // observed - expected
  GapReason reason = GapReason::WINDOW_EXCEEDED;
  Clock::time_point detected_at{};
};

struct SequencerStats {
  uint64_t admitted = 0;
  uint64_t duplicates = 0;         // seq already applied or already held
  uint64_t reordered = 0;          // held, then released in order
  uint64_t batches = 0;
  uint64_t snapshot_frames = 0;
  uint64_t stale_snapshots = 0;    // frame older than what is applied
  uint64_t covered_by_snapshot = 0;
  uint64_t discarded_on_gap = 0;
  uint64_t evicted_unsynced = 0;   // hold buffer overflow before sync
  uint64_t gaps = 0;
  uint64_t max_gap = 0;
  std::map<uint64_t, uint64_t> gaps_by_size;
  std::deque<GapInfo> gap_history;  // newest last, bounded
};

using SequencerOutput = std::variant<Batch, GapInfo>;

// Turns a near-ordered delta stream into gap-free, in-order micro-batches.
//
// The sequencer never calls back into its consumer: batches and gap signals
// are queued and drained with next_output(), so recovery may reset it
// (resync / await_snapshot) while outputs are being consumed.
class Sequencer {
 public:
  explicit Sequencer(const ReplayConfig& cfg);

  void push(const DeltaEvent& e, Clock::time_point now);

  // Enforces the reorder timeout and the batch wait bound.
  void poll(Clock::time_point now);

  // Emits the open live batch regardless of its bounds.
  void flush();

  bool next_output(SequencerOutput& out);
  bool has_output() const { return !ready_.empty(); }

  // Installs a new watermark (checkpoint restored). Undelivered live events
  // are taken back, those below the watermark are dropped and the rest are
  // released in order.
  void resync(uint64_t expected_next, Clock::time_point now);

  // Stops releasing live events until a snapshot frame completes. Undelivered
  // live events are taken back and held.
  void await_snapshot();

  bool synced() const { return synced_; }
  bool in_frame() const { return in_frame_; }
  uint64_t expected_next() const { return expected_next_; }
  std::size_t held() const { return held_.size(); }
  const SequencerStats& stats() const { return stats_; }

 private:
  struct Held {
    DeltaEvent event;
    Clock::time_point arrived;
  };

  void push_frame_event(const DeltaEvent& e, Clock::time_point now);
  void hold(const DeltaEvent& e, Clock::time_point now);
  void admit(const DeltaEvent& e, Clock::time_point now);
  void drain_held(Clock::time_point now);
  void emit_pending();
  void declare_gap(GapReason reason, uint64_t observed, Clock::time_point now);
  void take_back_outputs(Clock::time_point now);
  void restamp_held(Clock::time_point now);

  uint64_t window_;
  Clock::duration reorder_timeout_;
  std::size_t max_batch_events_;
  Clock::duration max_batch_wait_;
  std::size_t gap_history_cap_;

  bool synced_ = false;
  uint64_t expected_next_ = 0;

  // Reorder buffer plus arrival order for the timeout check. Entries in
  // arrivals_ whose sequence has already left held_ are skipped lazily.
  std::map<uint64_t, Held> held_;
  std::deque<std::pair<Clock::time_point, uint64_t>> arrivals_;

  Batch pending_;
  Clock::time_point pending_opened_{};

  bool in_frame_ = false;
  bool frame_stale_ = false;
  uint64_t frame_seq_ = 0;
  Batch frame_;

  std::deque<SequencerOutput> ready_;
  SequencerStats stats_;
};

}  // namespace lobr
