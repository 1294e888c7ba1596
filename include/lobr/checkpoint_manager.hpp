#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "lobr/book_state.hpp"
#include "lobr/checkpoint_store.hpp"
#include "lobr/config.hpp"
#include "lobr/replayer.hpp"
#include "lobr/sequencer.hpp"
#include "lobr/spsc_ring.hpp"

namespace lobr {

struct CheckpointStats {
  uint64_t triggered = 0;
  uint64_t written = 0;
  uint64_t failed = 0;
  uint64_t skipped_in_flight = 0;
  uint64_t last_written_seq = 0;
  uint64_t last_bytes = 0;
};

// Decides when to checkpoint and persists copies off the pipeline thread.
//
// The pipeline thread calls on_batch() after every committed batch. When a
// trigger fires the live book is deep-copied into heap memory (never the
// pipeline's unsynchronized pool) and handed to the worker through a ring;
// encoding, checksumming and store I/O happen on the worker. At most one
// checkpoint is in flight; a trigger that finds one pending is skipped and
// re-evaluated on the next batch.
class CheckpointManager {
 public:
  CheckpointManager(const ReplayConfig& cfg, ICheckpointStore& store);
  ~CheckpointManager();

  CheckpointManager(const CheckpointManager&) = delete;
  CheckpointManager& operator=(const CheckpointManager&) = delete;

  void start();
  // Waits for the in-flight checkpoint, then joins the worker.
  void stop();

  // Returns true if a checkpoint was handed to the worker.
  bool on_batch(const Replayer& replayer, std::size_t events,
                Clock::time_point now);

  // Manual trigger; honoured on the next on_batch() that sees a LIVE book.
  void request() { manual_ = true; }

  // Stops the worker and writes the book synchronously (shutdown).
  // Returns false if the book is not LIVE or the write failed.
  bool finish(const Replayer& replayer);

  bool in_flight() const { return in_flight_.load(std::memory_order_acquire); }
  uint64_t last_checkpoint_seq() const {
    return last_written_seq_.load(std::memory_order_acquire);
  }
  CheckpointStats stats() const;

 private:
  struct Job {
    std::unique_ptr<BookState> state;
    uint64_t created_at_ns = 0;
  };

  void worker_loop();
  bool persist(const BookState& state, uint64_t created_at_ns);

  std::string instrument_id_;
  int64_t price_scale_;
  uint64_t event_interval_;
  Clock::duration time_interval_;
  Clock::duration min_interval_;
  bool quiet_;
  ICheckpointStore& store_;

  // pipeline thread only
  uint64_t events_since_ = 0;
  Clock::time_point last_trigger_{};
  uint64_t last_enqueued_seq_ = 0;
  bool manual_ = false;
  uint64_t triggered_ = 0;
  uint64_t skipped_in_flight_ = 0;

  // shared with the worker
  SpscRing<Job, 4> ring_;
  std::atomic<bool> running_{false};
  std::atomic<bool> in_flight_{false};
  std::atomic<bool> retry_{false};
  std::atomic<uint64_t> written_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<uint64_t> last_written_seq_{0};
  std::atomic<uint64_t> last_bytes_{0};
  std::mutex wake_mtx_;
  std::condition_variable wake_cv_;
  std::thread worker_;
};

}  // namespace lobr
