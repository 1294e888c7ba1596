#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "lobr/book_view.hpp"
#include "lobr/checkpoint_manager.hpp"
#include "lobr/checkpoint_store.hpp"
#include "lobr/config.hpp"
#include "lobr/feed_source.hpp"
#include "lobr/pmr_utils.hpp"
#include "lobr/recovery.hpp"
#include "lobr/replayer.hpp"
#include "lobr/sequencer.hpp"

namespace lobr {

struct PipelineHealth {
  std::string instrument_id;
  ReplayerState state = ReplayerState::SNAPSHOT_REBUILD;
  uint64_t applied_through = 0;
  uint64_t expected_next = 0;
  uint64_t last_checkpoint_seq = 0;
  std::size_t held = 0;
  std::size_t orders = 0;
  std::size_t pool_bytes_live = 0;
  std::size_t pool_bytes_peak = 0;
  SequencerStats sequencer;
  ReplayerStats replayer;
  CheckpointStats checkpoint;
  RecoveryStats recovery;
  DriftReport last_drift;
  std::string last_fatal;
  std::string recovery_error;  // non-empty once recovery gave up

  std::string to_string() const;
};

// One instrument's replay pipeline: sequencer -> replayer -> checkpoints,
// with recovery on startup, gaps and fatal errors. Everything except view()
// runs on a single thread; the checkpoint worker only sees copies.
class Pipeline {
 public:
  Pipeline(const ReplayConfig& cfg, FeedSource& feed, ICheckpointStore& store,
           RecoveryCoordinator::Sleeper sleeper = {});
  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Starts the checkpoint worker and runs startup recovery.
  void start();

  // Pulls from the feed until it is exhausted and nothing is held, until
  // max_events were consumed (0 = no bound) or request_stop().
  uint64_t run(uint64_t max_events = 0);

  // Step-wise driving with an explicit clock.
  void on_event(const DeltaEvent& e, Clock::time_point now);
  void poll(Clock::time_point now);

  void request_stop() { stop_.store(true, std::memory_order_release); }
  void request_checkpoint() { checkpoints_.request(); }

  // Flushes the open batch, applies it and writes a final checkpoint.
  void shutdown();

  // Latest committed top-of-book; callable from any thread.
  std::shared_ptr<const BookView> view() const;
  // Full ladder, pipeline thread only.
  DeepBookView deep_view() const;

  PipelineHealth health() const;
  const Replayer& replayer() const { return replayer_; }
  const Sequencer& sequencer() const { return sequencer_; }
  bool failed() const { return !recovery_error_.empty(); }

 private:
  void drain(Clock::time_point now);
  void recover(const std::string& reason, Clock::time_point now);
  void publish();

  ReplayConfig cfg_;
  PipelinePool pool_;
  FeedSource& feed_;
  Sequencer sequencer_;
  Replayer replayer_;
  CheckpointManager checkpoints_;
  RecoveryCoordinator recovery_;

  mutable std::mutex view_mtx_;
  std::shared_ptr<const BookView> view_;

  std::atomic<bool> stop_{false};
  bool started_ = false;
  bool shut_down_ = false;
  std::string recovery_error_;
};

}  // namespace lobr
