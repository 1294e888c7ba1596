#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "lobr/checkpoint.hpp"
#include "lobr/checkpoint_store.hpp"
#include "lobr/config.hpp"
#include "lobr/feed_source.hpp"
#include "lobr/replayer.hpp"
#include "lobr/sequencer.hpp"

namespace lobr {

enum class RecoveryPath : uint8_t { RESUMED, SNAPSHOT };

struct RecoveryStats {
  uint64_t runs = 0;
  uint64_t checkpoints_loaded = 0;
  uint64_t checkpoints_rejected = 0;  // corrupt or inconsistent, skipped
  uint64_t kept_live_state = 0;
  uint64_t resumes = 0;
  uint64_t resume_refused = 0;
  uint64_t snapshots_requested = 0;
  uint64_t escalations = 0;  // same resume point twice -> snapshot
  uint64_t feed_failures = 0;
  uint64_t last_restored_seq = 0;
};

// Brings the replayer and sequencer back to a consistent position after
// startup, a sequence gap or a fatal consistency error:
//   1. newest checkpoint that verifies (older ones are tried in turn)
//   2. install it and resync the sequencer just after it
//   3. ask the feed to resume from there
//   4. otherwise (no checkpoint, resume refused) request a snapshot and
//      leave both in rebuild mode
// A LIVE book at least as new as the best checkpoint is kept as is. Feed
// calls are retried with exponential backoff up to recovery_max_backoff;
// exhaustion throws RecoveryError. A failed load never touches the installed
// book.
class RecoveryCoordinator {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  RecoveryCoordinator(const ReplayConfig& cfg, ICheckpointStore& store,
                      FeedSource& feed, Sleeper sleeper = {});

  RecoveryPath recover(Replayer& replayer, Sequencer& sequencer,
                       const std::string& reason, Clock::time_point now);

  // Step 1 alone. nullopt if no checkpoint verifies.
  std::optional<RestoredCheckpoint> load_latest(std::pmr::memory_resource* mr);

  const RecoveryStats& stats() const { return stats_; }

 private:
  template <typename Fn>
  auto with_retry(const char* what, Fn&& fn) -> decltype(fn());

  std::string instrument_id_;
  std::size_t top_n_;
  std::size_t index_capacity_;
  int max_retries_;
  std::chrono::milliseconds backoff_;
  std::chrono::milliseconds max_backoff_;
  bool quiet_;
  ICheckpointStore& store_;
  FeedSource& feed_;
  Sleeper sleeper_;
  uint64_t last_resume_from_ = 0;
  RecoveryStats stats_;
};

}  // namespace lobr
