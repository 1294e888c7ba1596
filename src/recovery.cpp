#include "lobr/recovery.hpp"

#include <thread>
#include <utility>

#include "lobr/errors.hpp"
#include "lobr/log.hpp"

namespace lobr {

RecoveryCoordinator::RecoveryCoordinator(const ReplayConfig& cfg,
                                         ICheckpointStore& store,
                                         FeedSource& feed, Sleeper sleeper)
    : instrument_id_(cfg.instrument_id),
      top_n_(cfg.top_n),
      index_capacity_(cfg.index_capacity),
      max_retries_(cfg.recovery_max_retries),
      backoff_(cfg.recovery_backoff),
      max_backoff_(cfg.recovery_max_backoff),
      quiet_(cfg.quiet),
      store_(store),
      feed_(feed),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_)
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

template <typename Fn>
auto RecoveryCoordinator::with_retry(const char* what, Fn&& fn)
    -> decltype(fn()) {
  std::chrono::milliseconds delay = backoff_;
  std::string last_error;
  for (int attempt = 0; attempt <= max_retries_; ++attempt) {
    if (attempt > 0) {
      sleeper_(delay);
      delay = delay > max_backoff_ / 2 ? max_backoff_ : delay * 2;
    }
    try {
      return fn();
    } catch (const FeedError& e) {
      ++stats_.feed_failures;
      last_error = e.what();
      safe_err("[Recovery] ", what, " attempt ", attempt + 1, "/",
               max_retries_ + 1, " failed: ", last_error);
    }
  }
  throw RecoveryError(std::string(what) + " failed after " +
                      std::to_string(max_retries_ + 1) +
                      " attempts: " + last_error);
}

std::optional<RestoredCheckpoint> RecoveryCoordinator::load_latest(
    std::pmr::memory_resource* mr) {
  std::vector<uint64_t> seqs;
  try {
    seqs = store_.list(instrument_id_);
  } catch (const StorageError& e) {
    safe_err("[Recovery] cannot list checkpoints: ", e.what());
    return std::nullopt;
  }

  for (uint64_t seq : seqs) {
    try {
      std::string record = store_.read(instrument_id_, seq);
      RestoredCheckpoint cp =
          decode_checkpoint(record, instrument_id_, top_n_, mr, index_capacity_);
      ++stats_.checkpoints_loaded;
      return cp;
    } catch (const CheckpointError& e) {
      ++stats_.checkpoints_rejected;
      safe_err("[Recovery] skipping checkpoint ", seq, ": ", e.what());
    } catch (const StorageError& e) {
      ++stats_.checkpoints_rejected;
      safe_err("[Recovery] cannot read checkpoint ", seq, ": ", e.what());
    }
  }
  return std::nullopt;
}

RecoveryPath RecoveryCoordinator::recover(Replayer& replayer,
                                          Sequencer& sequencer,
                                          const std::string& reason,
                                          Clock::time_point now) {
  ++stats_.runs;
  if (!quiet_)
    safe_log("[Recovery] ", instrument_id_, ": ", reason, " (state=",
             to_cstr(replayer.state()), ", applied_through=",
             replayer.applied_through(), ")");

  auto cp = load_latest(replayer.resource());
  const bool keep_live = replayer.state() == ReplayerState::LIVE &&
                         (!cp || cp->valid_through <= replayer.applied_through());

  if (keep_live) {
    ++stats_.kept_live_state;
    sequencer.resync(replayer.expected_next(), now);
  } else if (cp) {
    stats_.last_restored_seq = cp->valid_through;
    replayer.install(std::move(cp->state));
    sequencer.resync(replayer.expected_next(), now);
    if (!quiet_)
      safe_log("[Recovery] restored checkpoint through ",
               stats_.last_restored_seq);
  }

  if (keep_live || cp) {
    const uint64_t from = replayer.expected_next();
    if (from == last_resume_from_) {
      // Resuming here already failed to get past the hole.
      ++stats_.escalations;
      safe_err("[Recovery] no progress since resume at ", from,
               ", requesting snapshot");
    } else if (with_retry("resume", [&] { return feed_.resume(from); })) {
      ++stats_.resumes;
      last_resume_from_ = from;
      return RecoveryPath::RESUMED;
    } else {
      ++stats_.resume_refused;
    }
  }

  replayer.begin_rebuild();
  sequencer.await_snapshot();
  with_retry("snapshot request", [&] { feed_.request_snapshot(); });
  ++stats_.snapshots_requested;
  last_resume_from_ = 0;
  return RecoveryPath::SNAPSHOT;
}

}  // namespace lobr
