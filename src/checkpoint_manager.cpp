#include "lobr/checkpoint_manager.hpp"

#include <chrono>
#include <exception>

#include "lobr/checkpoint.hpp"
#include "lobr/log.hpp"

namespace lobr {

CheckpointManager::CheckpointManager(const ReplayConfig& cfg,
                                     ICheckpointStore& store)
    : instrument_id_(cfg.instrument_id),
      price_scale_(cfg.price_scale),
      event_interval_(cfg.checkpoint_event_interval),
      time_interval_(cfg.checkpoint_time_interval),
      min_interval_(cfg.min_checkpoint_interval),
      quiet_(cfg.quiet),
      store_(store) {}

CheckpointManager::~CheckpointManager() { stop(); }

void CheckpointManager::start() {
  if (running_.exchange(true)) return;
  last_trigger_ = Clock::now();
  worker_ = std::thread([this] { worker_loop(); });
}

void CheckpointManager::stop() {
  if (!running_.exchange(false)) return;
  {
    std::lock_guard<std::mutex> lock(wake_mtx_);
  }
  wake_cv_.notify_one();
  if (worker_.joinable()) worker_.join();
}

bool CheckpointManager::on_batch(const Replayer& replayer, std::size_t events,
                                 Clock::time_point now) {
  events_since_ += events;
  if (replayer.state() != ReplayerState::LIVE) return false;

  const bool retry = retry_.load(std::memory_order_acquire);
  const bool due = manual_ || retry || events_since_ >= event_interval_ ||
                   now - last_trigger_ >= time_interval_;
  if (!due) return false;
  if (now - last_trigger_ < min_interval_) return false;

  const BookState& book = replayer.book();
  if (book.applied_through() == 0) return false;  // nothing applied yet
  if (book.applied_through() == last_enqueued_seq_ && !retry) {
    events_since_ = 0;
    manual_ = false;
    return false;
  }
  if (in_flight_.load(std::memory_order_acquire) || !running_) {
    ++skipped_in_flight_;
    return false;
  }

  Job job;
  job.state = book.clone(std::pmr::new_delete_resource());
  job.created_at_ns = wall_clock_ns();
  in_flight_.store(true, std::memory_order_release);
  retry_.store(false, std::memory_order_release);
  if (!ring_.try_push(std::move(job))) {
    in_flight_.store(false, std::memory_order_release);
    ++skipped_in_flight_;
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(wake_mtx_);
  }
  wake_cv_.notify_one();

  ++triggered_;
  last_enqueued_seq_ = book.applied_through();
  events_since_ = 0;
  last_trigger_ = now;
  manual_ = false;
  return true;
}

void CheckpointManager::worker_loop() {
  while (true) {
    Job job;
    if (ring_.try_pop(job)) {
      persist(*job.state, job.created_at_ns);
      job.state.reset();
      in_flight_.store(false, std::memory_order_release);
      continue;
    }
    if (!running_.load(std::memory_order_acquire)) break;
    std::unique_lock<std::mutex> lock(wake_mtx_);
    wake_cv_.wait_for(lock, std::chrono::milliseconds(50), [this] {
      return !running_.load(std::memory_order_acquire) || !ring_.empty();
    });
  }
}

bool CheckpointManager::persist(const BookState& state,
                                uint64_t created_at_ns) {
  const auto t0 = std::chrono::steady_clock::now();
  try {
    CheckpointBlob blob =
        encode_checkpoint(state, instrument_id_, price_scale_, created_at_ns);
    store_.write(blob);
    last_bytes_.store(blob.bytes.size(), std::memory_order_relaxed);
    last_written_seq_.store(blob.valid_through, std::memory_order_release);
    written_.fetch_add(1, std::memory_order_relaxed);
    if (!quiet_) {
      const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::steady_clock::now() - t0)
                          .count();
      safe_log("[Checkpoint] ", instrument_id_, " through ",
               blob.valid_through, ": ", state.order_count(), " orders, ",
               blob.bytes.size(), " bytes, ", us / 1000.0, " ms");
    }
    return true;
  } catch (const std::exception& e) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    retry_.store(true, std::memory_order_release);
    safe_err("[Checkpoint] write through ", state.applied_through(),
             " failed: ", e.what());
    return false;
  }
}

bool CheckpointManager::finish(const Replayer& replayer) {
  stop();
  if (replayer.state() != ReplayerState::LIVE) return false;
  const BookState& book = replayer.book();
  if (book.applied_through() == 0) return false;
  if (book.applied_through() == last_checkpoint_seq()) return true;
  ++triggered_;
  return persist(book, wall_clock_ns());
}

CheckpointStats CheckpointManager::stats() const {
  CheckpointStats s;
  s.triggered = triggered_;
  s.written = written_.load(std::memory_order_relaxed);
  s.failed = failed_.load(std::memory_order_relaxed);
  s.skipped_in_flight = skipped_in_flight_;
  s.last_written_seq = last_written_seq_.load(std::memory_order_acquire);
  s.last_bytes = last_bytes_.load(std::memory_order_relaxed);
  return s;
}

}  // namespace lobr
