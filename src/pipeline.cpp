#include "lobr/pipeline.hpp"

#include <exception>
#include <sstream>
#include <variant>

#include "lobr/errors.hpp"
#include "lobr/log.hpp"

namespace lobr {

namespace {
const ReplayConfig& validated(const ReplayConfig& cfg) {
  cfg.validate();
  return cfg;
}
}  // namespace

Pipeline::Pipeline(const ReplayConfig& cfg, FeedSource& feed,
                   ICheckpointStore& store,
                   RecoveryCoordinator::Sleeper sleeper)
    : cfg_(validated(cfg)),
      pool_(cfg.pool_block_bytes),
      feed_(feed),
      sequencer_(cfg),
      replayer_(cfg, pool_.resource()),
      checkpoints_(cfg, store),
      recovery_(cfg, store, feed, std::move(sleeper)) {
  publish();
}

Pipeline::~Pipeline() {
  // The worker holds no pool memory; stopping it is enough.
  checkpoints_.stop();
}

void Pipeline::start() {
  if (started_) return;
  started_ = true;
  checkpoints_.start();
  recover("startup", Clock::now());
}

void Pipeline::recover(const std::string& reason, Clock::time_point now) {
  try {
    recovery_.recover(replayer_, sequencer_, reason, now);
  } catch (const RecoveryError& e) {
    recovery_error_ = e.what();
    stop_.store(true, std::memory_order_release);
    safe_err("[Pipeline] ", cfg_.instrument_id, " recovery failed: ", e.what());
    throw;
  }
  publish();
}

void Pipeline::publish() {
  auto v = std::make_shared<const BookView>(
      make_view(replayer_.book(), cfg_.instrument_id, cfg_.price_scale));
  std::lock_guard<std::mutex> lock(view_mtx_);
  view_ = std::move(v);
}

std::shared_ptr<const BookView> Pipeline::view() const {
  std::lock_guard<std::mutex> lock(view_mtx_);
  return view_;
}

DeepBookView Pipeline::deep_view() const {
  return make_deep_view(replayer_.book(), cfg_.price_scale);
}

void Pipeline::on_event(const DeltaEvent& e, Clock::time_point now) {
  sequencer_.push(e, now);
  drain(now);
}

void Pipeline::poll(Clock::time_point now) {
  sequencer_.poll(now);
  drain(now);
}

void Pipeline::drain(Clock::time_point now) {
  SequencerOutput out;
  while (sequencer_.next_output(out)) {
    if (const auto* gap = std::get_if<GapInfo>(&out)) {
      recover("sequence gap at " + std::to_string(gap->expected) + " (saw " +
                  std::to_string(gap->observed) + ")",
              now);
      continue;
    }

    const Batch& batch = std::get<Batch>(out);
    switch (replayer_.apply_batch(batch)) {
      case BatchResult::APPLIED:
        publish();
        checkpoints_.on_batch(replayer_, batch.events.size(), now);
        break;
      case BatchResult::IGNORED:
        break;
      case BatchResult::GAP:
        recover("batch does not continue at " +
                    std::to_string(replayer_.expected_next()),
                now);
        break;
      case BatchResult::FATAL:
        recover("consistency violation: " + replayer_.last_fatal(), now);
        break;
    }
  }
}

uint64_t Pipeline::run(uint64_t max_events) {
  if (!started_) start();
  uint64_t consumed = 0;
  const auto wait = cfg_.max_batch_wait.count() > 0
                        ? cfg_.max_batch_wait
                        : std::chrono::milliseconds(1);

  while (!stop_.load(std::memory_order_acquire)) {
    auto e = feed_.next(wait);
    const auto now = Clock::now();
    if (e) {
      sequencer_.push(*e, now);
      ++consumed;
    }
    sequencer_.poll(now);
    drain(now);

    if (max_events > 0 && consumed >= max_events) break;
    // Held events behind a hole still get their reorder timeout.
    if (!e && feed_.exhausted() && sequencer_.held() == 0 &&
        !sequencer_.has_output())
      break;
  }

  sequencer_.flush();
  drain(Clock::now());
  return consumed;
}

void Pipeline::shutdown() {
  if (shut_down_) return;
  shut_down_ = true;
  if (recovery_error_.empty()) {
    sequencer_.flush();
    drain(Clock::now());
  }
  checkpoints_.finish(replayer_);
  if (!cfg_.quiet)
    safe_log("[Pipeline] ", cfg_.instrument_id, " stopped at ",
             replayer_.applied_through(), " (",
             to_cstr(replayer_.state()), ")");
}

PipelineHealth Pipeline::health() const {
  PipelineHealth h;
  h.instrument_id = cfg_.instrument_id;
  h.state = replayer_.state();
  h.applied_through = replayer_.applied_through();
  h.expected_next = replayer_.expected_next();
  h.last_checkpoint_seq = checkpoints_.last_checkpoint_seq();
  h.held = sequencer_.held();
  h.orders = replayer_.book().order_count();
  h.pool_bytes_live = pool_.bytes_live();
  h.pool_bytes_peak = pool_.bytes_peak();
  h.sequencer = sequencer_.stats();
  h.replayer = replayer_.stats();
  h.checkpoint = checkpoints_.stats();
  h.recovery = recovery_.stats();
  h.last_drift = replayer_.last_drift();
  h.last_fatal = replayer_.last_fatal();
  h.recovery_error = recovery_error_;
  return h;
}

std::string PipelineHealth::to_string() const {
  std::ostringstream oss;
  oss << "Replay Health: " << instrument_id << "\n"
      << "---------------------------\n"
      << "State:             " << to_cstr(state) << "\n"
      << "Applied through:   " << applied_through << "\n"
      << "Expected next:     " << expected_next << "\n"
      << "Last checkpoint:   " << last_checkpoint_seq << "\n"
      << "Resting orders:    " << orders << "\n"
      << "Held (reorder):    " << held << "\n"
      << "Pool bytes:        live=" << pool_bytes_live
      << " peak=" << pool_bytes_peak << "\n"
      << "Sequencer:         admitted=" << sequencer.admitted
      << " reordered=" << sequencer.reordered
      << " duplicates=" << sequencer.duplicates
      << " batches=" << sequencer.batches
      << " frames=" << sequencer.snapshot_frames << "\n"
      << "Gaps:              total=" << sequencer.gaps
      << " max=" << sequencer.max_gap
      << " discarded=" << sequencer.discarded_on_gap << "\n"
      << "Replayer:          applied=" << replayer.events_applied
      << " unknown=" << replayer.unknown_orders
      << " dup_adds=" << replayer.duplicate_adds
      << " skipped=" << replayer.duplicates_skipped
      << " fatal=" << replayer.fatal_errors
      << " snapshots=" << replayer.snapshots_installed << "\n"
      << "Drift:             checks=" << replayer.drift_checks
      << " detected=" << replayer.drift_detected
      << " last_max_dev=" << last_drift.max_abs_deviation << "\n"
      << "Checkpoints:       written=" << checkpoint.written
      << " failed=" << checkpoint.failed
      << " skipped=" << checkpoint.skipped_in_flight << "\n"
      << "Recovery:          runs=" << recovery.runs
      << " resumes=" << recovery.resumes
      << " snapshots=" << recovery.snapshots_requested
      << " rejected_ckpt=" << recovery.checkpoints_rejected
      << " feed_failures=" << recovery.feed_failures << "\n";
  if (!last_fatal.empty()) oss << "Last fatal:        " << last_fatal << "\n";
  if (!recovery_error.empty())
    oss << "Recovery error:    " << recovery_error << "\n";
  oss << "---------------------------\n";
  return oss.str();
}

}  // namespace lobr
