#include "lobr/replayer.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

#include "lobr/errors.hpp"
#include "lobr/log.hpp"

namespace lobr {

// ---------------- PendingQueue ----------------

void PendingQueue::reset(const BookState* base) {
  base_ = base;
  orders_.clear();
  bid_volumes_.clear();
  ask_volumes_.clear();
  staged_.clear();
  unknown_orders_ = 0;
  duplicate_adds_ = 0;
}

std::optional<OrderEntry> PendingQueue::order(uint64_t id) const {
  auto it = orders_.find(id);
  if (it != orders_.end()) return it->second;
  const OrderEntry* o = base_->find(id);
  if (!o) return std::nullopt;
  return *o;
}

int64_t PendingQueue::volume(Side side, int64_t price) const {
  const auto& overlay = side == Side::BID ? bid_volumes_ : ask_volumes_;
  auto it = overlay.find(price);
  if (it != overlay.end()) return it->second;
  return base_->levels(side).volume_at(price);
}

void PendingQueue::set_volume(Side side, int64_t price, int64_t delta,
                              uint64_t id) {
  const int64_t current = volume(side, price);
  const int64_t next = current + delta;
  if (next < 0) {
    throw ConsistencyError(std::string("order ") + std::to_string(id) +
                           " drives " + to_cstr(side) + " level " +
                           std::to_string(price) + " negative: " +
                           std::to_string(current) + " + " +
                           std::to_string(delta));
  }
  (side == Side::BID ? bid_volumes_ : ask_volumes_)[price] = next;
}

ApplyOutcome PendingQueue::stage(const DeltaEvent& e) {
  switch (e.type) {
    case EventType::ADD: {
      if (order(e.order_id)) {
        ++duplicate_adds_;
        return ApplyOutcome::DUPLICATE_ADD;
      }
      require_positive_size(e.order_id, e.size);
      set_volume(e.side, e.price, e.size, e.order_id);
      orders_[e.order_id] = OrderEntry{e.side, e.price, e.size, e.event_time_ns};
      break;
    }
    case EventType::UPDATE: {
      auto o = order(e.order_id);
      if (!o) {
        ++unknown_orders_;
        return ApplyOutcome::UNKNOWN_ORDER;
      }
      require_positive_size(e.order_id, e.size);
      set_volume(o->side, o->price, -o->size, e.order_id);
      set_volume(o->side, e.price, e.size, e.order_id);
      o->price = e.price;
      o->size = e.size;
      orders_[e.order_id] = *o;
      break;
    }
    case EventType::CANCEL: {
      auto o = order(e.order_id);
      if (!o) {
        ++unknown_orders_;
        return ApplyOutcome::UNKNOWN_ORDER;
      }
      set_volume(o->side, o->price, -o->size, e.order_id);
      orders_[e.order_id] = std::nullopt;
      break;
    }
    case EventType::SNAPSHOT_BEGIN:
    case EventType::SNAPSHOT_END:
      throw std::logic_error("snapshot marker staged as a live event");
  }
  staged_.push_back(e);
  return ApplyOutcome::APPLIED;
}

// ---------------- drift ----------------

namespace {

void compare_side(const SideLevels& before, const SideLevels& after,
                  DriftReport& r) {
  std::map<int64_t, int64_t> old_levels;
  for (const auto& lv : before.near_levels()) old_levels[lv.price] = lv.volume;
  for (const auto& lv : after.near_levels()) {
    auto it = old_levels.find(lv.price);
    if (it == old_levels.end()) {
      ++r.missing_levels;
      r.max_abs_deviation = std::max(r.max_abs_deviation, lv.volume);
      continue;
    }
    if (it->second != lv.volume) {
      ++r.volume_mismatches;
      const int64_t d = it->second - lv.volume;
      r.max_abs_deviation = std::max(r.max_abs_deviation, d < 0 ? -d : d);
    }
    old_levels.erase(it);
  }
  for (const auto& kv : old_levels) {
    ++r.missing_levels;
    r.max_abs_deviation = std::max(r.max_abs_deviation, kv.second);
  }
}

}  // namespace

DriftReport compare_near_levels(const BookState& before,
                                const BookState& after) {
  DriftReport r;
  r.through = after.applied_through();
  compare_side(before.bids(), after.bids(), r);
  compare_side(before.asks(), after.asks(), r);
  return r;
}

// ---------------- Replayer ----------------

Replayer::Replayer(const ReplayConfig& cfg, std::pmr::memory_resource* mr)
    : top_n_(cfg.top_n), index_capacity_(cfg.index_capacity), mr_(mr) {
  book_ = fresh_state();
}

std::unique_ptr<BookState> Replayer::fresh_state() const {
  return std::make_unique<BookState>(top_n_, mr_, index_capacity_);
}

void Replayer::halt(const std::string& why) {
  state_ = ReplayerState::HALTED;
  ++stats_.fatal_errors;
  last_fatal_ = why;
  safe_err("[Replayer] HALTED at applied_through=", book_->applied_through(),
           ": ", why);
}

void Replayer::install(std::unique_ptr<BookState> state) {
  if (!state) throw std::invalid_argument("install: null book state");
  book_ = std::move(state);
  state_ = ReplayerState::LIVE;
  installed_once_ = true;
}

void Replayer::begin_rebuild() { state_ = ReplayerState::SNAPSHOT_REBUILD; }

BatchResult Replayer::apply_batch(const Batch& batch) {
  if (batch.events.empty()) return BatchResult::APPLIED;
  if (state_ == ReplayerState::HALTED) {
    stats_.rejected_halted += batch.events.size();
    return BatchResult::IGNORED;
  }
  if (batch.is_snapshot()) return apply_frame(batch);
  if (state_ == ReplayerState::SNAPSHOT_REBUILD) {
    stats_.dropped_rebuilding += batch.events.size();
    return BatchResult::IGNORED;
  }
  return apply_live(batch);
}

BatchResult Replayer::apply_live(const Batch& batch) {
  pending_.reset(book_.get());
  uint64_t next = book_->expected_next();
  uint64_t skipped = 0;

  for (const auto& e : batch.events) {
    if (e.seq < next) {
      ++skipped;
      continue;
    }
    if (e.seq > next) {
      ++stats_.gaps_rejected;
      safe_err("[Replayer] batch rejected: expected ", next, " got ", e.seq);
      return BatchResult::GAP;
    }
    if (is_snapshot_marker(e.type)) {
      halt("snapshot marker " + e.to_string() + " inside a live batch");
      return BatchResult::FATAL;
    }
    try {
      pending_.stage(e);
    } catch (const ConsistencyError& ex) {
      halt(std::string(ex.what()) + " at seq " + std::to_string(e.seq));
      return BatchResult::FATAL;
    }
    next = e.seq + 1;
  }

  try {
    for (const auto& e : pending_.staged()) {
      switch (e.type) {
        case EventType::ADD:
          book_->add_order(e.order_id, e.side, e.price, e.size,
                           e.event_time_ns);
          break;
        case EventType::UPDATE:
          book_->update_order(e.order_id, e.price, e.size);
          break;
        case EventType::CANCEL:
          book_->cancel_order(e.order_id);
          break;
        default:
          break;
      }
    }
  } catch (const ConsistencyError& ex) {
    // Validation and commit disagree; the book can no longer be trusted.
    halt(std::string("commit failed after validation: ") + ex.what());
    return BatchResult::FATAL;
  }

  if (next > book_->expected_next()) book_->mark_applied(next - 1);
  stats_.duplicates_skipped += skipped;
  stats_.unknown_orders += pending_.unknown_orders();
  stats_.duplicate_adds += pending_.duplicate_adds();
  stats_.events_applied += pending_.staged().size();
  ++stats_.batches_committed;
  return BatchResult::APPLIED;
}

BatchResult Replayer::apply_frame(const Batch& batch) {
  const uint64_t through = batch.first_seq();
  if (state_ == ReplayerState::LIVE && through < book_->applied_through()) {
    ++stats_.stale_snapshots;
    safe_err("[Replayer] ignoring stale snapshot through ", through,
             " (applied_through=", book_->applied_through(), ")");
    return BatchResult::IGNORED;
  }

  // The old book stays installed until END; a frame arrives whole.
  std::unique_ptr<BookState> fresh;
  uint64_t duplicate_adds = 0;

  for (const auto& e : batch.events) {
    switch (e.type) {
      case EventType::SNAPSHOT_BEGIN:
        if (fresh) safe_err("[Replayer] snapshot through ", through, " restarted");
        fresh = fresh_state();
        duplicate_adds = 0;
        break;
      case EventType::SNAPSHOT_END: {
        if (!fresh) break;
        fresh->mark_applied(e.seq);
        if (installed_once_) {
          last_drift_ = compare_near_levels(*book_, *fresh);
          ++stats_.drift_checks;
          if (!last_drift_.clean()) {
            ++stats_.drift_detected;
            safe_err("[Replayer] drift at ", e.seq,
                     ": missing=", last_drift_.missing_levels,
                     " mismatched=", last_drift_.volume_mismatches,
                     " max_dev=", last_drift_.max_abs_deviation);
          }
        }
        book_ = std::move(fresh);
        state_ = ReplayerState::LIVE;
        installed_once_ = true;
        stats_.duplicate_adds += duplicate_adds;
        ++stats_.snapshots_installed;
        return BatchResult::APPLIED;
      }
      default: {
        if (!fresh) break;
        try {
          ApplyOutcome out = ApplyOutcome::APPLIED;
          if (e.type == EventType::ADD)
            out = fresh->add_order(e.order_id, e.side, e.price, e.size,
                                   e.event_time_ns);
          else if (e.type == EventType::UPDATE)
            out = fresh->update_order(e.order_id, e.price, e.size);
          else
            out = fresh->cancel_order(e.order_id);
          if (out == ApplyOutcome::DUPLICATE_ADD) ++duplicate_adds;
        } catch (const ConsistencyError& ex) {
          halt(std::string("snapshot through ") + std::to_string(through) +
               ": " + ex.what());
          return BatchResult::FATAL;
        }
        break;
      }
    }
  }

  // The sequencer only emits complete frames; anything else is unusable.
  ++stats_.incomplete_frames;
  safe_err("[Replayer] snapshot through ", through, " has no END, discarded");
  return BatchResult::IGNORED;
}

}  // namespace lobr
