#include "lobr/sequencer.hpp"

#include "lobr/log.hpp"

namespace lobr {

Sequencer::Sequencer(const ReplayConfig& cfg)
    : window_(cfg.lookahead_window),
      reorder_timeout_(cfg.reorder_timeout),
      max_batch_events_(cfg.max_batch_events),
      max_batch_wait_(cfg.max_batch_wait),
      gap_history_cap_(cfg.gap_history) {}

void Sequencer::push(const DeltaEvent& e, Clock::time_point now) {
  if (is_snapshot_marker(e.type) || (in_frame_ && e.seq == frame_seq_)) {
    push_frame_event(e, now);
    return;
  }
  if (in_frame_ || !synced_) {
    hold(e, now);
    return;
  }

  if (e.seq < expected_next_) {
    ++stats_.duplicates;
  } else if (e.seq == expected_next_) {
    admit(e, now);
    drain_held(now);
  } else if (e.seq - expected_next_ <= window_) {
    hold(e, now);
  } else {
    declare_gap(GapReason::WINDOW_EXCEEDED, e.seq, now);
    // Kept for after recovery; the reorder buffer itself was discarded.
    hold(e, now);
  }

  if (!pending_.events.empty() && now - pending_opened_ >= max_batch_wait_)
    emit_pending();
}

void Sequencer::push_frame_event(const DeltaEvent& e, Clock::time_point now) {
  if (e.type == EventType::SNAPSHOT_BEGIN) {
    if (in_frame_) {
      safe_err("[Sequencer] snapshot frame ", frame_seq_,
               " abandoned, restarted by frame ", e.seq);
    }
    // Frames always start a new batch.
    emit_pending();
    in_frame_ = true;
    frame_seq_ = e.seq;
    frame_stale_ = synced_ && e.seq + 1 < expected_next_;
    frame_ = Batch{};
    frame_.events.push_back(e);
    return;
  }

  if (!in_frame_ || e.seq != frame_seq_) {
    ++stats_.duplicates;  // marker or body without an open frame
    return;
  }

  frame_.events.push_back(e);
  if (e.type != EventType::SNAPSHOT_END) return;

  in_frame_ = false;
  if (frame_stale_) {
    ++stats_.stale_snapshots;
    safe_err("[Sequencer] dropping stale snapshot through ", frame_seq_,
             " (expected_next=", expected_next_, ")");
    frame_ = Batch{};
    return;
  }

  ++stats_.snapshot_frames;
  ++stats_.batches;
  ready_.emplace_back(std::move(frame_));
  frame_ = Batch{};

  synced_ = true;
  expected_next_ = frame_seq_ + 1;
  while (!held_.empty() && held_.begin()->first <= frame_seq_) {
    held_.erase(held_.begin());
    ++stats_.covered_by_snapshot;
  }
  restamp_held(now);
  drain_held(now);
  if (!held_.empty() && held_.begin()->first - expected_next_ > window_)
    declare_gap(GapReason::WINDOW_EXCEEDED, held_.begin()->first, now);
}

void Sequencer::hold(const DeltaEvent& e, Clock::time_point now) {
  auto inserted = held_.emplace(e.seq, Held{e, now});
  if (!inserted.second) {
    // Same sequence already waiting: first arrival wins.
    ++stats_.duplicates;
    return;
  }
  arrivals_.emplace_back(now, e.seq);

  if (held_.size() > window_) {
    // Only reachable before sync or inside a frame; in live mode the
    // window check keeps the buffer within bounds.
    held_.erase(held_.begin());
    ++stats_.evicted_unsynced;
  }
  if (arrivals_.size() > 2 * window_ + 16) restamp_held(now);
}

void Sequencer::admit(const DeltaEvent& e, Clock::time_point now) {
  if (pending_.events.empty()) pending_opened_ = now;
  pending_.events.push_back(e);
  ++stats_.admitted;
  expected_next_ = e.seq + 1;
  if (pending_.events.size() >= max_batch_events_) emit_pending();
}

void Sequencer::drain_held(Clock::time_point now) {
  while (!held_.empty()) {
    auto it = held_.begin();
    if (it->first < expected_next_) {
      held_.erase(it);
      ++stats_.duplicates;
      continue;
    }
    if (it->first != expected_next_) break;
    DeltaEvent ev = it->second.event;
    held_.erase(it);
    ++stats_.reordered;
    admit(ev, now);
  }
}

void Sequencer::emit_pending() {
  if (pending_.events.empty()) return;
  ++stats_.batches;
  ready_.emplace_back(std::move(pending_));
  pending_ = Batch{};
}

void Sequencer::flush() { emit_pending(); }

void Sequencer::declare_gap(GapReason reason, uint64_t observed,
                            Clock::time_point now) {
  // Everything admitted so far is contiguous and still valid.
  emit_pending();

  GapInfo g;
  g.expected = expected_next_;
  g.observed = observed;
  g.size = observed - expected_next_;
  g.reason = reason;
  g.detected_at = now;

  ++stats_.gaps;
  if (g.size > stats_.max_gap) stats_.max_gap = g.size;
  ++stats_.gaps_by_size[g.size];
  stats_.gap_history.push_back(g);
  while (stats_.gap_history.size() > gap_history_cap_)
    stats_.gap_history.pop_front();

  stats_.discarded_on_gap += held_.size();
  held_.clear();
  arrivals_.clear();
  synced_ = false;

  safe_err("[Sequencer] gap: expected=", g.expected, " observed=", g.observed,
           " size=", g.size,
           (reason == GapReason::WINDOW_EXCEEDED ? " (window exceeded)"
                                                 : " (reorder timeout)"));
  ready_.emplace_back(g);
}

void Sequencer::poll(Clock::time_point now) {
  while (!arrivals_.empty()) {
    const auto [arrived, seq] = arrivals_.front();
    auto it = held_.find(seq);
    if (it == held_.end() || it->second.arrived != arrived) {
      arrivals_.pop_front();
      continue;
    }
    if (synced_ && !in_frame_ && now - arrived > reorder_timeout_)
      declare_gap(GapReason::REORDER_TIMEOUT, held_.begin()->first, now);
    break;
  }

  if (!pending_.events.empty() && now - pending_opened_ >= max_batch_wait_)
    emit_pending();
}

bool Sequencer::next_output(SequencerOutput& out) {
  if (ready_.empty()) return false;
  out = std::move(ready_.front());
  ready_.pop_front();
  return true;
}

void Sequencer::take_back_outputs(Clock::time_point now) {
  auto take = [&](const DeltaEvent& ev) {
    if (held_.emplace(ev.seq, Held{ev, now}).second) {
      arrivals_.emplace_back(now, ev.seq);
      --stats_.admitted;
    }
  };
  for (auto& out : ready_) {
    if (auto* b = std::get_if<Batch>(&out)) {
      if (b->is_snapshot()) continue;  // recovery asks for a fresh frame
      for (const auto& ev : b->events) take(ev);
    }
    // Queued gap signals are superseded by the reset.
  }
  ready_.clear();
  for (const auto& ev : pending_.events) take(ev);
  pending_ = Batch{};
}

void Sequencer::restamp_held(Clock::time_point now) {
  arrivals_.clear();
  for (auto& kv : held_) {
    kv.second.arrived = now;
    arrivals_.emplace_back(now, kv.first);
  }
}

void Sequencer::resync(uint64_t expected_next, Clock::time_point now) {
  take_back_outputs(now);
  if (in_frame_) {
    safe_err("[Sequencer] snapshot frame ", frame_seq_,
             " abandoned by resync to ", expected_next);
    in_frame_ = false;
    frame_ = Batch{};
  }
  synced_ = true;
  expected_next_ = expected_next;

  // Held events the resumed feed will redeliver anyway are not kept waiting
  // on a hole they cannot close.
  for (auto it = held_.begin(); it != held_.end();) {
    if (it->first < expected_next_) {
      ++stats_.duplicates;
      it = held_.erase(it);
    } else if (it->first - expected_next_ > window_) {
      ++stats_.discarded_on_gap;
      it = held_.erase(it);
    } else {
      ++it;
    }
  }
  restamp_held(now);
  drain_held(now);
}

void Sequencer::await_snapshot() {
  take_back_outputs(Clock::now());
  synced_ = false;
}

}  // namespace lobr
