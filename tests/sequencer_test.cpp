#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <variant>
#include <vector>

#include "lobr/sequencer.hpp"

using namespace lobr;
using std::chrono::milliseconds;

static ReplayConfig small_cfg(uint64_t window = 10) {
  ReplayConfig cfg;
  cfg.lookahead_window = window;
  cfg.reorder_timeout = milliseconds(50);
  cfg.max_batch_events = 256;
  cfg.max_batch_wait = milliseconds(5);
  return cfg;
}

static DeltaEvent live(uint64_t seq) {
  return DeltaEvent::add(seq, Side::BID, seq, 100, 1);
}

static std::vector<SequencerOutput> drain(Sequencer& s) {
  std::vector<SequencerOutput> out;
  SequencerOutput o;
  while (s.next_output(o)) out.push_back(o);
  return out;
}

static std::vector<uint64_t> seqs(const SequencerOutput& o) {
  std::vector<uint64_t> v;
  for (const auto& e : std::get<Batch>(o).events) v.push_back(e.seq);
  return v;
}

static void test_in_order_batching() {
  auto cfg = small_cfg();
  cfg.max_batch_events = 3;
  Sequencer s(cfg);
  const auto t0 = Clock::now();
  s.resync(1, t0);
  for (uint64_t i = 1; i <= 5; ++i) s.push(live(i), t0);
  s.flush();

  auto out = drain(s);
  assert(out.size() == 2);
  assert((seqs(out[0]) == std::vector<uint64_t>{1, 2, 3}));
  assert((seqs(out[1]) == std::vector<uint64_t>{4, 5}));
  assert(s.expected_next() == 6);
}

static void test_batch_wait_bound() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  s.resync(1, t0);
  s.push(live(1), t0);
  s.poll(t0 + milliseconds(1));
  assert(!s.has_output());
  s.poll(t0 + milliseconds(6));
  auto out = drain(s);
  assert(out.size() == 1);
  assert((seqs(out[0]) == std::vector<uint64_t>{1}));
}

static void test_reorder_within_window() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  s.resync(1, t0);
  s.push(live(1), t0);
  s.push(live(3), t0);
  s.push(live(4), t0);
  assert(s.held() == 2);
  s.push(live(2), t0);
  assert(s.held() == 0);
  s.flush();

  auto out = drain(s);
  assert(out.size() == 1);
  assert((seqs(out[0]) == std::vector<uint64_t>{1, 2, 3, 4}));
  assert(s.stats().reordered == 2);
}

static void test_duplicates_dropped() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  s.resync(1, t0);
  s.push(live(1), t0);
  s.push(live(1), t0);  // already admitted
  s.push(live(3), t0);
  auto second = live(3);
  second.size = 99;
  s.push(second, t0);   // already held: first arrival wins
  s.push(live(2), t0);
  s.flush();

  auto out = drain(s);
  assert(out.size() == 1);
  const auto& b = std::get<Batch>(out[0]);
  assert(b.events.size() == 3);
  assert(b.events[2].size == 1);
  assert(s.stats().duplicates == 2);
}

// 1, 2, 4 with a window of 10: nothing closes the hole at 3 before the
// reorder timeout, so 1-2 go out as a batch followed by a gap signal.
static void test_gap_by_reorder_timeout() {
  Sequencer s(small_cfg(10));
  const auto t0 = Clock::now();
  s.resync(1, t0);
  s.push(live(1), t0);
  s.push(live(2), t0);
  s.push(live(4), t0);

  s.poll(t0 + milliseconds(40));
  assert(s.synced());  // hole still within the reorder timeout
  s.poll(t0 + milliseconds(60));

  auto out = drain(s);
  assert(out.size() == 2);
  assert((seqs(out[0]) == std::vector<uint64_t>{1, 2}));
  const auto& gap = std::get<GapInfo>(out[1]);
  assert(gap.expected == 3);
  assert(gap.observed == 4);
  assert(gap.size == 1);
  assert(gap.reason == GapReason::REORDER_TIMEOUT);
  assert(!s.synced());
  assert(s.stats().gaps == 1);
  assert(s.stats().gaps_by_size.at(1) == 1);
}

static void test_gap_by_window() {
  Sequencer s(small_cfg(10));
  const auto t0 = Clock::now();
  s.resync(1, t0);
  s.push(live(1), t0);
  s.push(live(5), t0);
  s.push(live(20), t0);

  auto out = drain(s);
  assert(out.size() == 2);
  assert((seqs(out[0]) == std::vector<uint64_t>{1}));
  const auto& gap = std::get<GapInfo>(out[1]);
  assert(gap.expected == 2);
  assert(gap.observed == 20);
  assert(gap.reason == GapReason::WINDOW_EXCEEDED);
  assert(s.stats().discarded_on_gap == 1);  // 5 was thrown away
  assert(s.held() == 1);                    // 20 kept for after recovery
  assert(s.stats().max_gap == 18);
}

static void test_snapshot_frame_syncs() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  // Unsynced: live events wait for a frame.
  s.push(live(3), t0);
  s.push(live(5), t0);
  s.push(live(6), t0);
  assert(!s.has_output());

  s.push(DeltaEvent::snapshot_begin(4), t0);
  s.push(DeltaEvent::add(4, Side::ASK, 900, 101, 7), t0);
  s.push(DeltaEvent::snapshot_end(4), t0);
  s.flush();

  auto out = drain(s);
  assert(out.size() == 2);
  const auto& frame = std::get<Batch>(out[0]);
  assert(frame.is_snapshot());
  assert(frame.events.size() == 3);
  assert((seqs(out[1]) == std::vector<uint64_t>{5, 6}));
  assert(s.synced());
  assert(s.expected_next() == 7);
  assert(s.stats().covered_by_snapshot == 1);
  assert(s.stats().snapshot_frames == 1);
}

static void test_frame_owns_its_sequence() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  s.resync(1, t0);
  s.push(live(1), t0);
  s.push(live(2), t0);
  // Frame through 2 arrives right after 2: every body event carries 2.
  s.push(DeltaEvent::snapshot_begin(2), t0);
  s.push(DeltaEvent::add(2, Side::BID, 1, 100, 1), t0);
  s.push(DeltaEvent::add(2, Side::BID, 2, 100, 1), t0);
  s.push(live(3), t0);  // arrives mid-frame, waits
  s.push(DeltaEvent::snapshot_end(2), t0);
  s.flush();

  auto out = drain(s);
  assert(out.size() == 3);
  assert((seqs(out[0]) == std::vector<uint64_t>{1, 2}));
  assert(std::get<Batch>(out[1]).is_snapshot());
  assert(std::get<Batch>(out[1]).events.size() == 4);
  assert((seqs(out[2]) == std::vector<uint64_t>{3}));
}

static void test_stale_frame_dropped() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  s.resync(10, t0);
  s.push(DeltaEvent::snapshot_begin(5), t0);
  s.push(DeltaEvent::add(5, Side::BID, 1, 100, 1), t0);
  s.push(DeltaEvent::snapshot_end(5), t0);
  assert(!s.has_output());
  assert(s.stats().stale_snapshots == 1);
  assert(s.expected_next() == 10);

  // Orphan markers are duplicates, not frames.
  s.push(DeltaEvent::snapshot_end(7), t0);
  assert(s.stats().duplicates == 1);
}

static void test_restarted_frame() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  s.push(DeltaEvent::snapshot_begin(3), t0);
  s.push(DeltaEvent::add(3, Side::BID, 1, 100, 1), t0);
  s.push(DeltaEvent::snapshot_begin(8), t0);
  s.push(DeltaEvent::add(8, Side::BID, 2, 100, 1), t0);
  s.push(DeltaEvent::snapshot_end(8), t0);

  auto out = drain(s);
  assert(out.size() == 1);
  const auto& frame = std::get<Batch>(out[0]);
  assert(frame.events.size() == 3);
  assert(frame.first_seq() == 8);
  assert(s.expected_next() == 9);
}

static void test_resync_takes_back_undelivered() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  s.resync(1, t0);
  s.push(live(1), t0);
  s.push(live(2), t0);
  s.push(live(3), t0);
  s.push(live(30), t0);  // beyond the window: gap, queued behind [1,2,3]

  s.resync(2, t0);
  s.flush();
  auto out = drain(s);
  assert(out.size() == 1);
  assert((seqs(out[0]) == std::vector<uint64_t>{2, 3}));
  assert(s.held() == 0);  // 30 is more than a window ahead, dropped
}

static void test_await_snapshot_holds_live() {
  Sequencer s(small_cfg());
  const auto t0 = Clock::now();
  s.resync(1, t0);
  s.push(live(1), t0);
  s.push(live(2), t0);
  s.await_snapshot();
  assert(!s.synced());
  assert(!s.has_output());
  assert(s.held() == 2);

  s.push(live(3), t0);
  s.poll(t0 + milliseconds(500));  // no timeout while unsynced
  assert(!s.has_output());

  s.push(DeltaEvent::snapshot_begin(1), t0);
  s.push(DeltaEvent::snapshot_end(1), t0);
  s.flush();
  auto out = drain(s);
  assert(out.size() == 2);
  assert(std::get<Batch>(out[0]).is_snapshot());
  assert((seqs(out[1]) == std::vector<uint64_t>{2, 3}));
}

static void test_unsynced_buffer_bounded() {
  Sequencer s(small_cfg(4));
  const auto t0 = Clock::now();
  for (uint64_t i = 1; i <= 10; ++i) s.push(live(i), t0);
  assert(s.held() == 4);
  assert(s.stats().evicted_unsynced == 6);
}

static void test_gap_history_bounded() {
  auto cfg = small_cfg(2);
  cfg.gap_history = 2;
  Sequencer s(cfg);
  const auto t0 = Clock::now();
  uint64_t next = 1;
  for (int i = 0; i < 3; ++i) {
    s.resync(next, t0);
    s.push(live(next + 10), t0);
    next += 20;
  }
  assert(s.stats().gaps == 3);
  assert(s.stats().gap_history.size() == 2);
  assert(s.stats().gap_history.back().expected == 41);
}

int main() {
  test_in_order_batching();
  test_batch_wait_bound();
  test_reorder_within_window();
  test_duplicates_dropped();
  test_gap_by_reorder_timeout();
  test_gap_by_window();
  test_snapshot_frame_syncs();
  test_frame_owns_its_sequence();
  test_stale_frame_dropped();
  test_restarted_frame();
  test_resync_takes_back_undelivered();
  test_await_snapshot_holds_live();
  test_unsynced_buffer_bounded();
  test_gap_history_bounded();
  std::cout << "OK: sequencer\n";
  return 0;
}
