#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <memory_resource>
#include <vector>

#include "lobr/errors.hpp"
#include "lobr/replayer.hpp"

using namespace lobr;

static ReplayConfig cfg_top(std::size_t top_n = 5) {
  ReplayConfig cfg;
  cfg.top_n = top_n;
  cfg.index_capacity = 64;
  return cfg;
}

static Batch batch(std::vector<DeltaEvent> events) {
  Batch b;
  b.events = std::move(events);
  return b;
}

static Batch frame(uint64_t s, const std::vector<DeltaEvent>& body) {
  Batch b;
  b.events.push_back(DeltaEvent::snapshot_begin(s));
  for (auto e : body) {
    e.seq = s;
    b.events.push_back(e);
  }
  b.events.push_back(DeltaEvent::snapshot_end(s));
  return b;
}

static void go_live(Replayer& r, std::pmr::memory_resource* mr,
                    std::size_t top_n = 5) {
  r.install(std::make_unique<BookState>(top_n, mr));
  assert(r.state() == ReplayerState::LIVE);
}

static void test_starts_waiting_for_a_book() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  assert(r.state() == ReplayerState::SNAPSHOT_REBUILD);
  auto res = r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 1)}));
  assert(res == BatchResult::IGNORED);
  assert(r.stats().dropped_rebuilding == 1);
  assert(r.book().order_count() == 0);
}

static void test_apply_and_idempotence() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  go_live(r, &pool);

  auto res = r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 10),
                                  DeltaEvent::add(2, Side::ASK, 2, 105, 4),
                                  DeltaEvent::update(3, 1, 101, 7)}));
  assert(res == BatchResult::APPLIED);
  assert(r.applied_through() == 3);
  assert(r.book().bids().volume_at(101) == 7);
  assert(r.book().bids().volume_at(100) == 0);

  // Overlapping redelivery: 2 and 3 are skipped, 4 applies.
  res = r.apply_batch(batch({DeltaEvent::add(2, Side::ASK, 2, 105, 4),
                             DeltaEvent::update(3, 1, 101, 7),
                             DeltaEvent::cancel(4, 2)}));
  assert(res == BatchResult::APPLIED);
  assert(r.applied_through() == 4);
  assert(r.book().asks().depth() == 0);
  assert(r.stats().duplicates_skipped == 2);

  // Entirely old: nothing changes.
  res = r.apply_batch(batch({DeltaEvent::cancel(1, 1)}));
  assert(res == BatchResult::APPLIED);
  assert(r.book().find(1) != nullptr);
  assert(r.applied_through() == 4);
  r.book().check_conservation();
}

static void test_negative_volume_halts_without_commit() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  go_live(r, &pool);

  auto res = r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 10),
                                  DeltaEvent::add(2, Side::BID, 2, 100, 5),
                                  DeltaEvent::update(3, 2, 100, -20)}));
  assert(res == BatchResult::FATAL);
  assert(r.state() == ReplayerState::HALTED);
  assert(r.book().order_count() == 0);  // none of the batch was committed
  assert(r.applied_through() == 0);
  assert(r.stats().fatal_errors == 1);
  assert(!r.last_fatal().empty());

  res = r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 10)}));
  assert(res == BatchResult::IGNORED);
  assert(r.stats().rejected_halted == 1);
}

static void test_staging_sees_earlier_events_in_batch() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  go_live(r, &pool);

  // Add, grow and cancel the same order inside one batch; then cancel it
  // again, which is an unknown order by then.
  auto res = r.apply_batch(batch({DeltaEvent::add(1, Side::ASK, 9, 200, 3),
                                  DeltaEvent::update(2, 9, 201, 8),
                                  DeltaEvent::cancel(3, 9),
                                  DeltaEvent::cancel(4, 9)}));
  assert(res == BatchResult::APPLIED);
  assert(r.book().order_count() == 0);
  assert(r.book().asks().depth() == 0);
  assert(r.stats().unknown_orders == 1);
  assert(r.stats().events_applied == 3);
  assert(r.applied_through() == 4);
}

static void test_duplicate_add_is_counted() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  go_live(r, &pool);

  r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 10)}));
  auto res = r.apply_batch(batch({DeltaEvent::add(2, Side::BID, 1, 99, 5)}));
  assert(res == BatchResult::APPLIED);
  assert(r.state() == ReplayerState::LIVE);
  assert(r.stats().duplicate_adds == 1);
  assert(r.book().bids().volume_at(100) == 10);
  assert(r.book().bids().volume_at(99) == 0);
  assert(r.applied_through() == 2);
}

static void test_gap_rejected_untouched() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  go_live(r, &pool);

  auto res = r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 10),
                                  DeltaEvent::add(3, Side::BID, 3, 100, 10)}));
  assert(res == BatchResult::GAP);
  assert(r.book().order_count() == 0);
  assert(r.applied_through() == 0);
  assert(r.state() == ReplayerState::LIVE);
  assert(r.stats().gaps_rejected == 1);
}

static void test_marker_inside_live_batch_is_fatal() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  go_live(r, &pool);
  auto res = r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 1),
                                  DeltaEvent::snapshot_end(2)}));
  assert(res == BatchResult::FATAL);
  assert(r.state() == ReplayerState::HALTED);
}

static void test_snapshot_installs_and_reports_drift() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);

  auto res = r.apply_batch(frame(10, {DeltaEvent::add(0, Side::BID, 1, 100, 10),
                                      DeltaEvent::add(0, Side::ASK, 2, 105, 3)}));
  assert(res == BatchResult::APPLIED);
  assert(r.state() == ReplayerState::LIVE);
  assert(r.applied_through() == 10);
  assert(r.book().order_count() == 2);
  assert(r.stats().drift_checks == 0);  // nothing to compare against yet

  r.apply_batch(batch({DeltaEvent::update(11, 1, 100, 12)}));

  // The source's book says 100 x 10: one mismatched level.
  res = r.apply_batch(frame(11, {DeltaEvent::add(0, Side::BID, 1, 100, 10),
                                 DeltaEvent::add(0, Side::ASK, 2, 105, 3)}));
  assert(res == BatchResult::APPLIED);
  assert(r.stats().drift_checks == 1);
  assert(r.stats().drift_detected == 1);
  assert(r.last_drift().volume_mismatches == 1);
  assert(r.last_drift().max_abs_deviation == 2);
  assert(r.book().bids().volume_at(100) == 10);

  // Same book again: clean.
  r.apply_batch(frame(11, {DeltaEvent::add(0, Side::BID, 1, 100, 10),
                           DeltaEvent::add(0, Side::ASK, 2, 105, 3)}));
  assert(r.last_drift().clean());
  assert(r.stats().snapshots_installed == 3);
}

static void test_stale_snapshot_ignored() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  r.apply_batch(frame(10, {DeltaEvent::add(0, Side::BID, 1, 100, 10)}));
  auto res = r.apply_batch(frame(4, {}));
  assert(res == BatchResult::IGNORED);
  assert(r.stats().stale_snapshots == 1);
  assert(r.applied_through() == 10);
  assert(r.book().order_count() == 1);
}

static void test_incomplete_frame_leaves_book() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  go_live(r, &pool);
  r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 10)}));

  Batch partial;
  partial.events.push_back(DeltaEvent::snapshot_begin(5));
  partial.events.push_back(DeltaEvent::add(5, Side::ASK, 2, 105, 3));
  assert(r.apply_batch(partial) == BatchResult::IGNORED);
  assert(r.state() == ReplayerState::LIVE);
  assert(r.stats().incomplete_frames == 1);
  assert(r.book().find(2) == nullptr);
  assert(r.applied_through() == 1);
}

static void test_snapshot_clears_halt_only_via_rebuild() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  go_live(r, &pool);
  r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, -1)}));
  assert(r.state() == ReplayerState::HALTED);

  r.begin_rebuild();
  assert(r.state() == ReplayerState::SNAPSHOT_REBUILD);
  r.apply_batch(frame(3, {DeltaEvent::add(0, Side::BID, 7, 100, 1)}));
  assert(r.state() == ReplayerState::LIVE);
  assert(r.expected_next() == 4);
}

static void test_tier_boundary_across_batches() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(2), &pool);
  go_live(r, &pool, 2);
  r.apply_batch(batch({DeltaEvent::add(1, Side::BID, 1, 100, 1),
                       DeltaEvent::add(2, Side::BID, 2, 99, 2),
                       DeltaEvent::add(3, Side::BID, 3, 98, 3)}));
  assert(r.book().bids().tier_of(98) == Tier::DEEP);
  r.apply_batch(batch({DeltaEvent::cancel(4, 1)}));
  assert(r.book().bids().tier_of(98) == Tier::NEAR);
  assert(r.book().bids().volume_at(98) == 3);
  r.book().check_conservation();
}

// The level could absorb -20, but no resting order may have a size <= 0.
static void test_non_positive_size_is_fatal() {
  std::pmr::unsynchronized_pool_resource pool;
  Replayer r(cfg_top(), &pool);
  r.apply_batch(frame(10, {DeltaEvent::add(0, Side::BID, 1, 100, 50)}));
  assert(r.state() == ReplayerState::LIVE);

  auto res = r.apply_batch(batch({DeltaEvent::add(11, Side::BID, 2, 100, -20)}));
  assert(res == BatchResult::FATAL);
  assert(r.state() == ReplayerState::HALTED);
  assert(r.book().find(2) == nullptr);
  assert(r.book().bids().volume_at(100) == 50);
  assert(r.applied_through() == 10);
  r.book().check_conservation();

  // A rebuild clears the halt; an UPDATE down to zero is fatal too.
  r.begin_rebuild();
  r.apply_batch(frame(11, {DeltaEvent::add(0, Side::BID, 1, 100, 50)}));
  assert(r.state() == ReplayerState::LIVE);
  res = r.apply_batch(batch({DeltaEvent::update(12, 1, 100, 0)}));
  assert(res == BatchResult::FATAL);
  assert(r.book().find(1)->size == 50);

  // Inside a frame the half-built book is discarded.
  r.begin_rebuild();
  res = r.apply_batch(frame(12, {DeltaEvent::add(0, Side::BID, 1, 100, 50),
                                 DeltaEvent::add(0, Side::BID, 2, 100, 0)}));
  assert(res == BatchResult::FATAL);
  assert(r.applied_through() == 11);
  assert(r.stats().fatal_errors == 3);
}

int main() {
  test_starts_waiting_for_a_book();
  test_apply_and_idempotence();
  test_negative_volume_halts_without_commit();
  test_non_positive_size_is_fatal();
  test_staging_sees_earlier_events_in_batch();
  test_duplicate_add_is_counted();
  test_gap_rejected_untouched();
  test_marker_inside_live_batch_is_fatal();
  test_snapshot_installs_and_reports_drift();
  test_stale_snapshot_ignored();
  test_incomplete_frame_leaves_book();
  test_snapshot_clears_halt_only_via_rebuild();
  test_tier_boundary_across_batches();
  std::cout << "OK: replayer\n";
  return 0;
}
