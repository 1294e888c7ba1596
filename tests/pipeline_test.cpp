#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "lobr/checkpoint_store.hpp"
#include "lobr/config.hpp"
#include "lobr/feed_source.hpp"
#include "lobr/pipeline.hpp"
#include "lobr/snapshot_frame.hpp"
#include "lobr/stream_generator.hpp"

using namespace lobr;
using std::chrono::milliseconds;

static void no_sleep(milliseconds) {}

static ReplayConfig test_cfg() {
  ReplayConfig cfg;
  cfg.quiet = true;
  cfg.lookahead_window = 64;
  cfg.reorder_timeout = milliseconds(20);
  cfg.checkpoint_event_interval = 5000;
  return cfg;
}

static GeneratorConfig gen(uint64_t events, uint64_t snapshot_every = 0) {
  GeneratorConfig g;
  g.seed = 11;
  g.events = events;
  g.snapshot_every = snapshot_every;
  return g;
}

static void test_generator_is_valid_and_deterministic() {
  auto a = generate_stream(gen(3000, 1000));
  auto b = generate_stream(gen(3000, 1000));
  assert(a.size() == b.size());
  for (std::size_t i = 0; i < a.size(); ++i)
    assert(a[i].seq == b[i].seq && a[i].order_id == b[i].order_id &&
           a[i].price == b[i].price && a[i].size == b[i].size);

  assert(a.front().type == EventType::SNAPSHOT_BEGIN && a.front().seq == 0);
  uint64_t expect = 1;
  std::size_t frames = 0;
  bool in_frame = false;
  for (const auto& e : a) {
    if (e.type == EventType::SNAPSHOT_BEGIN) {
      in_frame = true;
      ++frames;
    }
    if (!in_frame) {
      assert(e.seq == expect);
      ++expect;
    }
    if (e.type == EventType::SNAPSHOT_END) in_frame = false;
  }
  assert(expect == 3001);
  assert(frames == 4);

  auto book = replay_history(a, 3000, 20);  // throws if anything went negative
  assert(book->applied_through() == 3000);
  book->check_conservation();
  auto bid = book->bids().best();
  auto ask = book->asks().best();
  assert(bid && ask && bid->price < ask->price);
}

static void test_perturb_keeps_frames_whole() {
  auto clean = generate_stream(gen(2000, 500));
  DeliveryFaults f;
  f.swap_prob = 0.2;
  f.duplicate_prob = 0.05;
  f.drop_prob = 0.01;
  auto noisy = perturb(clean, f);

  std::set<uint64_t> live_clean, live_noisy;
  bool in_frame = false;
  for (const auto& e : clean) {
    if (e.type == EventType::SNAPSHOT_BEGIN) in_frame = true;
    if (!in_frame) live_clean.insert(e.seq);
    if (e.type == EventType::SNAPSHOT_END) in_frame = false;
  }
  for (std::size_t i = 0; i < noisy.size(); ++i) {
    const auto& e = noisy[i];
    if (e.type == EventType::SNAPSHOT_BEGIN) {
      // body follows contiguously up to END
      std::size_t j = i + 1;
      while (noisy[j].type != EventType::SNAPSHOT_END) {
        assert(noisy[j].seq == e.seq && noisy[j].type == EventType::ADD);
        ++j;
      }
      assert(noisy[j].seq == e.seq);
      i = j;
      continue;
    }
    live_noisy.insert(e.seq);
  }
  for (uint64_t s : live_noisy) assert(live_clean.count(s));
  assert(live_noisy.size() < live_clean.size());  // something was dropped
}

static void test_noisy_delivery_matches_clean_replay() {
  auto cfg = test_cfg();
  auto clean = generate_stream(gen(20000, 3000));
  DeliveryFaults f;
  f.swap_prob = 0.05;
  f.duplicate_prob = 0.02;
  f.drop_prob = 0.0005;
  auto arrivals = perturb(clean, f);
  // The tail must arrive so a lost event before it is noticed.
  arrivals.push_back(clean.back());

  VectorFeedSource feed(arrivals, clean, cfg.top_n);
  MemoryCheckpointStore store(cfg.checkpoints_to_keep);
  Pipeline p(cfg, feed, store, no_sleep);
  p.start();
  p.run();
  p.shutdown();

  auto expected = replay_history(clean, 20000, cfg.top_n);
  assert(!p.failed());
  assert(p.replayer().state() == ReplayerState::LIVE);
  assert(p.replayer().applied_through() == 20000);
  assert(p.replayer().book().equals(*expected));
  p.replayer().book().check_conservation();

  const auto h = p.health();
  assert(h.sequencer.duplicates > 0);
  assert(h.sequencer.reordered > 0);
  assert(h.replayer.fatal_errors == 0);
  assert(h.replayer.snapshots_installed >= 2);
  assert(h.checkpoint.written >= 2);
  assert(h.last_checkpoint_seq == 20000);
  assert(h.to_string().find("LIVE") != std::string::npos);

  auto v = p.view();
  assert(v->applied_through == 20000);
  assert(v->best_bid && v->best_ask);
  assert(v->best_bid->price < v->best_ask->price);
  assert(v->bids.size() <= cfg.top_n);

  auto deep = p.deep_view();
  assert(deep.bids.size() == expected->bids().depth());
}

static void test_restart_from_checkpoint() {
  auto cfg = test_cfg();
  auto clean = generate_stream(gen(12000));
  MemoryCheckpointStore store(cfg.checkpoints_to_keep);

  {
    std::vector<DeltaEvent> first_half;
    for (const auto& e : clean)
      if (e.seq <= 7000) first_half.push_back(e);
    VectorFeedSource feed(first_half, clean, cfg.top_n);
    Pipeline p(cfg, feed, store, no_sleep);
    p.start();
    p.run();
    p.shutdown();
    assert(p.replayer().applied_through() == 7000);
  }
  assert(store.list(cfg.instrument_id).front() == 7000);

  VectorFeedSource feed(clean, clean, cfg.top_n);
  Pipeline p(cfg, feed, store, no_sleep);
  p.start();
  assert(p.replayer().state() == ReplayerState::LIVE);
  assert(p.replayer().applied_through() == 7000);
  assert(p.health().recovery.resumes == 1);
  p.run();
  p.shutdown();

  auto expected = replay_history(clean, 12000, cfg.top_n);
  assert(p.replayer().book().equals(*expected));
  assert(feed.stats().snapshots == 0);
}

static void test_fatal_error_rebuilds_from_snapshot() {
  auto cfg = test_cfg();
  auto clean = generate_stream(gen(4000));
  auto arrivals = clean;
  for (auto& e : arrivals) {
    if (e.seq == 1500 && e.type != EventType::SNAPSHOT_BEGIN &&
        e.type != EventType::SNAPSHOT_END) {
      e = DeltaEvent::add(1500, Side::BID, 9999999, 3000000000000LL,
                          -1000000000000000000LL);
    }
  }

  VectorFeedSource feed(arrivals, clean, cfg.top_n);
  MemoryCheckpointStore store;
  Pipeline p(cfg, feed, store, no_sleep);
  p.start();
  p.run();
  p.shutdown();

  const auto h = p.health();
  assert(h.replayer.fatal_errors == 1);
  assert(!h.last_fatal.empty());
  assert(h.recovery.snapshots_requested == 2);  // startup + rebuild
  assert(p.replayer().state() == ReplayerState::LIVE);
  auto expected = replay_history(clean, 4000, cfg.top_n);
  assert(p.replayer().book().equals(*expected));
}

static void test_bounded_run() {
  auto cfg = test_cfg();
  auto clean = generate_stream(gen(1000));
  VectorFeedSource feed(clean, {}, cfg.top_n);
  MemoryCheckpointStore store;
  Pipeline p(cfg, feed, store, no_sleep);
  assert(p.run(300) == 300);
  assert(!feed.exhausted());
  p.request_stop();
  assert(p.run() == 0);
}

static void test_config_parsing() {
  const char* argv[] = {"lob_replay", "--instrument", "ETHUSDT", "--top-n", "5",
                        "--window", "100", "--reorder-timeout-ms", "7",
                        "--checkpoint-min-interval-ms", "250", "--quiet"};
  auto cfg = parse_config(12, argv);
  assert(cfg.instrument_id == "ETHUSDT");
  assert(cfg.top_n == 5);
  assert(cfg.lookahead_window == 100);
  assert(cfg.reorder_timeout == milliseconds(7));
  assert(cfg.min_checkpoint_interval == milliseconds(250));
  assert(cfg.quiet);
  cfg.validate();

  bool threw = false;
  try {
    const char* bad[] = {"lob_replay", "--bogus"};
    parse_config(2, bad);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  cfg.top_n = 0;
  try {
    cfg.validate();
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

int main() {
  test_generator_is_valid_and_deterministic();
  test_perturb_keeps_frames_whole();
  test_noisy_delivery_matches_clean_replay();
  test_restart_from_checkpoint();
  test_fatal_error_rebuilds_from_snapshot();
  test_bounded_run();
  test_config_parsing();
  std::cout << "OK: pipeline\n";
  return 0;
}
