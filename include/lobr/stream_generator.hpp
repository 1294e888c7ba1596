#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "lobr/event.hpp"
#include "lobr/fixed_point.hpp"

namespace lobr {

struct GeneratorConfig {
  uint64_t seed = 42;
  uint64_t events = 100000;          // live deltas after the first frame
  int64_t mid_price = 30000 * kDefaultScale;
  int64_t tick = kDefaultScale / 100;
  double sigma_ticks = 15.0;         // distance from mid, in ticks
  int64_t min_size = kDefaultScale / 1000;
  int64_t max_size = 5 * kDefaultScale;
  std::size_t initial_orders = 200;  // carried by the opening frame
  double add_prob = 0.45;
  double update_prob = 0.25;         // rest are cancels
  uint64_t snapshot_every = 0;       // 0 = opening frame only
  uint64_t start_ns = 1700000000000000000ull;
};

// Deterministic, gap-free stream for one instrument: a snapshot frame at
// sequence 0 holding the initial orders, then live ADD/UPDATE/CANCEL from
// sequence 1, with optional periodic frames at the current sequence.
// Every UPDATE/CANCEL targets a resting order and no level goes negative.
std::vector<DeltaEvent> generate_stream(const GeneratorConfig& cfg);

struct DeliveryFaults {
  uint64_t seed = 7;
  double swap_prob = 0.0;      // displace a live event a few slots later
  std::size_t max_displacement = 4;
  double duplicate_prob = 0.0;
  double drop_prob = 0.0;
};

// What a lossy transport would deliver. Snapshot frames stay intact and in
// place.
std::vector<DeltaEvent> perturb(const std::vector<DeltaEvent>& in,
                                const DeliveryFaults& f);

}  // namespace lobr
