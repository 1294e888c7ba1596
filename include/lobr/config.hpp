#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "lobr/fixed_point.hpp"

namespace lobr {

struct ReplayConfig {
  std::string instrument_id = "BTCUSDT";

  // Book
  std::size_t top_n = 20;
  int64_t price_scale = kDefaultScale;
  std::size_t index_capacity = 1 << 12;   // initial order-index slots
  std::size_t pool_block_bytes = 1 << 16;  // largest block pooled per pipeline

  // Sequencer
  uint64_t lookahead_window = 1000;
  std::chrono::milliseconds reorder_timeout{50};
  std::size_t max_batch_events = 256;
  std::chrono::milliseconds max_batch_wait{5};
  std::size_t gap_history = 1000;

  // Checkpointing
  uint64_t checkpoint_event_interval = 1000000;
  std::chrono::milliseconds checkpoint_time_interval{300000};
  std::chrono::milliseconds min_checkpoint_interval{0};
  std::string checkpoint_path;  // "" = in-memory, *.mdb = LMDB, else directory
  std::size_t checkpoints_to_keep = 3;

  // Recovery
  int recovery_max_retries = 5;
  std::chrono::milliseconds recovery_backoff{100};
  std::chrono::milliseconds recovery_max_backoff{10000};  // doubling stops here

  // Collaborators
  std::string feed_target;   // gRPC host:port, "" = journal replay
  std::string journal_path;  // LMDB event journal

  bool quiet = false;

  // Throws std::invalid_argument naming the first bad option.
  void validate() const;
};

// "--top-n 20 --window 500 ..." on top of defaults, then environment
// overrides (LOBR_CHECKPOINT_PATH, LOBR_FEED_TARGET, LOBR_JOURNAL_PATH).
// Unknown flags throw std::invalid_argument. argv[0] is skipped.
ReplayConfig parse_config(int argc, const char* const* argv);

void apply_env(ReplayConfig& cfg);

void usage(const char* prog);

}  // namespace lobr
