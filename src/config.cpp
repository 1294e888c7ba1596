#include "lobr/config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace lobr {

void ReplayConfig::validate() const {
  auto fail = [](const std::string& what) {
    throw std::invalid_argument("invalid config: " + what);
  };
  if (instrument_id.empty()) fail("instrument_id is empty");
  if (top_n < 1 || top_n > 1000) fail("top_n must be in [1, 1000]");
  scale_digits(price_scale);  // throws for non powers of ten
  if (lookahead_window < 1) fail("lookahead_window must be positive");
  if (reorder_timeout.count() <= 0) fail("reorder_timeout must be positive");
  if (max_batch_events < 1) fail("max_batch_events must be positive");
  if (max_batch_wait.count() < 0) fail("max_batch_wait must be >= 0");
  if (checkpoint_event_interval < 1)
    fail("checkpoint_event_interval must be positive");
  if (checkpoint_time_interval.count() <= 0)
    fail("checkpoint_time_interval must be positive");
  if (min_checkpoint_interval.count() < 0)
    fail("min_checkpoint_interval must be >= 0");
  if (checkpoints_to_keep < 1) fail("checkpoints_to_keep must be positive");
  if (recovery_max_retries < 0) fail("recovery_max_retries must be >= 0");
  if (recovery_backoff.count() < 0) fail("recovery_backoff must be >= 0");
  if (recovery_max_backoff < recovery_backoff)
    fail("recovery_max_backoff must be >= recovery_backoff");
}

void apply_env(ReplayConfig& cfg) {
  if (const char* p = std::getenv("LOBR_CHECKPOINT_PATH"); p && *p)
    cfg.checkpoint_path = p;
  if (const char* p = std::getenv("LOBR_FEED_TARGET"); p && *p)
    cfg.feed_target = p;
  if (const char* p = std::getenv("LOBR_JOURNAL_PATH"); p && *p)
    cfg.journal_path = p;
}

ReplayConfig parse_config(int argc, const char* const* argv) {
  ReplayConfig cfg;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc)
        throw std::invalid_argument("missing value for " + a);
      return argv[++i];
    };
    auto ms = [&]() { return std::chrono::milliseconds(std::stoll(next())); };

    if (a == "--instrument")
      cfg.instrument_id = next();
    else if (a == "--top-n")
      cfg.top_n = std::stoull(next());
    else if (a == "--scale")
      cfg.price_scale = std::stoll(next());
    else if (a == "--window")
      cfg.lookahead_window = std::stoull(next());
    else if (a == "--reorder-timeout-ms")
      cfg.reorder_timeout = ms();
    else if (a == "--batch-events")
      cfg.max_batch_events = std::stoull(next());
    else if (a == "--batch-wait-ms")
      cfg.max_batch_wait = ms();
    else if (a == "--checkpoint-events")
      cfg.checkpoint_event_interval = std::stoull(next());
    else if (a == "--checkpoint-interval-ms")
      cfg.checkpoint_time_interval = ms();
    else if (a == "--checkpoint-min-interval-ms")
      cfg.min_checkpoint_interval = ms();
    else if (a == "--checkpoint-path")
      cfg.checkpoint_path = next();
    else if (a == "--checkpoints-keep")
      cfg.checkpoints_to_keep = std::stoull(next());
    else if (a == "--recovery-retries")
      cfg.recovery_max_retries = std::stoi(next());
    else if (a == "--recovery-backoff-ms")
      cfg.recovery_backoff = ms();
    else if (a == "--recovery-max-backoff-ms")
      cfg.recovery_max_backoff = ms();
    else if (a == "--feed")
      cfg.feed_target = next();
    else if (a == "--journal")
      cfg.journal_path = next();
    else if (a == "--quiet")
      cfg.quiet = true;
    else
      throw std::invalid_argument("unknown option: " + a);
  }
  apply_env(cfg);
  return cfg;
}

void usage(const char* prog) {
  std::cout
      << "Usage: " << prog << " [options]\n"
      << "  --instrument ID              Instrument id (default BTCUSDT)\n"
      << "  --top-n N                    Near-touch levels per side (default 20)\n"
      << "  --scale S                    Fixed-point scale, power of ten (default 1e8)\n"
      << "  --window N                   Reorder look-ahead window (default 1000)\n"
      << "  --reorder-timeout-ms MS      Max wait for a missing sequence (default 50)\n"
      << "  --batch-events N             Micro-batch size bound (default 256)\n"
      << "  --batch-wait-ms MS           Micro-batch time bound (default 5)\n"
      << "  --checkpoint-events N        Events between checkpoints (default 1000000)\n"
      << "  --checkpoint-interval-ms MS  Time between checkpoints (default 300000)\n"
      << "  --checkpoint-min-interval-ms MS  Grace period between checkpoints\n"
      << "  --checkpoint-path PATH       Checkpoint store (*.mdb = LMDB, else dir)\n"
      << "  --checkpoints-keep N         Checkpoints retained by the store (default 3)\n"
      << "  --recovery-retries N         Feed retries during recovery (default 5)\n"
      << "  --recovery-backoff-ms MS     Initial retry backoff (default 100)\n"
      << "  --recovery-max-backoff-ms MS Longest retry backoff (default 10000)\n"
      << "  --feed HOST:PORT             gRPC delta feed\n"
      << "  --journal PATH               LMDB event journal to replay\n"
      << "  --quiet                      Only warnings and errors\n"
      << "Env: LOBR_CHECKPOINT_PATH, LOBR_FEED_TARGET, LOBR_JOURNAL_PATH\n";
}

}  // namespace lobr
