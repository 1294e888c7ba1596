#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "lobr/book_view.hpp"
#include "lobr/checkpoint_store.hpp"
#include "lobr/config.hpp"
#include "lobr/event_journal.hpp"
#include "lobr/feed_source.hpp"
#include "lobr/grpc_feed_source.hpp"
#include "lobr/pipeline.hpp"
#include "lobr/stream_generator.hpp"

using namespace lobr;

namespace {

std::atomic<Pipeline*> g_pipeline{nullptr};

void on_signal(int) {
  if (Pipeline* p = g_pipeline.load()) p->request_stop();
}

void print_usage(const char* prog) {
  usage(prog);
  std::cout
      << "Tool options:\n"
      << "  --record N                   Write N synthetic deltas to --journal\n"
      << "  --seed S                     Generator / fault seed (default 42)\n"
      << "  --snapshot-every N           Generator: frame every N sequences\n"
      << "  --reorder P                  Replay: displace events with prob P\n"
      << "  --dup P                      Replay: duplicate events with prob P\n"
      << "  --drop P                     Replay: drop events with prob P\n"
      << "  --read                       List and dump the journal instead\n"
      << "  --dump N                     Events to print per instrument\n"
      << "  --levels K                   Levels printed per side (default 5)\n";
}

void print_book(const BookView& v, std::size_t k) {
  std::cout << "Top of book " << v.instrument_id << " @" << v.applied_through
            << "\n"
            << format_ladder(v, k);
}

}  // namespace

int main(int argc, char** argv) {
  uint64_t record_n = 0;
  GeneratorConfig gen;
  DeliveryFaults faults;
  bool read_mode = false;
  int dump_n = 0;
  std::size_t show_levels = 5;

  // Tool flags are consumed here; the rest configures the pipeline.
  std::vector<const char*> rest{argv[0]};
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (a == "--record" && i + 1 < argc) {
        record_n = std::stoull(argv[++i]);
      } else if (a == "--seed" && i + 1 < argc) {
        gen.seed = std::stoull(argv[++i]);
        faults.seed = gen.seed + 1;
      } else if (a == "--snapshot-every" && i + 1 < argc) {
        gen.snapshot_every = std::stoull(argv[++i]);
      } else if (a == "--reorder" && i + 1 < argc) {
        faults.swap_prob = std::stod(argv[++i]);
      } else if (a == "--dup" && i + 1 < argc) {
        faults.duplicate_prob = std::stod(argv[++i]);
      } else if (a == "--drop" && i + 1 < argc) {
        faults.drop_prob = std::stod(argv[++i]);
      } else if (a == "--read") {
        read_mode = true;
      } else if (a == "--dump" && i + 1 < argc) {
        dump_n = std::stoi(argv[++i]);
      } else if (a == "--levels" && i + 1 < argc) {
        show_levels = std::stoull(argv[++i]);
      } else {
        rest.push_back(argv[i]);
      }
    }

    ReplayConfig cfg = parse_config(static_cast<int>(rest.size()), rest.data());
    cfg.validate();

    if (record_n > 0) {
      if (cfg.journal_path.empty())
        throw std::invalid_argument("--record needs --journal PATH");
      gen.events = record_n;
      auto t0 = std::chrono::steady_clock::now();
      auto events = generate_stream(gen);
      EventJournalWriter journal(cfg.journal_path);
      for (const auto& e : events) journal.append(cfg.instrument_id, e);
      journal.flush();
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - t0)
                    .count();
      std::cout << "[Record] " << cfg.instrument_id << ": " << events.size()
                << " events (" << record_n << " deltas) -> "
                << cfg.journal_path << " in " << ms << " ms\n";
      return 0;
    }

    if (read_mode) {
      if (cfg.journal_path.empty())
        throw std::invalid_argument("--read needs --journal PATH");
      EventJournalReader reader(cfg.journal_path);
      auto instruments = reader.list_instruments();
      if (instruments.empty()) {
        std::cout << "No instruments found in " << cfg.journal_path << "\n";
        return 0;
      }
      for (auto& id : instruments) {
        auto events = reader.read_all(id);
        std::cout << id << ": " << events.size() << " events";
        if (!events.empty())
          std::cout << " (seq " << events.front().seq << ".."
                    << events.back().seq << ")";
        std::cout << "\n";
        for (int i = 0; i < dump_n && i < static_cast<int>(events.size()); ++i)
          std::cout << " " << events[static_cast<std::size_t>(i)].to_string()
                    << "\n";
      }
      return 0;
    }

    std::unique_ptr<FeedSource> feed;
    if (!cfg.feed_target.empty()) {
      feed = std::make_unique<GrpcFeedSource>(cfg.feed_target,
                                              cfg.instrument_id);
    } else if (!cfg.journal_path.empty()) {
      std::vector<DeltaEvent> history;
      {
        EventJournalReader reader(cfg.journal_path);
        history = reader.read_all(cfg.instrument_id);
      }
      auto arrivals = perturb(history, faults);
      feed = std::make_unique<VectorFeedSource>(std::move(arrivals),
                                                std::move(history), cfg.top_n);
    } else {
      throw std::invalid_argument("need --journal PATH or --feed HOST:PORT");
    }

    auto store = make_checkpoint_store(cfg.checkpoint_path,
                                       cfg.checkpoints_to_keep);
    Pipeline pipeline(cfg, *feed, *store);
    g_pipeline.store(&pipeline);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto t0 = std::chrono::steady_clock::now();
    pipeline.start();
    const uint64_t consumed = pipeline.run();
    pipeline.shutdown();
    g_pipeline.store(nullptr);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  std::chrono::steady_clock::now() - t0)
                  .count();

    std::cout << pipeline.health().to_string();
    std::cout << "Events consumed:   " << consumed << "\n"
              << "Elapsed:           " << us / 1000.0 << " ms\n"
              << "Throughput:        "
              << (us > 0 ? static_cast<uint64_t>(consumed * 1e6 / us) : 0)
              << " ev/s\n";
    if (auto v = pipeline.view()) print_book(*v, show_levels);
    return pipeline.failed() ? 2 : 0;
  } catch (const std::exception& ex) {
    g_pipeline.store(nullptr);
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
