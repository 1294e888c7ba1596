#include <grpcpp/grpcpp.h>

#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "lobr/errors.hpp"
#include "lobr/event_convert.hpp"
#include "lobr/event_journal.hpp"
#include "lobr/log.hpp"
#include "lobr/snapshot_frame.hpp"
#include "replay.grpc.pb.h"

using namespace lobr;

// Serves a delta journal: Subscribe streams live deltas from a sequence
// onwards and keeps following appends; Snapshot replays the journal and
// sends one frame at its last sequence.
class DeltaFeedService : public lobr::rpc::DeltaFeed::Service {
 public:
  DeltaFeedService(const std::string& journal_path, std::size_t top_n,
                   bool follow)
      : reader_(journal_path), top_n_(top_n), follow_(follow) {}

  grpc::Status Subscribe(grpc::ServerContext* ctx,
                         const lobr::rpc::ResumeRequest* req,
                         grpc::ServerWriter<lobr::rpc::EventBatch>* writer)
      override {
    const std::string& id = req->instrument_id();
    std::vector<DeltaEvent> first;
    if (!read(id, 0, 1, first))
      return grpc::Status(grpc::StatusCode::NOT_FOUND, "unknown instrument " + id);
    if (!first.empty() && req->from_sequence() < first.front().seq)
      return grpc::Status(grpc::StatusCode::OUT_OF_RANGE,
                          "journal starts at " +
                              std::to_string(first.front().seq));

    lobr::rpc::EventBatch ack;
    ack.set_instrument_id(id);
    if (!writer->Write(ack)) return grpc::Status::CANCELLED;

    uint64_t next = req->from_sequence();
    uint64_t sent = 0;
    auto t0 = std::chrono::steady_clock::now();
    std::vector<DeltaEvent> chunk;

    while (!ctx->IsCancelled()) {
      if (!read(id, next, kChunk, chunk))
        return grpc::Status(grpc::StatusCode::INTERNAL, "journal read failed");
      if (chunk.empty()) {
        if (!follow_) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        continue;
      }

      lobr::rpc::EventBatch batch;
      batch.set_instrument_id(id);
      bool in_frame = false;
      for (const auto& e : chunk) {
        // Subscribers get live deltas only; frames come from Snapshot().
        if (e.type == EventType::SNAPSHOT_BEGIN) in_frame = true;
        const bool skip = in_frame || is_snapshot_marker(e.type);
        if (e.type == EventType::SNAPSHOT_END) in_frame = false;
        if (skip) continue;
        EventConvert::to_proto(e, batch.add_events());
        if (batch.events_size() >= static_cast<int>(kBatchSize)) {
          sent += static_cast<uint64_t>(batch.events_size());
          if (!writer->Write(batch)) return grpc::Status::CANCELLED;
          batch.clear_events();
        }
      }
      if (batch.events_size() > 0) {
        sent += static_cast<uint64_t>(batch.events_size());
        if (!writer->Write(batch)) return grpc::Status::CANCELLED;
      }
      next = chunk.back().seq + 1;
    }

    double secs = std::chrono::duration<double>(
                      std::chrono::steady_clock::now() - t0)
                      .count();
    safe_log("[feed] ", id, ": sent ", sent, " events from ",
             req->from_sequence(), " at ", (secs > 0 ? sent / secs : 0.0),
             " ev/s");
    return grpc::Status::OK;
  }

  grpc::Status Snapshot(grpc::ServerContext*,
                        const lobr::rpc::SnapshotRequest* req,
                        grpc::ServerWriter<lobr::rpc::EventBatch>* writer)
      override {
    const std::string& id = req->instrument_id();
    std::vector<DeltaEvent> history;
    if (!read(id, 0, 0, history) || history.empty())
      return grpc::Status(grpc::StatusCode::NOT_FOUND, "no journal for " + id);

    std::vector<DeltaEvent> frame;
    try {
      auto book = replay_history(history, history.back().seq, top_n_);
      frame = make_snapshot_frame(*book);
    } catch (const ConsistencyError& e) {
      return grpc::Status(grpc::StatusCode::DATA_LOSS, e.what());
    }

    lobr::rpc::EventBatch batch;
    batch.set_instrument_id(id);
    for (const auto& e : frame) {
      EventConvert::to_proto(e, batch.add_events());
      if (batch.events_size() >= static_cast<int>(kBatchSize)) {
        if (!writer->Write(batch)) return grpc::Status::CANCELLED;
        batch.clear_events();
      }
    }
    if (batch.events_size() > 0 && !writer->Write(batch))
      return grpc::Status::CANCELLED;
    safe_log("[feed] ", id, ": snapshot through ", frame.front().seq, ", ",
             frame.size() - 2, " orders");
    return grpc::Status::OK;
  }

 private:
  static constexpr std::size_t kBatchSize = 512;
  static constexpr std::size_t kChunk = 8192;

  // One LMDB environment per process; calls are serialized.
  bool read(const std::string& id, uint64_t from, std::size_t limit,
            std::vector<DeltaEvent>& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
      out = reader_.read_from(id, from, limit);
      return true;
    } catch (const StorageError& e) {
      safe_err("[feed] ", e.what());
      return false;
    }
  }

  std::mutex mtx_;
  EventJournalReader reader_;
  std::size_t top_n_;
  bool follow_;
};

int main(int argc, char** argv) {
  std::string addr = "0.0.0.0:50051";
  std::string journal;
  std::size_t top_n = 20;
  bool follow = true;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--listen" && i + 1 < argc)
      addr = argv[++i];
    else if (a == "--journal" && i + 1 < argc)
      journal = argv[++i];
    else if (a == "--top-n" && i + 1 < argc)
      top_n = std::stoull(argv[++i]);
    else if (a == "--no-follow")
      follow = false;
    else if (a == "--help") {
      std::cout << "Usage: " << argv[0]
                << " --journal PATH [--listen ADDR] [--top-n N] [--no-follow]\n";
      return 0;
    }
  }

  try {
    if (journal.empty()) throw std::invalid_argument("--journal is required");
    DeltaFeedService service(journal, top_n, follow);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(addr, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) throw std::runtime_error("cannot listen on " + addr);

    std::cout << "[feed] Serving " << journal << " on " << addr << "\n";
    server->Wait();
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
