#pragma once
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "lobr/feed_source.hpp"
#include "replay.grpc.pb.h"

namespace lobr {

// FeedSource over the DeltaFeed service. A background reader drains the
// Subscribe stream into a queue that next() pops from; resume() replaces
// the stream, request_snapshot() fetches one frame and re-subscribes just
// after it.
class GrpcFeedSource : public FeedSource {
 public:
  GrpcFeedSource(const std::string& target, const std::string& instrument_id,
                 std::chrono::milliseconds rpc_timeout =
                     std::chrono::milliseconds(2000));
  ~GrpcFeedSource() override;

  bool resume(uint64_t seq) override;
  void request_snapshot() override;
  std::optional<DeltaEvent> next(std::chrono::milliseconds timeout) override;
  bool exhausted() const override;

 private:
  // Returns false if the server refuses the position.
  bool subscribe(uint64_t from);
  void stop_stream();
  void reader_loop(grpc::ClientReader<rpc::EventBatch>* stream);
  void enqueue_locked(const rpc::EventBatch& batch);

  std::string target_;
  std::string instrument_id_;
  std::chrono::milliseconds rpc_timeout_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<rpc::DeltaFeed::Stub> stub_;

  std::unique_ptr<grpc::ClientContext> stream_ctx_;
  std::unique_ptr<grpc::ClientReader<rpc::EventBatch>> stream_;
  std::thread reader_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<DeltaEvent> queue_;
  bool stream_done_ = true;
};

}  // namespace lobr
