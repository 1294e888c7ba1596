#include "lobr/grpc_feed_source.hpp"

#include <vector>

#include "lobr/errors.hpp"
#include "lobr/event_convert.hpp"
#include "lobr/log.hpp"

namespace lobr {

GrpcFeedSource::GrpcFeedSource(const std::string& target,
                               const std::string& instrument_id,
                               std::chrono::milliseconds rpc_timeout)
    : target_(target),
      instrument_id_(instrument_id),
      rpc_timeout_(rpc_timeout),
      channel_(grpc::CreateChannel(target, grpc::InsecureChannelCredentials())),
      stub_(rpc::DeltaFeed::NewStub(channel_)) {}

GrpcFeedSource::~GrpcFeedSource() { stop_stream(); }

void GrpcFeedSource::enqueue_locked(const rpc::EventBatch& batch) {
  for (const auto& p : batch.events()) queue_.push_back(EventConvert::from_proto(p));
}

void GrpcFeedSource::stop_stream() {
  if (stream_ctx_) stream_ctx_->TryCancel();
  if (reader_.joinable()) reader_.join();
  stream_.reset();
  stream_ctx_.reset();
  std::lock_guard<std::mutex> lock(mtx_);
  stream_done_ = true;
}

bool GrpcFeedSource::subscribe(uint64_t from) {
  stop_stream();

  rpc::ResumeRequest req;
  req.set_instrument_id(instrument_id_);
  req.set_from_sequence(from);

  auto ctx = std::make_unique<grpc::ClientContext>();
  auto stream = stub_->Subscribe(ctx.get(), req);

  // The server answers with one batch (possibly empty) before streaming, or
  // finishes at once if it cannot serve the position.
  rpc::EventBatch first;
  if (!stream->Read(&first)) {
    grpc::Status st = stream->Finish();
    if (st.error_code() == grpc::StatusCode::OUT_OF_RANGE ||
        st.error_code() == grpc::StatusCode::FAILED_PRECONDITION) {
      safe_err("[GrpcFeed] ", target_, " cannot resume at ", from, ": ",
               st.error_message());
      return false;
    }
    throw FeedError("subscribe to " + target_ + " failed: " +
                    st.error_message());
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.clear();
    enqueue_locked(first);
    stream_done_ = false;
  }
  stream_ctx_ = std::move(ctx);
  stream_ = std::move(stream);
  reader_ = std::thread([this, s = stream_.get()] { reader_loop(s); });
  return true;
}

void GrpcFeedSource::reader_loop(grpc::ClientReader<rpc::EventBatch>* stream) {
  rpc::EventBatch batch;
  while (stream->Read(&batch)) {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
      enqueue_locked(batch);
    } catch (const FeedError& e) {
      safe_err("[GrpcFeed] dropping malformed batch: ", e.what());
    }
    cv_.notify_one();
  }
  grpc::Status st = stream->Finish();
  if (!st.ok() && st.error_code() != grpc::StatusCode::CANCELLED)
    safe_err("[GrpcFeed] stream from ", target_, " ended: ", st.error_message());
  std::lock_guard<std::mutex> lock(mtx_);
  stream_done_ = true;
  cv_.notify_one();
}

bool GrpcFeedSource::resume(uint64_t seq) { return subscribe(seq); }

void GrpcFeedSource::request_snapshot() {
  rpc::SnapshotRequest req;
  req.set_instrument_id(instrument_id_);
  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);

  std::vector<DeltaEvent> frame;
  auto reader = stub_->Snapshot(&ctx, req);
  rpc::EventBatch batch;
  while (reader->Read(&batch))
    for (const auto& p : batch.events())
      frame.push_back(EventConvert::from_proto(p));
  grpc::Status st = reader->Finish();
  if (!st.ok())
    throw FeedError("snapshot from " + target_ + " failed: " +
                    st.error_message());
  if (frame.size() < 2 || frame.front().type != EventType::SNAPSHOT_BEGIN ||
      frame.back().type != EventType::SNAPSHOT_END)
    throw FeedError("snapshot from " + target_ + " is not a complete frame");

  // Live deltas continue right after the frame.
  const uint64_t through = frame.front().seq;
  if (!subscribe(through + 1))
    throw FeedError("cannot follow snapshot at " + std::to_string(through));

  std::lock_guard<std::mutex> lock(mtx_);
  queue_.insert(queue_.begin(), frame.begin(), frame.end());
  cv_.notify_one();
}

std::optional<DeltaEvent> GrpcFeedSource::next(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || stream_done_; });
  if (queue_.empty()) return std::nullopt;
  DeltaEvent e = queue_.front();
  queue_.pop_front();
  return e;
}

bool GrpcFeedSource::exhausted() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return stream_done_ && queue_.empty();
}

}  // namespace lobr
