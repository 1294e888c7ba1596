#include "lobr/feed_source.hpp"

#include <algorithm>
#include <string>

#include "lobr/errors.hpp"
#include "lobr/snapshot_frame.hpp"

namespace lobr {

VectorFeedSource::VectorFeedSource(std::vector<DeltaEvent> arrivals,
                                   std::vector<DeltaEvent> history,
                                   std::size_t top_n)
    : queue_(arrivals.begin(), arrivals.end()),
      history_(std::move(history)),
      top_n_(top_n) {
  if (history_.empty()) {
    history_ = std::move(arrivals);
    // Frames keep BEGIN/body/END order under a stable sort.
    std::stable_sort(history_.begin(), history_.end(),
                     [](const DeltaEvent& a, const DeltaEvent& b) {
                       return a.seq < b.seq;
                     });
  }
}

void VectorFeedSource::maybe_fail(const char* what) {
  if (failures_left_ <= 0) return;
  --failures_left_;
  ++stats_.injected_failures;
  throw FeedError(std::string(what) + ": feed unavailable");
}

bool VectorFeedSource::resume(uint64_t seq) {
  maybe_fail("resume");
  if (!resume_supported_ || seq < retained_from_) return false;

  // A resumed stream carries live deltas only: markers and frame bodies
  // are left out.
  queue_.clear();
  bool in_frame = false;
  for (const auto& e : history_) {
    if (e.type == EventType::SNAPSHOT_BEGIN) in_frame = true;
    const bool skip = in_frame || e.seq < seq;
    if (e.type == EventType::SNAPSHOT_END) in_frame = false;
    if (!skip && !is_snapshot_marker(e.type)) queue_.push_back(e);
  }
  ++stats_.resumes;
  return true;
}

void VectorFeedSource::request_snapshot() {
  maybe_fail("snapshot");
  uint64_t through = high_watermark_;
  if (!history_.empty() && history_.front().seq > through + 1)
    through = history_.front().seq - 1;
  auto book = replay_history(history_, through, top_n_);
  auto frame = make_snapshot_frame(*book);
  for (auto it = frame.rbegin(); it != frame.rend(); ++it)
    queue_.push_front(*it);
  ++stats_.snapshots;
}

std::optional<DeltaEvent> VectorFeedSource::next(std::chrono::milliseconds) {
  if (queue_.empty()) return std::nullopt;
  DeltaEvent e = queue_.front();
  queue_.pop_front();
  if (e.seq > high_watermark_) high_watermark_ = e.seq;
  ++stats_.delivered;
  return e;
}

}  // namespace lobr
