#include "lobr/snapshot_frame.hpp"

#include <algorithm>

namespace lobr {

std::vector<DeltaEvent> make_snapshot_frame(const BookState& state) {
  const uint64_t s = state.applied_through();
  std::vector<DeltaEvent> frame;
  frame.reserve(state.order_count() + 2);
  frame.push_back(DeltaEvent::snapshot_begin(s));

  std::vector<std::pair<uint64_t, OrderEntry>> orders;
  orders.reserve(state.order_count());
  state.for_each_order([&](uint64_t id, const OrderEntry& o) {
    orders.emplace_back(id, o);
  });
  // Stable output for identical books.
  std::sort(orders.begin(), orders.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  for (const auto& kv : orders)
    frame.push_back(DeltaEvent::add(s, kv.second.side, kv.first,
                                    kv.second.price, kv.second.size,
                                    kv.second.ts_ns));

  frame.push_back(DeltaEvent::snapshot_end(s));
  return frame;
}

std::unique_ptr<BookState> replay_history(
    const std::vector<DeltaEvent>& history, uint64_t through,
    std::size_t top_n, std::pmr::memory_resource* mr) {
  auto book = std::make_unique<BookState>(top_n, mr);
  std::unique_ptr<BookState> frame;

  for (const auto& e : history) {
    if (e.seq > through) break;
    switch (e.type) {
      case EventType::SNAPSHOT_BEGIN:
        frame = std::make_unique<BookState>(top_n, mr);
        break;
      case EventType::SNAPSHOT_END:
        if (frame && e.seq >= book->applied_through()) {
          frame->mark_applied(e.seq);
          book = std::move(frame);
        }
        frame.reset();
        break;
      case EventType::ADD:
      case EventType::UPDATE:
      case EventType::CANCEL: {
        const bool in_frame = static_cast<bool>(frame);
        BookState& target = in_frame ? *frame : *book;
        if (!in_frame && e.seq <= book->applied_through()) break;
        if (e.type == EventType::ADD)
          target.add_order(e.order_id, e.side, e.price, e.size,
                           e.event_time_ns);
        else if (e.type == EventType::UPDATE)
          target.update_order(e.order_id, e.price, e.size);
        else
          target.cancel_order(e.order_id);
        if (!in_frame) book->mark_applied(e.seq);
        break;
      }
    }
  }
  // A stream that ends before `through` leaves the book at its last event.
  return book;
}

}  // namespace lobr
