#pragma once
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace lobr {

enum class EventType : uint8_t {
  ADD = 1,
  UPDATE = 2,
  CANCEL = 3,
  SNAPSHOT_BEGIN = 4,
  SNAPSHOT_END = 5
};

enum class Side : uint8_t { BID = 1, ASK = 2 };

inline const char* to_cstr(EventType t) {
  switch (t) {
    case EventType::ADD:
      return "ADD";
    case EventType::UPDATE:
      return "UPD";
    case EventType::CANCEL:
      return "CXL";
    case EventType::SNAPSHOT_BEGIN:
      return "SNAP_BEGIN";
    case EventType::SNAPSHOT_END:
      return "SNAP_END";
  }
  return "?";
}

inline const char* to_cstr(Side s) { return s == Side::BID ? "BID" : "ASK"; }

inline bool is_snapshot_marker(EventType t) {
  return t == EventType::SNAPSHOT_BEGIN || t == EventType::SNAPSHOT_END;
}

// One inbound delta. Snapshot frames (BEGIN, body ADDs, END) all carry the
// sequence number the snapshot is valid through. order_id is 0 on markers.
struct DeltaEvent {
  uint64_t seq{};
  EventType type{};
  Side side{Side::BID};
  uint64_t order_id{};
  int64_t price{};  // scaled
  int64_t size{};   // scaled
  uint64_t event_time_ns{};

  static DeltaEvent add(uint64_t seq, Side side, uint64_t id, int64_t price,
                        int64_t size, uint64_t ts = 0) {
    return DeltaEvent{seq, EventType::ADD, side, id, price, size, ts};
  }
  // Side on UPDATE/CANCEL is informational; the order index is authoritative.
  static DeltaEvent update(uint64_t seq, uint64_t id, int64_t price,
                           int64_t size, uint64_t ts = 0) {
    return DeltaEvent{seq, EventType::UPDATE, Side::BID, id, price, size, ts};
  }
  static DeltaEvent cancel(uint64_t seq, uint64_t id, uint64_t ts = 0) {
    return DeltaEvent{seq, EventType::CANCEL, Side::BID, id, 0, 0, ts};
  }
  static DeltaEvent snapshot_begin(uint64_t seq, uint64_t ts = 0) {
    return DeltaEvent{seq, EventType::SNAPSHOT_BEGIN, Side::BID, 0, 0, 0, ts};
  }
  static DeltaEvent snapshot_end(uint64_t seq, uint64_t ts = 0) {
    return DeltaEvent{seq, EventType::SNAPSHOT_END, Side::BID, 0, 0, 0, ts};
  }

  std::string to_string() const {
    char buf[160];
    snprintf(buf, sizeof(buf), "#%llu [%s] %s id=%llu %lld x %lld t=%llu",
             (unsigned long long)seq, to_cstr(type), to_cstr(side),
             (unsigned long long)order_id, (long long)price, (long long)size,
             (unsigned long long)event_time_ns);
    return buf;
  }

  static constexpr size_t serialized_size() noexcept {
    return sizeof(seq) + 1 + 1 + sizeof(order_id) + sizeof(price) +
           sizeof(size) + sizeof(event_time_ns);
  }

  // Host-endian, fixed width. Used by the journal; not a network format.
  std::vector<uint8_t> serialize() const {
    std::vector<uint8_t> out;
    out.reserve(serialized_size());
    auto put = [&](auto v) {
      const uint8_t* p = reinterpret_cast<const uint8_t*>(&v);
      out.insert(out.end(), p, p + sizeof(v));
    };
    put(seq);
    out.push_back(static_cast<uint8_t>(type));
    out.push_back(static_cast<uint8_t>(side));
    put(order_id);
    put(price);
    put(size);
    put(event_time_ns);
    return out;
  }

  static std::optional<DeltaEvent> deserialize(const uint8_t* data, size_t len,
                                               size_t& consumed) {
    if (len < serialized_size()) return std::nullopt;
    size_t off = 0;
    auto get = [&](auto& v) {
      std::memcpy(&v, data + off, sizeof(v));
      off += sizeof(v);
    };
    DeltaEvent e;
    get(e.seq);
    const uint8_t t = data[off++];
    const uint8_t s = data[off++];
    if (t < static_cast<uint8_t>(EventType::ADD) ||
        t > static_cast<uint8_t>(EventType::SNAPSHOT_END))
      return std::nullopt;
    if (s != static_cast<uint8_t>(Side::BID) &&
        s != static_cast<uint8_t>(Side::ASK))
      return std::nullopt;
    e.type = static_cast<EventType>(t);
    e.side = static_cast<Side>(s);
    get(e.order_id);
    get(e.price);
    get(e.size);
    get(e.event_time_ns);
    consumed = off;
    return e;
  }
};

}  // namespace lobr
