#pragma once
#include <string>

#include "lobr/errors.hpp"
#include "lobr/event.hpp"
#include "replay.pb.h"

namespace lobr {

// Converts internal DeltaEvent <-> protobuf DeltaEvent
struct EventConvert {
  static void to_proto(const DeltaEvent& src, lobr::rpc::DeltaEvent* dst) {
    dst->set_seq(src.seq);
    dst->set_type(static_cast<lobr::rpc::EventType>(src.type));
    dst->set_side(static_cast<lobr::rpc::Side>(src.side));
    dst->set_order_id(src.order_id);
    dst->set_price(src.price);
    dst->set_size(src.size);
    dst->set_event_time_ns(src.event_time_ns);
  }

  // Throws FeedError on an unset or unknown enum value.
  static DeltaEvent from_proto(const lobr::rpc::DeltaEvent& p) {
    if (p.type() < lobr::rpc::ADD || p.type() > lobr::rpc::SNAPSHOT_END)
      throw FeedError("event #" + std::to_string(p.seq()) + ": bad type " +
                      std::to_string(p.type()));
    // Only ADD needs a side; the order index owns it afterwards.
    lobr::rpc::Side side = p.side();
    if (side == lobr::rpc::SIDE_UNSPECIFIED && p.type() != lobr::rpc::ADD)
      side = lobr::rpc::BID;
    if (side != lobr::rpc::BID && side != lobr::rpc::ASK)
      throw FeedError("event #" + std::to_string(p.seq()) + ": bad side " +
                      std::to_string(p.side()));
    return DeltaEvent{p.seq(),
                      static_cast<EventType>(p.type()),
                      static_cast<Side>(side),
                      p.order_id(),
                      p.price(),
                      p.size(),
                      p.event_time_ns()};
  }
};

}  // namespace lobr
