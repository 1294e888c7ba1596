#include "lobr/checkpoint.hpp"

#include <chrono>
#include <cstring>
#include <vector>

#include "lobr/errors.hpp"
#include "lobr/rng.hpp"
#include "replay.pb.h"

namespace lobr {

namespace {

void put_levels(const std::vector<LevelView>& levels,
                google::protobuf::RepeatedPtrField<rpc::Level>* out) {
  out->Reserve(static_cast<int>(levels.size()));
  for (const auto& lv : levels) {
    rpc::Level* l = out->Add();
    l->set_price(lv.price);
    l->set_volume(lv.volume);
  }
}

std::vector<LevelView> get_levels(
    const google::protobuf::RepeatedPtrField<rpc::Level>& a,
    const google::protobuf::RepeatedPtrField<rpc::Level>& b) {
  std::vector<LevelView> out;
  out.reserve(static_cast<std::size_t>(a.size() + b.size()));
  for (const auto& l : a) out.push_back(LevelView{l.price(), l.volume()});
  for (const auto& l : b) out.push_back(LevelView{l.price(), l.volume()});
  return out;
}

}  // namespace

uint64_t checksum64(const std::string& bytes) {
  uint64_t h = kGoldenGamma ^ bytes.size();
  std::size_t i = 0;
  for (; i + 8 <= bytes.size(); i += 8) {
    uint64_t w;
    std::memcpy(&w, bytes.data() + i, 8);
    h = splitmix_finalize(h + w + kGoldenGamma);
  }
  uint64_t tail = 0;
  for (std::size_t k = 0; i < bytes.size(); ++i, ++k)
    tail |= static_cast<uint64_t>(static_cast<unsigned char>(bytes[i]))
            << (8 * k);
  return splitmix_finalize(h ^ tail);
}

uint64_t wall_clock_ns() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

std::string encode_book(const BookState& state, int64_t price_scale) {
  rpc::BookStateSnapshot snap;
  snap.set_top_n(static_cast<uint32_t>(state.top_n()));
  snap.set_price_scale(price_scale);
  snap.set_applied_through(state.applied_through());

  snap.mutable_orders()->Reserve(static_cast<int>(state.order_count()));
  state.for_each_order([&](uint64_t id, const OrderEntry& o) {
    rpc::RestingOrder* r = snap.add_orders();
    r->set_order_id(id);
    r->set_side(static_cast<rpc::Side>(o.side));
    r->set_price(o.price);
    r->set_size(o.size);
    r->set_ts_ns(o.ts_ns);
  });

  put_levels(state.bids().near_levels(), snap.mutable_bid_near());
  put_levels(state.bids().sorted_deep(), snap.mutable_bid_deep());
  put_levels(state.asks().near_levels(), snap.mutable_ask_near());
  put_levels(state.asks().sorted_deep(), snap.mutable_ask_deep());

  std::string out;
  if (!snap.SerializeToString(&out))
    throw CheckpointError("BookStateSnapshot serialization failed");
  return out;
}

std::unique_ptr<BookState> decode_book(const std::string& bytes,
                                       std::size_t top_n,
                                       std::pmr::memory_resource* mr,
                                       std::size_t index_capacity) {
  rpc::BookStateSnapshot snap;
  if (!snap.ParseFromString(bytes))
    throw CheckpointError("BookStateSnapshot does not parse");

  const std::size_t want = static_cast<std::size_t>(snap.orders_size()) * 2;
  auto state = std::make_unique<BookState>(
      top_n, mr, want > index_capacity ? want : index_capacity);

  try {
    for (const auto& r : snap.orders()) {
      if (r.side() != rpc::BID && r.side() != rpc::ASK)
        throw CheckpointError("order " + std::to_string(r.order_id()) +
                              " has no side");
      const auto out = state->add_order(r.order_id(),
                                        static_cast<Side>(r.side()), r.price(),
                                        r.size(), r.ts_ns());
      if (out != ApplyOutcome::APPLIED)
        throw CheckpointError("order " + std::to_string(r.order_id()) +
                              " stored twice");
    }
    state->mark_applied(snap.applied_through());
    state->check_conservation();
  } catch (const ConsistencyError& e) {
    throw CheckpointError(std::string("restored state inconsistent: ") +
                          e.what());
  }

  // Tier split depends on top_n; compare the full best-first ladders.
  if (state->bids().all_levels() !=
          get_levels(snap.bid_near(), snap.bid_deep()) ||
      state->asks().all_levels() !=
          get_levels(snap.ask_near(), snap.ask_deep())) {
    throw CheckpointError("stored levels do not match the resting orders");
  }
  return state;
}

CheckpointBlob encode_checkpoint(const BookState& state,
                                 const std::string& instrument_id,
                                 int64_t price_scale, uint64_t created_at_ns) {
  rpc::CheckpointRecord rec;
  rec.set_instrument_id(instrument_id);
  rec.set_valid_through_sequence(state.applied_through());
  rec.set_created_at_ns(created_at_ns);
  rec.set_serialized_book_state(encode_book(state, price_scale));
  rec.set_integrity_checksum(checksum64(rec.serialized_book_state()));

  CheckpointBlob blob;
  blob.instrument_id = instrument_id;
  blob.valid_through = state.applied_through();
  if (!rec.SerializeToString(&blob.bytes))
    throw CheckpointError("CheckpointRecord serialization failed");
  return blob;
}

RestoredCheckpoint decode_checkpoint(const std::string& record,
                                     const std::string& instrument_id,
                                     std::size_t top_n,
                                     std::pmr::memory_resource* mr,
                                     std::size_t index_capacity) {
  rpc::CheckpointRecord rec;
  if (!rec.ParseFromString(record))
    throw CheckpointError("CheckpointRecord does not parse");
  if (rec.instrument_id() != instrument_id)
    throw CheckpointError("checkpoint is for " + rec.instrument_id() +
                          ", not " + instrument_id);
  const uint64_t sum = checksum64(rec.serialized_book_state());
  if (sum != rec.integrity_checksum())
    throw CheckpointError("checksum mismatch at " +
                          std::to_string(rec.valid_through_sequence()));

  RestoredCheckpoint out;
  out.valid_through = rec.valid_through_sequence();
  out.created_at_ns = rec.created_at_ns();
  out.state = decode_book(rec.serialized_book_state(), top_n, mr,
                          index_capacity);
  if (out.state->applied_through() != out.valid_through)
    throw CheckpointError("record and book disagree on valid-through");
  return out;
}

}  // namespace lobr
