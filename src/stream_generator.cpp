#include "lobr/stream_generator.hpp"

#include <algorithm>
#include <cmath>
#include <memory_resource>

#include "lobr/book_state.hpp"
#include "lobr/rng.hpp"
#include "lobr/snapshot_frame.hpp"

namespace lobr {

namespace {

struct GenState {
  const GeneratorConfig& cfg;
  StreamRng rng;
  BookState book;
  std::vector<uint64_t> live_ids;
  uint64_t next_id = 1;

  explicit GenState(const GeneratorConfig& c)
      : cfg(c), rng(c.seed), book(64, std::pmr::new_delete_resource(), 1024) {}

  Side draw_side() { return rng.coin() ? Side::BID : Side::ASK; }

  int64_t draw_price(Side side) {
    const double d = std::fabs(rng.gaussian(0.0, cfg.sigma_ticks));
    const int64_t ticks = 1 + static_cast<int64_t>(d);
    return side == Side::BID ? cfg.mid_price - ticks * cfg.tick
                             : cfg.mid_price + ticks * cfg.tick;
  }

  int64_t draw_size() { return rng.between(cfg.min_size, cfg.max_size); }

  DeltaEvent make_add(uint64_t seq, uint64_t ts) {
    const Side side = draw_side();
    const uint64_t id = next_id++;
    auto e = DeltaEvent::add(seq, side, id, draw_price(side), draw_size(), ts);
    book.add_order(id, side, e.price, e.size, ts);
    live_ids.push_back(id);
    return e;
  }
};

}  // namespace

std::vector<DeltaEvent> generate_stream(const GeneratorConfig& cfg) {
  GenState g(cfg);
  std::vector<DeltaEvent> out;
  out.reserve(cfg.events + cfg.initial_orders + 2);

  for (std::size_t i = 0; i < cfg.initial_orders; ++i)
    g.make_add(0, cfg.start_ns);
  g.book.mark_applied(0);
  auto frame = make_snapshot_frame(g.book);
  out.insert(out.end(), frame.begin(), frame.end());

  for (uint64_t seq = 1; seq <= cfg.events; ++seq) {
    const uint64_t ts = cfg.start_ns + seq * 1000;
    const double r = g.rng.uniform();

    if (g.live_ids.empty() || r < cfg.add_prob) {
      out.push_back(g.make_add(seq, ts));
    } else if (r < cfg.add_prob + cfg.update_prob) {
      const uint64_t id = g.live_ids[g.rng.pick(g.live_ids.size())];
      const OrderEntry* o = g.book.find(id);
      const int64_t price = g.rng.chance(0.3) ? g.draw_price(o->side)
                                            : o->price;
      const int64_t size = g.draw_size();
      g.book.update_order(id, price, size);
      out.push_back(DeltaEvent::update(seq, id, price, size, ts));
    } else {
      const std::size_t idx = g.rng.pick(g.live_ids.size());
      const uint64_t id = g.live_ids[idx];
      g.live_ids[idx] = g.live_ids.back();
      g.live_ids.pop_back();
      g.book.cancel_order(id);
      out.push_back(DeltaEvent::cancel(seq, id, ts));
    }
    g.book.mark_applied(seq);

    if (cfg.snapshot_every > 0 && seq % cfg.snapshot_every == 0) {
      frame = make_snapshot_frame(g.book);
      out.insert(out.end(), frame.begin(), frame.end());
    }
  }
  return out;
}

std::vector<DeltaEvent> perturb(const std::vector<DeltaEvent>& in,
                                const DeliveryFaults& f) {
  StreamRng rng(f.seed);
  std::vector<DeltaEvent> out;
  std::vector<bool> framed;
  out.reserve(in.size() + in.size() / 8);
  framed.reserve(out.capacity());

  bool in_frame = false;
  for (const auto& e : in) {
    if (e.type == EventType::SNAPSHOT_BEGIN) in_frame = true;
    if (in_frame) {
      out.push_back(e);
      framed.push_back(true);
      if (e.type == EventType::SNAPSHOT_END) in_frame = false;
      continue;
    }
    if (rng.chance(f.drop_prob)) continue;
    out.push_back(e);
    framed.push_back(false);
    if (rng.chance(f.duplicate_prob)) {
      out.push_back(e);
      framed.push_back(false);
    }
  }

  // Live events move forward by at most max_displacement, never across a
  // frame.
  if (f.swap_prob > 0.0 && f.max_displacement > 0) {
    for (std::size_t i = 0; i + 1 < out.size(); ++i) {
      if (framed[i] || !rng.chance(f.swap_prob)) continue;
      const std::size_t d = 1 + rng.pick(f.max_displacement);
      std::size_t j = i;
      while (j < i + d && j + 1 < out.size() && !framed[j + 1]) ++j;
      std::swap(out[i], out[j]);
    }
  }
  return out;
}

}  // namespace lobr
