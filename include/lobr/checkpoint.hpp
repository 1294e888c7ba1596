#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <memory_resource>
#include <string>

#include "lobr/book_state.hpp"

namespace lobr {

// 64-bit integrity hash over a byte string (SplitMix64 finalizer over
// little-endian words, length folded in).
uint64_t checksum64(const std::string& bytes);

// BookStateSnapshot protobuf bytes for one state.
std::string encode_book(const BookState& state, int64_t price_scale);

// Rebuilds a state from encode_book() output. The stored levels must match
// what the orders add up to; otherwise CheckpointError.
std::unique_ptr<BookState> decode_book(const std::string& bytes,
                                       std::size_t top_n,
                                       std::pmr::memory_resource* mr,
                                       std::size_t index_capacity = 1024);

// Immutable on-store form of a checkpoint, already encoded.
struct CheckpointBlob {
  std::string instrument_id;
  uint64_t valid_through = 0;
  std::string bytes;  // CheckpointRecord protobuf
};

CheckpointBlob encode_checkpoint(const BookState& state,
                                 const std::string& instrument_id,
                                 int64_t price_scale, uint64_t created_at_ns);

struct RestoredCheckpoint {
  uint64_t valid_through = 0;
  uint64_t created_at_ns = 0;
  std::unique_ptr<BookState> state;
};

// Verifies instrument, checksum and conservation. Throws CheckpointError.
RestoredCheckpoint decode_checkpoint(const std::string& record,
                                     const std::string& instrument_id,
                                     std::size_t top_n,
                                     std::pmr::memory_resource* mr,
                                     std::size_t index_capacity = 1024);

uint64_t wall_clock_ns();

}  // namespace lobr
