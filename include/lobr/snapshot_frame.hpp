#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <memory_resource>
#include <vector>

#include "lobr/book_state.hpp"
#include "lobr/event.hpp"

namespace lobr {

// BEGIN, one ADD per resting order (insertion time kept), END; all at
// state.applied_through().
std::vector<DeltaEvent> make_snapshot_frame(const BookState& state);

// Rebuilds the book a source would hold after applying its recorded stream
// through `through`. Events must be in sequence order; a frame replaces the
// book, live events are applied as they come (unknown ids and repeated adds
// are skipped). Throws ConsistencyError if the stream drives a level
// negative or carries a non-positive order size.
std::unique_ptr<BookState> replay_history(
    const std::vector<DeltaEvent>& history, uint64_t through,
    std::size_t top_n,
    std::pmr::memory_resource* mr = std::pmr::new_delete_resource());

}  // namespace lobr
