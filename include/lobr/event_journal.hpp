#pragma once
#include <lmdb.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "lobr/event.hpp"

namespace lobr {

// Append-only delta journal: one LMDB database per instrument, key =
// big-endian sequence followed by a big-endian ordinal (events sharing a
// sequence, i.e. snapshot frames, keep their append order), value =
// DeltaEvent::serialize().
class EventJournalWriter {
 public:
  explicit EventJournalWriter(const std::string& path,
                              size_t map_size_bytes = (1ull << 30));
  ~EventJournalWriter();

  EventJournalWriter(const EventJournalWriter&) = delete;
  EventJournalWriter& operator=(const EventJournalWriter&) = delete;

  void append(const std::string& instrument_id, const DeltaEvent& e);
  void flush();

  uint64_t appended() const { return appended_; }

 private:
  struct Cursor {
    MDB_dbi dbi;
    uint64_t last_seq = 0;
    uint32_t ordinal = 0;
    bool any = false;
  };

  Cursor& cursor_for(const std::string& instrument_id);
  void begin_txn();
  void commit_txn();

  MDB_env* env_ = nullptr;
  MDB_txn* txn_ = nullptr;
  std::unordered_map<std::string, Cursor> cursors_;
  std::string path_;
  size_t batch_count_ = 0;
  const size_t batch_limit_ = 10000;  // commit every 10k appends
  uint64_t appended_ = 0;
};

class EventJournalReader {
 public:
  explicit EventJournalReader(const std::string& path);
  ~EventJournalReader();

  EventJournalReader(const EventJournalReader&) = delete;
  EventJournalReader& operator=(const EventJournalReader&) = delete;

  std::vector<DeltaEvent> read_all(const std::string& instrument_id);
  // Events with seq >= from, at most `limit` (0 = no limit).
  std::vector<DeltaEvent> read_from(const std::string& instrument_id,
                                    uint64_t from, std::size_t limit = 0);
  std::vector<std::string> list_instruments();

 private:
  MDB_env* env_ = nullptr;
};

}  // namespace lobr
