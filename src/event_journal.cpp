#include "lobr/event_journal.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <filesystem>

#include "lobr/errors.hpp"
#include "lobr/lmdb_util.hpp"
#include "lobr/log.hpp"

namespace fs = std::filesystem;
namespace lobr {

namespace {

using JournalKey = std::array<uint8_t, 12>;

JournalKey journal_key(uint64_t seq, uint32_t ordinal) {
  JournalKey k{};
  const auto s = be64_key(seq);
  std::copy(s.begin(), s.end(), k.begin());
  for (int i = 3; i >= 0; --i) {
    k[8 + static_cast<std::size_t>(i)] = static_cast<uint8_t>(ordinal & 0xFF);
    ordinal >>= 8;
  }
  return k;
}

void split_key(const MDB_val& key, uint64_t& seq, uint32_t& ordinal) {
  if (key.mv_size != 12) throw StorageError("journal key has bad length");
  const auto* p = static_cast<const uint8_t*>(key.mv_data);
  seq = 0;
  for (int i = 0; i < 8; ++i) seq = (seq << 8) | p[i];
  ordinal = 0;
  for (int i = 8; i < 12; ++i) ordinal = (ordinal << 8) | p[i];
}

}  // namespace

// ---------------- writer ----------------

EventJournalWriter::EventJournalWriter(const std::string& path,
                                       size_t map_size_bytes)
    : path_(path) {
  std::error_code ec;
  fs::create_directories(path_, ec);
  if (ec) throw StorageError("cannot create " + path_ + ": " + ec.message());

  lmdb_check(mdb_env_create(&env_), "mdb_env_create");
  mdb_env_set_mapsize(env_, map_size_bytes);
  mdb_env_set_maxdbs(env_, 64);
  int rc = mdb_env_open(env_, path_.c_str(), 0, 0664);
  if (rc) {
    safe_err("[EventJournal] mdb_env_open failed (", rc,
             "): ", mdb_strerror(rc), " path=", path_);
    mdb_env_close(env_);
    env_ = nullptr;
    throw StorageError("mdb_env_open failed: " + path_);
  }
  begin_txn();
}

EventJournalWriter::~EventJournalWriter() {
  try {
    flush();
  } catch (const std::exception& e) {
    safe_err("[EventJournal] final commit failed, last ", batch_count_,
             " appends lost: ", e.what());
  }
  if (txn_) mdb_txn_abort(txn_);
  if (env_) mdb_env_close(env_);
}

void EventJournalWriter::begin_txn() {
  lmdb_check(mdb_txn_begin(env_, nullptr, 0, &txn_), "mdb_txn_begin");
}

void EventJournalWriter::commit_txn() {
  MDB_txn* t = txn_;
  txn_ = nullptr;
  batch_count_ = 0;
  int rc = mdb_txn_commit(t);
  if (rc != MDB_SUCCESS) {
    safe_err("[EventJournal] commit failed: ", mdb_strerror(rc));
    // Handles opened in the lost txn are gone with it.
    cursors_.clear();
    begin_txn();
    throw StorageError(std::string("journal commit failed: ") +
                       mdb_strerror(rc));
  }
  begin_txn();
}

EventJournalWriter::Cursor& EventJournalWriter::cursor_for(
    const std::string& instrument_id) {
  auto it = cursors_.find(instrument_id);
  if (it != cursors_.end()) return it->second;

  Cursor c;
  lmdb_check(mdb_dbi_open(txn_, instrument_id.c_str(), MDB_CREATE, &c.dbi),
             "mdb_dbi_open");

  // Continue after whatever an earlier session appended.
  MDB_cursor* cur = nullptr;
  lmdb_check(mdb_cursor_open(txn_, c.dbi, &cur), "mdb_cursor_open");
  MDB_val key, val;
  if (mdb_cursor_get(cur, &key, &val, MDB_LAST) == MDB_SUCCESS) {
    split_key(key, c.last_seq, c.ordinal);
    c.any = true;
  }
  mdb_cursor_close(cur);
  return cursors_.emplace(instrument_id, c).first->second;
}

void EventJournalWriter::append(const std::string& instrument_id,
                                const DeltaEvent& e) {
  Cursor& c = cursor_for(instrument_id);
  const uint32_t ordinal = (c.any && e.seq == c.last_seq) ? c.ordinal + 1 : 0;
  if (c.any && e.seq < c.last_seq)
    throw StorageError("journal append out of order: " +
                       std::to_string(e.seq) + " after " +
                       std::to_string(c.last_seq));

  const auto k = journal_key(e.seq, ordinal);
  auto buf = e.serialize();
  MDB_val key{k.size(), const_cast<uint8_t*>(k.data())};
  MDB_val val{buf.size(), buf.data()};
  int rc = mdb_put(txn_, c.dbi, &key, &val, 0);
  if (rc) {
    safe_err("[EventJournal] mdb_put failed: ", mdb_strerror(rc));
    throw StorageError(std::string("mdb_put failed: ") + mdb_strerror(rc));
  }
  c.last_seq = e.seq;
  c.ordinal = ordinal;
  c.any = true;
  ++appended_;

  if (++batch_count_ >= batch_limit_) commit_txn();
}

void EventJournalWriter::flush() {
  if (txn_ && batch_count_ > 0) commit_txn();
}

// ---------------- reader ----------------

EventJournalReader::EventJournalReader(const std::string& path) {
  lmdb_check(mdb_env_create(&env_), "mdb_env_create");
  // One database per instrument
  mdb_env_set_maxdbs(env_, 64);
  int rc = mdb_env_open(env_, path.c_str(), MDB_RDONLY, 0664);
  if (rc) {
    mdb_env_close(env_);
    env_ = nullptr;
    throw StorageError("journal " + path + ": " + mdb_strerror(rc));
  }
}

EventJournalReader::~EventJournalReader() {
  if (env_) mdb_env_close(env_);
}

std::vector<DeltaEvent> EventJournalReader::read_all(
    const std::string& instrument_id) {
  return read_from(instrument_id, 0, 0);
}

std::vector<DeltaEvent> EventJournalReader::read_from(
    const std::string& instrument_id, uint64_t from, std::size_t limit) {
  LmdbTxn txn(env_, MDB_RDONLY);
  MDB_dbi dbi;
  int rc = mdb_dbi_open(txn.get(), instrument_id.c_str(), 0, &dbi);
  if (rc == MDB_NOTFOUND)
    throw StorageError("journal has no instrument " + instrument_id);
  lmdb_check(rc, "mdb_dbi_open");

  MDB_cursor* cursor = nullptr;
  lmdb_check(mdb_cursor_open(txn.get(), dbi, &cursor), "mdb_cursor_open");

  auto k = journal_key(from, 0);
  MDB_val key{k.size(), k.data()};
  MDB_val val;
  std::vector<DeltaEvent> out;
  rc = mdb_cursor_get(cursor, &key, &val, MDB_SET_RANGE);
  while (rc == MDB_SUCCESS && (limit == 0 || out.size() < limit)) {
    size_t consumed = 0;
    auto evt = DeltaEvent::deserialize(static_cast<const uint8_t*>(val.mv_data),
                                       val.mv_size, consumed);
    if (!evt) {
      mdb_cursor_close(cursor);
      throw StorageError("journal " + instrument_id +
                         " holds an undecodable record");
    }
    out.push_back(*evt);
    rc = mdb_cursor_get(cursor, &key, &val, MDB_NEXT);
  }
  mdb_cursor_close(cursor);
  if (rc != MDB_SUCCESS && rc != MDB_NOTFOUND) lmdb_check(rc, "mdb_cursor_get");
  return out;
}

std::vector<std::string> EventJournalReader::list_instruments() {
  LmdbTxn txn(env_, MDB_RDONLY);
  MDB_dbi dbi;
  lmdb_check(mdb_dbi_open(txn.get(), nullptr, 0, &dbi), "mdb_dbi_open");

  MDB_cursor* cursor = nullptr;
  lmdb_check(mdb_cursor_open(txn.get(), dbi, &cursor), "mdb_cursor_open");
  MDB_val key, val;
  std::vector<std::string> names;
  while (mdb_cursor_get(cursor, &key, &val, MDB_NEXT) == 0)
    names.emplace_back(static_cast<const char*>(key.mv_data), key.mv_size);
  mdb_cursor_close(cursor);
  return names;
}

}  // namespace lobr
