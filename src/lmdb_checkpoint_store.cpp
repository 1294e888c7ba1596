#include "lobr/lmdb_checkpoint_store.hpp"

#include <filesystem>

#include "lobr/errors.hpp"
#include "lobr/lmdb_util.hpp"
#include "lobr/log.hpp"

namespace fs = std::filesystem;
namespace lobr {

LmdbCheckpointStore::LmdbCheckpointStore(const std::string& path,
                                         std::size_t keep_last,
                                         size_t map_size_bytes)
    : path_(path), keep_last_(keep_last) {
  std::error_code ec;
  fs::create_directories(path_, ec);
  if (ec) throw StorageError("cannot create " + path_ + ": " + ec.message());

  lmdb_check(mdb_env_create(&env_), "mdb_env_create");
  mdb_env_set_mapsize(env_, map_size_bytes);
  mdb_env_set_maxdbs(env_, 64);
  int rc = mdb_env_open(env_, path_.c_str(), 0, 0664);
  if (rc) {
    safe_err("[LMDBCheckpointStore] mdb_env_open failed (", rc,
             "): ", mdb_strerror(rc), " path=", path_);
    mdb_env_close(env_);
    env_ = nullptr;
    throw StorageError("mdb_env_open failed: " + path_);
  }
}

LmdbCheckpointStore::~LmdbCheckpointStore() {
  if (env_) mdb_env_close(env_);
}

bool LmdbCheckpointStore::dbi_for_instrument(MDB_txn* txn,
                                             const std::string& instrument_id,
                                             bool create, MDB_dbi& out) {
  auto it = dbis_.find(instrument_id);
  if (it != dbis_.end()) {
    out = it->second;
    return true;
  }
  int rc = mdb_dbi_open(txn, instrument_id.c_str(), create ? MDB_CREATE : 0,
                        &out);
  if (rc == MDB_NOTFOUND && !create) return false;
  lmdb_check(rc, "mdb_dbi_open");
  return true;
}

// A handle opened inside a transaction outlives it only if that
// transaction commits, so handles are cached after commit.
void LmdbCheckpointStore::remember(const std::string& instrument_id,
                                   MDB_dbi dbi) {
  dbis_.emplace(instrument_id, dbi);
}

void LmdbCheckpointStore::write(const CheckpointBlob& cp) {
  std::lock_guard<std::mutex> lock(mtx_);
  LmdbTxn txn(env_, 0);
  MDB_dbi dbi;
  dbi_for_instrument(txn.get(), cp.instrument_id, true, dbi);

  auto k = be64_key(cp.valid_through);
  MDB_val key{k.size(), k.data()};
  MDB_val val{cp.bytes.size(), const_cast<char*>(cp.bytes.data())};
  lmdb_check(mdb_put(txn.get(), dbi, &key, &val, 0), "mdb_put");

  if (keep_last_ > 0) {
    MDB_stat st;
    lmdb_check(mdb_stat(txn.get(), dbi, &st), "mdb_stat");
    std::size_t excess =
        st.ms_entries > keep_last_ ? st.ms_entries - keep_last_ : 0;
    if (excess > 0) {
      // Write-txn cursors are released with the txn if a check throws.
      MDB_cursor* cur = nullptr;
      lmdb_check(mdb_cursor_open(txn.get(), dbi, &cur), "mdb_cursor_open");
      MDB_val ck, cv;
      for (; excess > 0; --excess) {
        lmdb_check(mdb_cursor_get(cur, &ck, &cv, MDB_FIRST), "mdb_cursor_get");
        lmdb_check(mdb_cursor_del(cur, 0), "mdb_cursor_del");
      }
      mdb_cursor_close(cur);
    }
  }
  txn.commit();
  remember(cp.instrument_id, dbi);
}

std::vector<uint64_t> LmdbCheckpointStore::list(
    const std::string& instrument_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<uint64_t> out;
  LmdbTxn txn(env_, MDB_RDONLY);
  MDB_dbi dbi;
  if (!dbi_for_instrument(txn.get(), instrument_id, false, dbi)) return out;

  MDB_cursor* cur = nullptr;
  lmdb_check(mdb_cursor_open(txn.get(), dbi, &cur), "mdb_cursor_open");
  MDB_val key, val;
  int rc = mdb_cursor_get(cur, &key, &val, MDB_LAST);
  while (rc == MDB_SUCCESS) {
    out.push_back(be64_value(key));
    rc = mdb_cursor_get(cur, &key, &val, MDB_PREV);
  }
  mdb_cursor_close(cur);
  if (rc != MDB_NOTFOUND) lmdb_check(rc, "mdb_cursor_get");
  txn.commit();
  remember(instrument_id, dbi);
  return out;
}

std::string LmdbCheckpointStore::read(const std::string& instrument_id,
                                      uint64_t valid_through) {
  std::lock_guard<std::mutex> lock(mtx_);
  LmdbTxn txn(env_, MDB_RDONLY);
  MDB_dbi dbi;
  if (!dbi_for_instrument(txn.get(), instrument_id, false, dbi))
    throw StorageError("no checkpoints for " + instrument_id);

  auto k = be64_key(valid_through);
  MDB_val key{k.size(), k.data()};
  MDB_val val;
  lmdb_check(mdb_get(txn.get(), dbi, &key, &val), "mdb_get");
  // Copy out before the read txn ends.
  std::string out(static_cast<const char*>(val.mv_data), val.mv_size);
  txn.commit();
  remember(instrument_id, dbi);
  return out;
}

std::unique_ptr<ICheckpointStore> make_lmdb_checkpoint_store(
    const std::string& path, std::size_t keep_last) {
  return std::make_unique<LmdbCheckpointStore>(path, keep_last);
}

}  // namespace lobr
