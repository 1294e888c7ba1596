#pragma once
#include <lmdb.h>

#include <mutex>
#include <string>
#include <unordered_map>

#include "lobr/checkpoint_store.hpp"

namespace lobr {

// One named database per instrument; key = big-endian valid-through
// sequence, value = CheckpointRecord bytes. Each call runs in its own
// short transaction.
// The persistence worker writes while recovery may read.
class LmdbCheckpointStore final : public ICheckpointStore {
 public:
  explicit LmdbCheckpointStore(const std::string& path, std::size_t keep_last,
                               size_t map_size_bytes = (1ull << 30));
  ~LmdbCheckpointStore() override;

  void write(const CheckpointBlob& cp) override;
  std::vector<uint64_t> list(const std::string& instrument_id) override;
  std::string read(const std::string& instrument_id,
                   uint64_t valid_through) override;

 private:
  // Returns false if the database does not exist and create is false.
  bool dbi_for_instrument(MDB_txn* txn, const std::string& instrument_id,
                          bool create, MDB_dbi& out);
  void remember(const std::string& instrument_id, MDB_dbi dbi);

  MDB_env* env_ = nullptr;
  std::string path_;
  std::size_t keep_last_;
  // Serializes calls: mdb_dbi_open must not race another transaction.
  std::mutex mtx_;
  std::unordered_map<std::string, MDB_dbi> dbis_;
};

std::unique_ptr<ICheckpointStore> make_lmdb_checkpoint_store(
    const std::string& path, std::size_t keep_last);

}  // namespace lobr
