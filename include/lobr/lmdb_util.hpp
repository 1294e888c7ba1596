#pragma once
#include <lmdb.h>

#include <array>
#include <cstdint>
#include <string>

#include "lobr/errors.hpp"

namespace lobr {

// Sequence keys are stored big-endian so LMDB's byte order is numeric order.
inline std::array<uint8_t, 8> be64_key(uint64_t v) {
  std::array<uint8_t, 8> out{};
  for (int i = 7; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = static_cast<uint8_t>(v & 0xFF);
    v >>= 8;
  }
  return out;
}

inline uint64_t be64_value(const MDB_val& v) {
  if (v.mv_size != 8) throw StorageError("LMDB key is not a 64-bit sequence");
  const auto* p = static_cast<const uint8_t*>(v.mv_data);
  uint64_t out = 0;
  for (int i = 0; i < 8; ++i) out = (out << 8) | p[i];
  return out;
}

inline void lmdb_check(int rc, const char* what) {
  if (rc != MDB_SUCCESS)
    throw StorageError(std::string(what) + " failed: " + mdb_strerror(rc));
}

// Aborts a transaction on scope exit unless commit() succeeded.
class LmdbTxn {
 public:
  LmdbTxn(MDB_env* env, unsigned flags) {
    lmdb_check(mdb_txn_begin(env, nullptr, flags, &txn_), "mdb_txn_begin");
  }
  ~LmdbTxn() {
    if (txn_) mdb_txn_abort(txn_);
  }
  LmdbTxn(const LmdbTxn&) = delete;
  LmdbTxn& operator=(const LmdbTxn&) = delete;

  MDB_txn* get() const { return txn_; }

  void commit() {
    MDB_txn* t = txn_;
    txn_ = nullptr;
    lmdb_check(mdb_txn_commit(t), "mdb_txn_commit");
  }

 private:
  MDB_txn* txn_ = nullptr;
};

}  // namespace lobr
