#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "lobr/checkpoint.hpp"

namespace lobr {

// Durable home for encoded checkpoints. write() runs on the persistence
// worker, list()/read() on the pipeline thread during recovery, so
// implementations are safe to call from both. Failures throw StorageError.
struct ICheckpointStore {
  virtual ~ICheckpointStore() = default;
  virtual void write(const CheckpointBlob& cp) = 0;
  // valid-through sequences, newest first
  virtual std::vector<uint64_t> list(const std::string& instrument_id) = 0;
  virtual std::string read(const std::string& instrument_id,
                           uint64_t valid_through) = 0;
};

class MemoryCheckpointStore : public ICheckpointStore {
 public:
  explicit MemoryCheckpointStore(std::size_t keep_last = 3)
      : keep_last_(keep_last) {}

  void write(const CheckpointBlob& cp) override;
  std::vector<uint64_t> list(const std::string& instrument_id) override;
  std::string read(const std::string& instrument_id,
                   uint64_t valid_through) override;

 private:
  std::size_t keep_last_;
  std::mutex mtx_;
  std::map<std::string, std::map<uint64_t, std::string>> records_;
};

// <root>/<instrument>/<valid_through, 20 digits>.ckpt, written to a temp
// file and renamed into place so a crash never leaves a torn record under
// the final name.
class DirectoryCheckpointStore : public ICheckpointStore {
 public:
  DirectoryCheckpointStore(const std::string& root, std::size_t keep_last);

  void write(const CheckpointBlob& cp) override;
  std::vector<uint64_t> list(const std::string& instrument_id) override;
  std::string read(const std::string& instrument_id,
                   uint64_t valid_through) override;

 private:
  std::string file_for(const std::string& instrument_id,
                       uint64_t valid_through) const;
  void prune(const std::string& instrument_id);

  std::string root_;
  std::size_t keep_last_;
  std::mutex mtx_;
};

// "" -> in memory, *.mdb -> LMDB, anything else -> directory.
std::unique_ptr<ICheckpointStore> make_checkpoint_store(const std::string& path,
                                                        std::size_t keep_last);

}  // namespace lobr
