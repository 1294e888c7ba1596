#include "lobr/checkpoint_store.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include "lobr/errors.hpp"
#include "lobr/lmdb_checkpoint_store.hpp"
#include "lobr/log.hpp"

namespace fs = std::filesystem;
namespace lobr {

// ---------------- MemoryCheckpointStore ----------------

void MemoryCheckpointStore::write(const CheckpointBlob& cp) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto& recs = records_[cp.instrument_id];
  recs[cp.valid_through] = cp.bytes;
  while (keep_last_ > 0 && recs.size() > keep_last_) recs.erase(recs.begin());
}

std::vector<uint64_t> MemoryCheckpointStore::list(
    const std::string& instrument_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<uint64_t> out;
  auto it = records_.find(instrument_id);
  if (it == records_.end()) return out;
  for (auto r = it->second.rbegin(); r != it->second.rend(); ++r)
    out.push_back(r->first);
  return out;
}

std::string MemoryCheckpointStore::read(const std::string& instrument_id,
                                        uint64_t valid_through) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = records_.find(instrument_id);
  if (it != records_.end()) {
    auto r = it->second.find(valid_through);
    if (r != it->second.end()) return r->second;
  }
  throw StorageError("no checkpoint " + instrument_id + "@" +
                     std::to_string(valid_through));
}

// ---------------- DirectoryCheckpointStore ----------------

DirectoryCheckpointStore::DirectoryCheckpointStore(const std::string& root,
                                                   std::size_t keep_last)
    : root_(root), keep_last_(keep_last) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec)
    throw StorageError("cannot create checkpoint directory " + root_ + ": " +
                       ec.message());
}

std::string DirectoryCheckpointStore::file_for(const std::string& instrument_id,
                                               uint64_t valid_through) const {
  char name[32];
  std::snprintf(name, sizeof(name), "%020llu.ckpt",
                static_cast<unsigned long long>(valid_through));
  return (fs::path(root_) / instrument_id / name).string();
}

void DirectoryCheckpointStore::write(const CheckpointBlob& cp) {
  std::lock_guard<std::mutex> lock(mtx_);
  const fs::path dir = fs::path(root_) / cp.instrument_id;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw StorageError("create " + dir.string() + ": " + ec.message());

  const std::string final_path = file_for(cp.instrument_id, cp.valid_through);
  const std::string tmp_path = final_path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) throw StorageError("open " + tmp_path + " failed");
    out.write(cp.bytes.data(), static_cast<std::streamsize>(cp.bytes.size()));
    out.flush();
    if (!out) throw StorageError("write " + tmp_path + " failed");
  }
  fs::rename(tmp_path, final_path, ec);
  if (ec) {
    fs::remove(tmp_path, ec);
    throw StorageError("rename into " + final_path + " failed");
  }
  prune(cp.instrument_id);
}

std::vector<uint64_t> DirectoryCheckpointStore::list(
    const std::string& instrument_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<uint64_t> out;
  const fs::path dir = fs::path(root_) / instrument_id;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) return out;

  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".ckpt")
      continue;
    const std::string stem = entry.path().stem().string();
    if (stem.empty() || stem.find_first_not_of("0123456789") != std::string::npos)
      continue;
    out.push_back(std::stoull(stem));
  }
  if (ec) throw StorageError("list " + dir.string() + ": " + ec.message());
  std::sort(out.rbegin(), out.rend());
  return out;
}

std::string DirectoryCheckpointStore::read(const std::string& instrument_id,
                                           uint64_t valid_through) {
  std::lock_guard<std::mutex> lock(mtx_);
  const std::string path = file_for(instrument_id, valid_through);
  std::ifstream in(path, std::ios::binary);
  if (!in) throw StorageError("open " + path + " failed");
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

void DirectoryCheckpointStore::prune(const std::string& instrument_id) {
  if (keep_last_ == 0) return;
  const fs::path dir = fs::path(root_) / instrument_id;
  std::vector<fs::path> files;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec))
    if (entry.path().extension() == ".ckpt") files.push_back(entry.path());
  if (files.size() <= keep_last_) return;
  // Zero-padded names sort numerically.
  std::sort(files.begin(), files.end());
  for (std::size_t i = 0; i + keep_last_ < files.size(); ++i) {
    fs::remove(files[i], ec);
    if (ec)
      safe_err("[Checkpoint] could not prune ", files[i].string(), ": ",
               ec.message());
  }
}

// ---------------- factory ----------------

std::unique_ptr<ICheckpointStore> make_checkpoint_store(const std::string& path,
                                                        std::size_t keep_last) {
  if (path.empty()) return std::make_unique<MemoryCheckpointStore>(keep_last);

  auto has_mdb_ext =
      path.size() >= 4 && path.compare(path.size() - 4, 4, ".mdb") == 0;
  if (has_mdb_ext || path.find(".mdb/") != std::string::npos)
    return make_lmdb_checkpoint_store(path, keep_last);

  return std::make_unique<DirectoryCheckpointStore>(path, keep_last);
}

}  // namespace lobr
