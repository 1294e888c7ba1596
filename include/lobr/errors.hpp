#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace lobr {

// A level would go below zero volume, or a restored state does not add up.
// Never clamped: the pipeline halts and recovers.
class ConsistencyError : public std::runtime_error {
 public:
  explicit ConsistencyError(const std::string& what)
      : std::runtime_error(what) {}
};

// Checkpoint record failed its checksum or could not be decoded.
class CheckpointError : public std::runtime_error {
 public:
  explicit CheckpointError(const std::string& what)
      : std::runtime_error(what) {}
};

// Checkpoint store or journal I/O failure (LMDB, filesystem).
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// Transient feed-source failure; recovery retries these with backoff.
class FeedError : public std::runtime_error {
 public:
  explicit FeedError(const std::string& what) : std::runtime_error(what) {}
};

// Recovery could not make progress after the configured retries.
// Operator-visible; the pipeline stops.
class RecoveryError : public std::runtime_error {
 public:
  explicit RecoveryError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace lobr
