#pragma once
#include <iostream>
#include <mutex>

namespace lobr {

// Lines from the pipeline thread and the checkpoint worker must not interleave.
inline std::mutex& log_mutex() {
  static std::mutex mtx;
  return mtx;
}

template <typename... Args>
void safe_log(Args&&... args) {
  std::lock_guard<std::mutex> lock(log_mutex());
  (std::cout << ... << args) << std::endl;
}

template <typename... Args>
void safe_err(Args&&... args) {
  std::lock_guard<std::mutex> lock(log_mutex());
  (std::cerr << ... << args) << std::endl;
}

}  // namespace lobr
