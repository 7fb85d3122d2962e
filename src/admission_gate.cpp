/**
 * @file admission_gate.cpp
 * @brief Admission gate implementation
 */

#include "keyout/admission_gate.hpp"

namespace keyout {

bool AdmissionGate::acquire(const std::atomic<bool> &abandon) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this, &abandon] {
    return abandon.load() || limit_ <= 0 || in_use_ < limit_;
  });

  if (abandon.load())
    return false;
  ++in_use_;
  return true;
}

void AdmissionGate::release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ > 0)
      --in_use_;
  }
  cv_.notify_all();
}

void AdmissionGate::wake_all() {
  /// Lock so a waiter cannot miss the wakeup between its check and wait
  { std::lock_guard<std::mutex> lock(mutex_); }
  cv_.notify_all();
}

} // namespace keyout
