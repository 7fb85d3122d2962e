/**
 * @file admission_gate.hpp
 * @brief Optional bound on concurrently running encoder processes
 *
 * @details Job threads call acquire() before launching their encoder and
 *          release() once it has been reaped. A limit of 0 admits
 *          everything immediately.
 *
 * @attention USAGE:
 *
 *   - acquire() blocks while the limit is reached
 *
 *   - A waiting job is released early (acquire() returns false) when its
 *     abandon flag is set and wake_all() is called, e.g. on cancel
 */

#ifndef KEYOUT_ADMISSION_GATE_HPP
#define KEYOUT_ADMISSION_GATE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace keyout {

class AdmissionGate {
public:
  /**
   * @param limit Maximum concurrent holders (0 = unbounded)
   */
  explicit AdmissionGate(int limit) : limit_(limit) {}

  /**
   * @brief Take a slot.
   * @param abandon Checked while waiting; when set the wait ends
   * @return true if a slot was taken, false if abandoned
   */
  bool acquire(const std::atomic<bool> &abandon);

  /// Return a slot taken by acquire()
  void release();

  /// Wake waiters so they re-check their abandon flags
  void wake_all();

  int in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
  }

private:
  int limit_;
  int in_use_{0};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace keyout

#endif // KEYOUT_ADMISSION_GATE_HPP
