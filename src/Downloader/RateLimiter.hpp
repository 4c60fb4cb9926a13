#ifndef DOCFETCH_RATE_LIMITER_HPP_
#define DOCFETCH_RATE_LIMITER_HPP_

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "Config/Config.hpp"

namespace docfetch {

/**
 * @brief Token bucket shared by every active transfer.
 *
 * Tokens refill at bytesPerSecond and the bucket holds at most one burst.
 * Requests larger than the burst are granted slice by slice, so over any
 * window T the bytes granted stay within rate * T + burst. A rate of 0
 * disables limiting.
 */
class RateLimiter {
 public:
  explicit RateLimiter(int64_t bytesPerSecond = 0, size_t burstBytes = kDefaultChunkSize);

  // Blocks until `bytes` have been granted.
  void acquire(size_t bytes);
  // Like acquire, but gives up once `keepWaiting` returns false. Returns
  // whether the full amount was granted.
  template <typename Predicate>
  bool acquire(size_t bytes, Predicate keepWaiting);

  // Affects refills from now on and wakes every waiter.
  void setRate(int64_t bytesPerSecond);
  int64_t rate() const;
  size_t burst() const { return burst_; }

 private:
  using SteadyClock = std::chrono::steady_clock;

  // Moves elapsed time into tokens. Caller holds mutex_.
  void refillLocked(SteadyClock::time_point now);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int64_t rate_;
  const size_t burst_;
  double tokens_;
  SteadyClock::time_point lastRefill_;
};

template <typename Predicate>
bool RateLimiter::acquire(size_t bytes, Predicate keepWaiting) {
  std::unique_lock<std::mutex> lock(mutex_);
  size_t remaining = bytes;
  while (remaining > 0) {
    if (rate_ <= 0) return true;
    size_t slice = remaining < burst_ ? remaining : burst_;
    refillLocked(SteadyClock::now());
    if (tokens_ >= static_cast<double>(slice)) {
      tokens_ -= static_cast<double>(slice);
      remaining -= slice;
      continue;
    }
    if (!keepWaiting()) return false;
    double missing = static_cast<double>(slice) - tokens_;
    auto wait = std::chrono::duration<double>(missing / static_cast<double>(rate_));
    // Wake at least every 100 ms to re-check keepWaiting.
    auto capped = std::min<std::chrono::duration<double>>(wait, std::chrono::milliseconds(100));
    cv_.wait_for(lock, std::chrono::duration_cast<std::chrono::microseconds>(capped) +
                           std::chrono::microseconds(1));
  }
  return true;
}

}  // namespace docfetch

#endif  // DOCFETCH_RATE_LIMITER_HPP_
