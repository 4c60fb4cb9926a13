#include "RateLimiter.hpp"

#include <algorithm>

#include "utils/logger.hpp"

namespace docfetch {

RateLimiter::RateLimiter(int64_t bytesPerSecond, size_t burstBytes)
    : rate_(bytesPerSecond < 0 ? 0 : bytesPerSecond),
      burst_(burstBytes == 0 ? kDefaultChunkSize : burstBytes),
      tokens_(static_cast<double>(burst_)),
      lastRefill_(SteadyClock::now()) {}

void RateLimiter::acquire(size_t bytes) {
  acquire(bytes, [] { return true; });
}

void RateLimiter::setRate(int64_t bytesPerSecond) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Settle the time elapsed under the old rate first.
    refillLocked(SteadyClock::now());
    rate_ = bytesPerSecond < 0 ? 0 : bytesPerSecond;
  }
  LOG(INFO) << "[RateLimiter] rate set to "
            << (bytesPerSecond > 0 ? std::to_string(bytesPerSecond) + " B/s" : "unlimited");
  cv_.notify_all();
}

int64_t RateLimiter::rate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rate_;
}

void RateLimiter::refillLocked(SteadyClock::time_point now) {
  if (now <= lastRefill_) return;
  if (rate_ > 0) {
    double elapsed = std::chrono::duration<double>(now - lastRefill_).count();
    tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed * static_cast<double>(rate_));
  } else {
    tokens_ = static_cast<double>(burst_);
  }
  lastRefill_ = now;
}

}  // namespace docfetch
