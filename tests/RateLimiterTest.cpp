#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "Downloader/RateLimiter.hpp"

using namespace docfetch;
using SteadyClock = std::chrono::steady_clock;

namespace {

double secondsSince(SteadyClock::time_point start) {
  return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

}  // namespace

TEST(RateLimiterTest, UnlimitedNeverBlocks) {
  RateLimiter limiter(0);
  auto start = SteadyClock::now();
  for (int i = 0; i < 1000; ++i) limiter.acquire(1024 * 1024);
  EXPECT_LT(secondsSince(start), 0.5);
}

TEST(RateLimiterTest, AggregateRateAcrossThreads) {
  const int64_t rate = 64 * 1024;
  const size_t chunk = 8 * 1024;
  RateLimiter limiter(rate, chunk);

  // 3 threads x 2 x 8 KiB = 48 KiB; the first burst is free.
  auto start = SteadyClock::now();
  std::vector<std::thread> threads;
  for (int t = 0; t < 3; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 2; ++i) limiter.acquire(chunk);
    });
  }
  for (auto& thread : threads) thread.join();

  double elapsed = secondsSince(start);
  double minimum = static_cast<double>(6 * chunk - chunk) / static_cast<double>(rate);
  EXPECT_GE(elapsed, minimum * 0.9);
  EXPECT_LT(elapsed, minimum + 2.0);
}

TEST(RateLimiterTest, LargeRequestsAreSliced) {
  RateLimiter limiter(32 * 1024, 4 * 1024);
  auto start = SteadyClock::now();
  limiter.acquire(20 * 1024);
  // 16 KiB beyond the initial burst at 32 KiB/s.
  EXPECT_GE(secondsSince(start), 0.45);
}

TEST(RateLimiterTest, WaiterGivesUpWhenPredicateTurnsFalse) {
  RateLimiter limiter(1, 1024);
  limiter.acquire(1024);  // drain the bucket

  std::atomic<bool> keepGoing{true};
  std::atomic<bool> granted{true};
  std::thread waiter([&] { granted = limiter.acquire(1024, [&] { return keepGoing.load(); }); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto stopAt = SteadyClock::now();
  keepGoing = false;
  waiter.join();

  EXPECT_FALSE(granted.load());
  EXPECT_LT(secondsSince(stopAt), 0.5);
}

TEST(RateLimiterTest, SetRateWakesWaiters) {
  RateLimiter limiter(1, 1024);
  limiter.acquire(1024);

  std::atomic<bool> done{false};
  std::thread waiter([&] {
    limiter.acquire(512);
    done = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(done.load());
  limiter.setRate(0);
  waiter.join();
  EXPECT_TRUE(done.load());
  EXPECT_EQ(limiter.rate(), 0);
}
