#ifndef TBB_MANAGER_HPP_
#define TBB_MANAGER_HPP_

#include <gflags/gflags.h>
#include <tbb/tbb.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "logger.hpp"

DECLARE_string(arena_concurrency);

namespace utils {

// Counters kept per named arena.
struct ArenaStats {
  uint64_t batches = 0;
  uint64_t items = 0;
  uint64_t failures = 0;
};

struct TBBState {
  bool initialized = false;
  int concurrency = 0;
  std::shared_ptr<tbb::task_arena> arena;
  ArenaStats stats;
};

/**
 * @brief Named TBB arenas. Each concern (bulk validation, directory
 * scanning) runs its ParallelFor inside its own arena so its concurrency
 * can be bounded independently with --arena_concurrency=name:N,...
 */
class TBBManager {
 public:
  static TBBManager& GetInstance();

  std::shared_ptr<tbb::task_arena> Init(const std::string& tbb_name);

  // Runs task(i) for i in [start, end). An exception thrown by one item is
  // logged and counted; the remaining items still run.
  template <typename IntType, typename Func>
  void ParallelFor(const std::string& tbb_name, IntType start, IntType end,
                   const Func& task);

  int Concurrency(const std::string& tbb_name);
  ArenaStats Stats(const std::string& tbb_name) const;

  void Release();
  ~TBBManager();

  static std::map<std::string, int> ParseConcurrencyDefines(
      const std::string& spec);
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  TBBManager() = default;
  TBBManager(const TBBManager&) = delete;
  TBBManager& operator=(const TBBManager&) = delete;

  void RecordBatch(const std::string& tbb_name, uint64_t items,
                   uint64_t failures);

  std::unordered_map<std::string, TBBState> task_arenas_;
  mutable std::mutex arenas_mutex_;
};

// 模板实现
template <typename IntType, typename Func>
void TBBManager::ParallelFor(const std::string& tbb_name, IntType start,
                             IntType end, const Func& task) {
  if (!(start < end)) return;
  auto arena = Init(tbb_name);
  std::atomic<uint64_t> failures{0};

  LOG(DEBUG) << "[TBBManager] ParallelFor start: " << tbb_name << " ["
             << start << "," << end << ")";
  arena->execute([&task, &failures, start, end]() {
    tbb::parallel_for(tbb::blocked_range<IntType>(start, end),
                      [&task, &failures](const tbb::blocked_range<IntType>& range) {
                        for (IntType i = range.begin(); i < range.end(); ++i) {
                          try {
                            task(i);
                          } catch (const std::exception& e) {
                            failures.fetch_add(1, std::memory_order_relaxed);
                            LOG(ERROR) << "[TBBManager] Exception in task: "
                                       << e.what();
                          }
                        }
                      });
  });
  RecordBatch(tbb_name, static_cast<uint64_t>(end - start), failures.load());
  LOG(DEBUG) << "[TBBManager] ParallelFor end: " << tbb_name;
}

}  // namespace utils

#endif  // TBB_MANAGER_HPP_
