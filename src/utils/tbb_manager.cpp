#include "tbb_manager.hpp"

#include <sstream>

DEFINE_string(arena_concurrency, "",
              "TBB arena concurrency control, e.g. validate:4,scan:2");

namespace utils {

TBBManager& TBBManager::GetInstance() {
  static TBBManager instance;
  return instance;
}

std::shared_ptr<tbb::task_arena> TBBManager::Init(const std::string& tbb_name) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto& state = task_arenas_[tbb_name];
  if (!state.initialized) {
    int concurrency = 0;
    auto& defines = GetTBBParallelCountDefines();
    auto it = defines.find(tbb_name);
    if (it != defines.end()) {
      concurrency = it->second;
    }
    if (concurrency <= 0) {
      concurrency = tbb::info::default_concurrency();
    }
    state.arena = std::make_shared<tbb::task_arena>(concurrency);
    state.concurrency = concurrency;
    state.initialized = true;
    LOG(INFO) << "[TBBManager] Arena '" << tbb_name
              << "' initialized with concurrency: " << concurrency;
  }
  return state.arena;
}

int TBBManager::Concurrency(const std::string& tbb_name) {
  Init(tbb_name);
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  return task_arenas_[tbb_name].concurrency;
}

ArenaStats TBBManager::Stats(const std::string& tbb_name) const {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto it = task_arenas_.find(tbb_name);
  if (it == task_arenas_.end()) return ArenaStats{};
  return it->second.stats;
}

void TBBManager::Release() {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  for (auto& kv : task_arenas_) {
    if (kv.second.arena) {
      kv.second.arena->terminate();
      kv.second.arena.reset();
      kv.second.initialized = false;
      LOG(DEBUG) << "[TBBManager] Arena '" << kv.first << "' released.";
    }
  }
  task_arenas_.clear();
}

TBBManager::~TBBManager() { Release(); }

std::map<std::string, int> TBBManager::ParseConcurrencyDefines(
    const std::string& spec) {
  std::map<std::string, int> defines;
  // 解析字符串，格式如 "validate:4,scan:2"
  std::istringstream ss(spec);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto pos = item.find(':');
    if (pos == std::string::npos) continue;
    std::string name = item.substr(0, pos);
    try {
      defines[name] = std::stoi(item.substr(pos + 1));
    } catch (const std::exception&) {
      LOG(WARN) << "[TBBManager] Ignoring malformed arena setting: " << item;
    }
  }
  return defines;
}

std::map<std::string, int>& TBBManager::GetTBBParallelCountDefines() {
  static std::map<std::string, int> defines =
      ParseConcurrencyDefines(FLAGS_arena_concurrency);
  return defines;
}

void TBBManager::RecordBatch(const std::string& tbb_name, uint64_t items,
                             uint64_t failures) {
  std::lock_guard<std::mutex> lock(arenas_mutex_);
  auto& stats = task_arenas_[tbb_name].stats;
  ++stats.batches;
  stats.items += items;
  stats.failures += failures;
}

}  // namespace utils
