#include "JobQueue.hpp"

#include <algorithm>

namespace docfetch {

namespace {

// Below this many heap entries compaction is not worth it.
constexpr size_t kCompactThreshold = 64;

}  // namespace

uint64_t JobQueue::push(JobId id, int priority) {
  uint64_t seq = nextSeq_++;
  insert(id, priority, seq);
  return seq;
}

void JobQueue::requeue(JobId id, int priority, uint64_t seq) {
  insert(id, priority, seq);
}

void JobQueue::insert(JobId id, int priority, uint64_t seq) {
  uint64_t version = nextVersion_++;
  live_[id] = Live{priority, seq, version};
  heap_.push_back(Entry{priority, seq, id, version});
  std::push_heap(heap_.begin(), heap_.end(), Later());
  compactIfNeeded();
}

bool JobQueue::reprioritize(JobId id, int priority) {
  auto it = live_.find(id);
  if (it == live_.end()) return false;
  if (it->second.priority == priority) return true;
  insert(id, priority, it->second.seq);
  return true;
}

bool JobQueue::remove(JobId id) {
  if (live_.erase(id) == 0) return false;
  if (live_.empty()) {
    heap_.clear();
  } else {
    compactIfNeeded();
  }
  return true;
}

std::optional<JobQueue::Item> JobQueue::pop() {
  while (!heap_.empty()) {
    std::pop_heap(heap_.begin(), heap_.end(), Later());
    Entry entry = heap_.back();
    heap_.pop_back();
    auto it = live_.find(entry.id);
    if (it == live_.end() || it->second.version != entry.version) continue;
    live_.erase(it);
    if (live_.empty()) heap_.clear();
    return Item{entry.id, entry.priority, entry.seq};
  }
  return std::nullopt;
}

std::vector<JobId> JobQueue::ordered() const {
  std::vector<Entry> entries;
  entries.reserve(live_.size());
  for (const auto& kv : live_) {
    entries.push_back(Entry{kv.second.priority, kv.second.seq, kv.first, kv.second.version});
  }
  std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
    if (a.priority != b.priority) return a.priority < b.priority;
    return a.seq < b.seq;
  });
  std::vector<JobId> ids;
  ids.reserve(entries.size());
  for (const auto& entry : entries) ids.push_back(entry.id);
  return ids;
}

void JobQueue::compactIfNeeded() {
  if (heap_.size() < kCompactThreshold || heap_.size() <= 2 * live_.size()) return;
  heap_.clear();
  for (const auto& kv : live_) {
    heap_.push_back(Entry{kv.second.priority, kv.second.seq, kv.first, kv.second.version});
  }
  std::make_heap(heap_.begin(), heap_.end(), Later());
}

}  // namespace docfetch
