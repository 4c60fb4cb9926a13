#ifndef DOCFETCH_JOB_QUEUE_HPP_
#define DOCFETCH_JOB_QUEUE_HPP_

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "Job.hpp"

namespace docfetch {

/**
 * @brief Priority queue of job ids, FIFO within a priority.
 *
 * Reprioritize and remove leave a stale heap entry behind that pop() skips
 * (versioned tombstones). The heap is dropped when the queue drains and
 * rebuilt when stale entries outnumber live ones. Not synchronized; the
 * orchestrator guards it with its queue mutex.
 */
class JobQueue {
 public:
  struct Item {
    JobId id = 0;
    int priority = kDefaultPriority;
    uint64_t seq = 0;  // arrival order
  };

  // New arrival. Returns its sequence number.
  uint64_t push(JobId id, int priority);
  // Re-inserts a job with the sequence number it arrived with, so it goes
  // ahead of later jobs of the same priority.
  void requeue(JobId id, int priority, uint64_t seq);
  bool reprioritize(JobId id, int priority);
  bool remove(JobId id);
  std::optional<Item> pop();

  bool contains(JobId id) const { return live_.count(id) > 0; }
  size_t size() const { return live_.size(); }
  bool empty() const { return live_.empty(); }
  // Live ids in the order pop() would return them.
  std::vector<JobId> ordered() const;
  // Heap entries, stale ones included.
  size_t heapSize() const { return heap_.size(); }

 private:
  struct Entry {
    int priority;
    uint64_t seq;
    JobId id;
    uint64_t version;
  };
  struct Live {
    int priority;
    uint64_t seq;
    uint64_t version;
  };
  // Heap comparator: the most urgent entry ends up on top.
  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.priority != b.priority) return a.priority > b.priority;
      return a.seq > b.seq;
    }
  };

  void insert(JobId id, int priority, uint64_t seq);
  void compactIfNeeded();

  std::vector<Entry> heap_;
  std::unordered_map<JobId, Live> live_;
  uint64_t nextSeq_ = 0;
  uint64_t nextVersion_ = 0;
};

}  // namespace docfetch

#endif  // DOCFETCH_JOB_QUEUE_HPP_
