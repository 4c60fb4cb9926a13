#ifndef DOCFETCH_EVENT_BUS_HPP_
#define DOCFETCH_EVENT_BUS_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "Job.hpp"

namespace docfetch {

// Receives job events on the bus's dispatcher thread, one at a time.
class JobEventListener {
 public:
  virtual ~JobEventListener() = default;
  virtual void onJobStarted(const Job& /*job*/) {}
  // progress is in [0, 1], or -1 while the total size is unknown.
  virtual void onJobProgress(const Job& /*job*/, double /*progress*/) {}
  virtual void onJobCompleted(const Job& /*job*/) {}
  virtual void onJobFailed(const Job& /*job*/, const std::string& /*reason*/) {}
  virtual void onJobCancelled(const Job& /*job*/) {}
};

enum class JobEventType { STARTED, PROGRESS, COMPLETED, FAILED, CANCELLED };

struct JobEvent {
  JobEventType type = JobEventType::STARTED;
  Job job;
  double progress = 0.0;
  std::string reason;
};

/**
 * @brief FIFO event dispatcher with its own thread.
 *
 * publish() never blocks on listeners. Events are delivered in publish
 * order, so the events of one job arrive in the order they happened. A
 * listener that throws is logged and the remaining listeners still run.
 *
 * A job has at most one undelivered PROGRESS event: a newer one replaces
 * it in place, so a slow listener sees fewer updates but the queue stays
 * bounded by the number of jobs.
 */
class EventBus {
 public:
  EventBus();
  ~EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  void subscribe(std::shared_ptr<JobEventListener> listener);
  void unsubscribe(const std::shared_ptr<JobEventListener>& listener);

  void publish(JobEvent event);

  void start();
  // Delivers what is already queued, then joins the dispatcher.
  void stop();
  // True once every published event has been delivered.
  bool flush(std::chrono::milliseconds timeout);

 private:
  void dispatch(const JobEvent& event,
                const std::vector<std::shared_ptr<JobEventListener>>& listeners);

  std::deque<JobEvent> events_;
  // Sequence number of events_.front().
  uint64_t headSeq_ = 0;
  // Job -> sequence number of its queued PROGRESS event.
  std::map<JobId, uint64_t> pendingProgress_;
  std::vector<std::shared_ptr<JobEventListener>> listeners_;
  std::mutex eventsMutex_;
  std::condition_variable eventsCv_;
  std::condition_variable idleCv_;
  std::thread dispatchThread_;
  bool running_;
  bool dispatching_;
};

}  // namespace docfetch

#endif  // DOCFETCH_EVENT_BUS_HPP_
