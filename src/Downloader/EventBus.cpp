#include "EventBus.hpp"

#include <algorithm>

#include "utils/logger.hpp"

namespace docfetch {

EventBus::EventBus() : running_(false), dispatching_(false) {}
EventBus::~EventBus() { stop(); }

void EventBus::subscribe(std::shared_ptr<JobEventListener> listener) {
  if (!listener) return;
  std::lock_guard<std::mutex> lock(eventsMutex_);
  listeners_.push_back(std::move(listener));
}

void EventBus::unsubscribe(const std::shared_ptr<JobEventListener>& listener) {
  std::lock_guard<std::mutex> lock(eventsMutex_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                   listeners_.end());
}

void EventBus::publish(JobEvent event) {
  std::lock_guard<std::mutex> lock(eventsMutex_);
  JobId id = event.job.id;
  if (event.type == JobEventType::PROGRESS) {
    auto pending = pendingProgress_.find(id);
    if (pending != pendingProgress_.end()) {
      events_[pending->second - headSeq_] = std::move(event);
      return;
    }
    pendingProgress_[id] = headSeq_ + events_.size();
  } else {
    // Later progress must not jump ahead of this event.
    pendingProgress_.erase(id);
  }
  events_.push_back(std::move(event));
  eventsCv_.notify_one();
}

void EventBus::start() {
  {
    std::lock_guard<std::mutex> lock(eventsMutex_);
    if (running_) return;  // Already running
    running_ = true;
  }

  dispatchThread_ = std::thread([this]() {
    std::unique_lock<std::mutex> lock(eventsMutex_);
    while (true) {
      eventsCv_.wait(lock, [this]() { return !events_.empty() || !running_; });
      if (events_.empty()) break;  // stopped and drained

      JobEvent event = std::move(events_.front());
      events_.pop_front();
      if (event.type == JobEventType::PROGRESS) {
        auto pending = pendingProgress_.find(event.job.id);
        if (pending != pendingProgress_.end() && pending->second == headSeq_) {
          pendingProgress_.erase(pending);
        }
      }
      ++headSeq_;
      auto listeners = listeners_;
      dispatching_ = true;

      lock.unlock();  // Unlock before calling the listeners
      dispatch(event, listeners);
      lock.lock();

      dispatching_ = false;
      if (events_.empty()) idleCv_.notify_all();
    }
    idleCv_.notify_all();
  });
}

void EventBus::stop() {
  {
    std::lock_guard<std::mutex> lock(eventsMutex_);
    running_ = false;
    eventsCv_.notify_all();  // Notify the thread to wake up and exit
  }

  if (dispatchThread_.joinable()) {
    dispatchThread_.join();
  }
}

bool EventBus::flush(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(eventsMutex_);
  return idleCv_.wait_for(lock, timeout, [this]() {
    return (events_.empty() && !dispatching_) || !running_;
  });
}

void EventBus::dispatch(const JobEvent& event,
                        const std::vector<std::shared_ptr<JobEventListener>>& listeners) {
  for (const auto& listener : listeners) {
    try {
      switch (event.type) {
        case JobEventType::STARTED:
          listener->onJobStarted(event.job);
          break;
        case JobEventType::PROGRESS:
          listener->onJobProgress(event.job, event.progress);
          break;
        case JobEventType::COMPLETED:
          listener->onJobCompleted(event.job);
          break;
        case JobEventType::FAILED:
          listener->onJobFailed(event.job, event.reason);
          break;
        case JobEventType::CANCELLED:
          listener->onJobCancelled(event.job);
          break;
      }
    } catch (const std::exception& e) {
      LOG(ERROR) << "[EventBus] Listener threw on job " << event.job.id << ": " << e.what();
    }
  }
}

}  // namespace docfetch
