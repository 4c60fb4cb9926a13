#ifndef DOCFETCH_DOWNLOAD_ORCHESTRATOR_HPP_
#define DOCFETCH_DOWNLOAD_ORCHESTRATOR_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "Config/Config.hpp"
#include "EventBus.hpp"
#include "Http/HttpFetcher.hpp"
#include "Inventory/Inventory.hpp"
#include "Job.hpp"
#include "JobQueue.hpp"
#include "RateLimiter.hpp"
#include "Transfer.hpp"
#include "Validator/ValidatorRegistry.hpp"

namespace docfetch {

/**
 * @brief Priority job queue served by a pool of worker threads.
 *
 * Jobs: Queued -> Downloading -> {Completed | Failed}; Downloading <->
 * Paused; Queued/Downloading/Paused -> Cancelled. A (siteId, url) pair is
 * at most once among queued and active jobs.
 *
 * Every public method is thread-safe. Queries return snapshots. Listener
 * callbacks run on the event dispatcher thread, never on a worker.
 */
class DownloadOrchestrator {
 public:
  // `locals` is consulted to keep every download on a path of its own.
  DownloadOrchestrator(const DownloadConfig& config, HttpFetcher& fetcher,
                       const ValidatorRegistry& validators, DownloadHistory& history,
                       const LocalInventory& locals);
  ~DownloadOrchestrator();

  DownloadOrchestrator(const DownloadOrchestrator&) = delete;
  DownloadOrchestrator& operator=(const DownloadOrchestrator&) = delete;

  // Throws DuplicateJobError when the same (siteId, url) is already queued
  // or active.
  JobId enqueue(const JobSpec& spec, int priority = kDefaultPriority);
  // Only for queued jobs. The job keeps its place among equal priorities.
  bool reprioritize(JobId id, int priority);
  // Only for queued jobs; the job is forgotten.
  bool removeFromQueue(JobId id);
  bool cancel(JobId id);
  bool pause(JobId id);
  bool resume(JobId id);

  // Starts concurrentDownloads workers.
  void start();
  // Interrupts in-flight transfers and waits up to stopTimeout for the
  // workers. Interrupted jobs go back to the queue. Returns false on
  // timeout. Nothing is written to job state or history by a worker once
  // this returns.
  bool stop();
  bool running() const;

  // Live. Surplus workers retire after their current job. Throws
  // ConfigurationError on invalid values.
  void reconfigure(int maxWorkers, int64_t rateLimitBytesPerSecond);

  std::vector<Job> listQueue() const;  // in start order
  std::vector<Job> listActive() const;
  std::vector<Job> listFinished() const;
  std::optional<Job> statusOf(JobId id) const;
  std::optional<double> progressOf(JobId id) const;
  int workerCount() const;
  size_t clearFinished();
  // True once the queue is empty and no job is active.
  bool waitUntilIdle(std::chrono::milliseconds timeout);

  void subscribe(std::shared_ptr<JobEventListener> listener);
  // Waits until every event published so far has been delivered.
  bool flushEvents(std::chrono::milliseconds timeout) { return events_.flush(timeout); }

  DownloadConfig config() const;

 private:
  struct JobEntry {
    Job job;
    uint64_t seq = 0;
    int64_t historyId = 0;
    double lastReported = 0.0;
    int64_t lastReportedBytes = -1;
    std::atomic<bool> cancelRequested{false};
    std::atomic<bool> pauseRequested{false};
    std::atomic<bool> interruptRequested{false};
    // Bumped at every pickup; a worker holding an older value is stale.
    std::atomic<uint64_t> run{0};
  };

  struct WorkerSlot {
    std::thread thread;
    std::atomic<bool> exited{false};
  };

  class JobControl;
  class DestinationClaim;

  static std::string identityKey(const JobSpec& spec);

  void spawnWorkerLocked();
  std::list<std::unique_ptr<WorkerSlot>> takeExitedLocked();
  void workerLoop(WorkerSlot* slot, uint64_t epoch);
  void runJob(const std::shared_ptr<JobEntry>& entry, uint64_t epoch, uint64_t run);
  // Caller holds persistMutex_. Reuses the path of the local copy linked to
  // the remote file, else the first of "name.ext", "name (1).ext", ... that
  // no other run, local record or existing file occupies.
  std::filesystem::path claimDestinationLocked(const JobSpec& spec,
                                               const TransferRequest& request,
                                               const std::string& downloadDirectory,
                                               std::string* key);
  void finishJob(const std::shared_ptr<JobEntry>& entry, uint64_t epoch,
                 const TransferResult& result);
  void failJob(const std::shared_ptr<JobEntry>& entry, uint64_t epoch, ErrorKind kind,
               const std::string& reason);
  // Caller holds mutex_.
  void markTerminalLocked(JobEntry& entry, JobState state);
  void recordProgress(const std::shared_ptr<JobEntry>& entry, uint64_t run, int64_t bytes,
                      std::optional<int64_t> total);
  void publish(JobEventType type, const Job& job, double progress = 0.0,
               const std::string& reason = "");

  DownloadConfig config_;
  HttpFetcher& fetcher_;
  const ValidatorRegistry& validators_;
  DownloadHistory& history_;
  const LocalInventory& locals_;
  RateLimiter limiter_;
  EventBus events_;

  mutable std::mutex mutex_;
  std::condition_variable queueCv_;  // new work, stop, fewer workers wanted
  std::condition_variable stateCv_;  // job and worker state changes
  std::map<JobId, std::shared_ptr<JobEntry>> jobs_;
  JobQueue queue_;
  std::unordered_map<std::string, JobId> activeKeys_;
  std::vector<JobId> finishedOrder_;
  JobId nextJobId_ = 1;
  bool running_ = false;
  int targetWorkers_;
  int liveWorkers_ = 0;
  int activeJobs_ = 0;
  std::list<std::unique_ptr<WorkerSlot>> workers_;

  // Held around every worker write to history and terminal job state.
  // Lock order: persistMutex_ before mutex_.
  std::mutex persistMutex_;
  // Bumped by stop() under both mutexes; workers of an older epoch write
  // nothing.
  uint64_t epoch_ = 0;
  // Destinations of runs still in progress, absolute and normalised.
  // Guarded by persistMutex_.
  std::set<std::string> claimedPaths_;
};

}  // namespace docfetch

#endif  // DOCFETCH_DOWNLOAD_ORCHESTRATOR_HPP_
