#include "DownloadOrchestrator.hpp"

#include <algorithm>
#include <filesystem>

#include "utils/logger.hpp"
#include "utils/url.hpp"

namespace docfetch {

namespace {

// Indeterminate progress is reported at most once per this many bytes.
constexpr int64_t kIndeterminateReportBytes = 512 * 1024;
const char* const kShutdownReason = "interrupted by shutdown";
// Upper bound on "name (n).ext" candidates.
constexpr int kMaxNameSuffix = 10000;

std::string normalPath(const std::filesystem::path& path) {
  return std::filesystem::absolute(path).lexically_normal().string();
}

}  // namespace

// Bridges a Transfer to the flags of its job.
class DownloadOrchestrator::JobControl : public TransferControl {
 public:
  JobControl(DownloadOrchestrator& owner, std::shared_ptr<JobEntry> entry, uint64_t run)
      : owner_(owner), entry_(std::move(entry)), run_(run) {}

  bool stopRequested() const override {
    return entry_->run != run_ || entry_->cancelRequested || entry_->interruptRequested;
  }

  bool shouldContinue() override {
    if (!entry_->pauseRequested) return !stopRequested();
    std::unique_lock<std::mutex> lock(owner_.mutex_);
    owner_.stateCv_.wait(lock, [this]() { return !entry_->pauseRequested || stopRequested(); });
    return !stopRequested();
  }

  bool waitFor(std::chrono::milliseconds delay) override {
    std::unique_lock<std::mutex> lock(owner_.mutex_);
    return !owner_.stateCv_.wait_for(lock, delay, [this]() { return stopRequested(); });
  }

  void onProgress(int64_t bytes, std::optional<int64_t> total) override {
    owner_.recordProgress(entry_, run_, bytes, total);
  }

  void onAttempt(int attempt) override {
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    if (entry_->run == run_) entry_->job.attempts = attempt;
  }

 private:
  DownloadOrchestrator& owner_;
  std::shared_ptr<JobEntry> entry_;
  const uint64_t run_;
};

// Releases a destination taken by claimDestinationLocked() when the run ends.
class DownloadOrchestrator::DestinationClaim {
 public:
  DestinationClaim(DownloadOrchestrator& owner, std::string key)
      : owner_(owner), key_(std::move(key)) {}
  ~DestinationClaim() {
    std::lock_guard<std::mutex> persist(owner_.persistMutex_);
    owner_.claimedPaths_.erase(key_);
  }

  DestinationClaim(const DestinationClaim&) = delete;
  DestinationClaim& operator=(const DestinationClaim&) = delete;

 private:
  DownloadOrchestrator& owner_;
  std::string key_;
};

DownloadOrchestrator::DownloadOrchestrator(const DownloadConfig& config, HttpFetcher& fetcher,
                                           const ValidatorRegistry& validators,
                                           DownloadHistory& history,
                                           const LocalInventory& locals)
    : config_(config),
      fetcher_(fetcher),
      validators_(validators),
      history_(history),
      locals_(locals),
      limiter_(config.rateLimitBytesPerSecond(), config.chunkSize),
      targetWorkers_(config.concurrentDownloads) {
  config_.validate();
  events_.start();
}

DownloadOrchestrator::~DownloadOrchestrator() {
  stop();
  std::list<std::unique_ptr<WorkerSlot>> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    workers.swap(workers_);
  }
  for (auto& slot : workers) {
    if (slot->thread.joinable()) slot->thread.join();
  }
  events_.stop();
}

std::string DownloadOrchestrator::identityKey(const JobSpec& spec) {
  return std::to_string(spec.siteId) + "|" + spec.url;
}

JobId DownloadOrchestrator::enqueue(const JobSpec& spec, int priority) {
  if (spec.url.empty()) {
    throw ConfigurationError("cannot enqueue a job without a url");
  }
  std::string key = identityKey(spec);
  JobId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dup = activeKeys_.find(key);
    if (dup != activeKeys_.end()) {
      throw DuplicateJobError(spec.url + " is already queued or downloading as job " +
                              std::to_string(dup->second));
    }
    auto entry = std::make_shared<JobEntry>();
    id = nextJobId_++;
    entry->job.id = id;
    entry->job.spec = spec;
    entry->job.priority = priority;
    entry->job.state = JobState::QUEUED;
    entry->job.createdAt = Clock::now();
    entry->seq = queue_.push(id, priority);
    jobs_[id] = entry;
    activeKeys_[key] = id;
  }
  LOG(INFO) << "Queued job " << id << ": " << spec.url << " (priority " << priority << ")";
  queueCv_.notify_one();
  return id;
}

bool DownloadOrchestrator::reprioritize(JobId id, int priority) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() || it->second->job.state != JobState::QUEUED) return false;
  if (!queue_.reprioritize(id, priority)) return false;
  it->second->job.priority = priority;
  return true;
}

bool DownloadOrchestrator::removeFromQueue(JobId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second->job.state != JobState::QUEUED) return false;
    queue_.remove(id);
    activeKeys_.erase(identityKey(it->second->job.spec));
    jobs_.erase(it);
  }
  stateCv_.notify_all();
  LOG(INFO) << "Removed job " << id << " from the queue";
  return true;
}

bool DownloadOrchestrator::cancel(JobId id) {
  Job snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return false;
    JobEntry& entry = *it->second;
    switch (entry.job.state) {
      case JobState::QUEUED:
        queue_.remove(id);
        markTerminalLocked(entry, JobState::CANCELLED);
        snapshot = entry.job;
        break;
      case JobState::DOWNLOADING:
      case JobState::PAUSED:
        // The worker observes the flag between chunks and finishes the job.
        entry.cancelRequested = true;
        entry.pauseRequested = false;
        stateCv_.notify_all();
        LOG(INFO) << "Cancel requested for job " << id;
        return true;
      default:
        return false;
    }
  }
  stateCv_.notify_all();
  LOG(INFO) << "Cancelled queued job " << id;
  publish(JobEventType::CANCELLED, snapshot);
  return true;
}

bool DownloadOrchestrator::pause(JobId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second->job.state != JobState::DOWNLOADING) return false;
    if (it->second->cancelRequested || it->second->interruptRequested) return false;
    it->second->pauseRequested = true;
    it->second->job.state = JobState::PAUSED;
  }
  LOG(INFO) << "Paused job " << id;
  return true;
}

bool DownloadOrchestrator::resume(JobId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second->job.state != JobState::PAUSED) return false;
    it->second->pauseRequested = false;
    it->second->job.state = JobState::DOWNLOADING;
  }
  stateCv_.notify_all();
  LOG(INFO) << "Resumed job " << id;
  return true;
}

void DownloadOrchestrator::start() {
  std::list<std::unique_ptr<WorkerSlot>> exited;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;  // Already running
    running_ = true;
    exited = takeExitedLocked();
    while (liveWorkers_ < targetWorkers_) spawnWorkerLocked();
    LOG(INFO) << "Download orchestrator started with " << liveWorkers_ << " workers";
  }
  for (auto& slot : exited) slot->thread.join();
}

bool DownloadOrchestrator::stop() {
  bool exited = false;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!running_) return true;
    running_ = false;
    for (auto& kv : jobs_) {
      JobState state = kv.second->job.state;
      if (state == JobState::DOWNLOADING || state == JobState::PAUSED) {
        kv.second->interruptRequested = true;
      }
    }
    queueCv_.notify_all();
    stateCv_.notify_all();
    LOG(INFO) << "Stopping download orchestrator, waiting for " << liveWorkers_ << " workers";
    exited = stateCv_.wait_for(lock, config_.stopTimeout,
                               [this]() { return liveWorkers_ == 0; });
  }

  std::vector<int64_t> orphanHistory;
  std::list<std::unique_ptr<WorkerSlot>> finished;
  {
    std::lock_guard<std::mutex> persist(persistMutex_);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++epoch_;
      if (!exited) {
        // Workers still stuck in a transfer: put their jobs back ourselves.
        for (auto& kv : jobs_) {
          JobEntry& entry = *kv.second;
          if (entry.job.state != JobState::DOWNLOADING && entry.job.state != JobState::PAUSED) {
            continue;
          }
          if (entry.historyId != 0) orphanHistory.push_back(entry.historyId);
          entry.job.state = JobState::QUEUED;
          entry.job.progress = 0.0;
          entry.job.bytesDownloaded = 0;
          entry.job.startedAt.reset();
          entry.historyId = 0;
          queue_.requeue(entry.job.id, entry.job.priority, entry.seq);
        }
        LOG(WARN) << liveWorkers_ << " workers did not exit within "
                  << config_.stopTimeout.count() << " ms";
        liveWorkers_ = 0;
        activeJobs_ = 0;
      }
      finished = takeExitedLocked();
    }
    for (int64_t historyId : orphanHistory) {
      try {
        history_.markFailed(historyId, kShutdownReason);
      } catch (const std::exception& e) {
        LOG(ERROR) << "Cannot record shutdown of download " << historyId << ": " << e.what();
      }
    }
  }
  stateCv_.notify_all();
  for (auto& slot : finished) slot->thread.join();
  LOG(INFO) << "Download orchestrator stopped" << (exited ? "" : " (timed out)");
  return exited;
}

bool DownloadOrchestrator::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void DownloadOrchestrator::reconfigure(int maxWorkers, int64_t rateLimitBytesPerSecond) {
  if (maxWorkers < 1) {
    throw ConfigurationError("concurrent downloads must be at least 1, got " +
                             std::to_string(maxWorkers));
  }
  if (rateLimitBytesPerSecond < 0) {
    throw ConfigurationError("rate limit must not be negative, got " +
                             std::to_string(rateLimitBytesPerSecond));
  }
  limiter_.setRate(rateLimitBytesPerSecond);

  std::list<std::unique_ptr<WorkerSlot>> exited;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.concurrentDownloads = maxWorkers;
    config_.rateLimitKbps = rateLimitBytesPerSecond / 1024;
    targetWorkers_ = maxWorkers;
    if (running_) {
      exited = takeExitedLocked();
      while (liveWorkers_ < targetWorkers_) spawnWorkerLocked();
    }
    LOG(INFO) << "Reconfigured: " << maxWorkers << " workers, "
              << (rateLimitBytesPerSecond > 0 ? std::to_string(rateLimitBytesPerSecond) + " B/s"
                                              : std::string("unlimited"));
  }
  // Idle surplus workers wake up and retire.
  queueCv_.notify_all();
  for (auto& slot : exited) slot->thread.join();
}

std::vector<Job> DownloadOrchestrator::listQueue() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> out;
  for (JobId id : queue_.ordered()) {
    auto it = jobs_.find(id);
    if (it != jobs_.end()) out.push_back(it->second->job);
  }
  return out;
}

std::vector<Job> DownloadOrchestrator::listActive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> out;
  for (const auto& kv : jobs_) {
    JobState state = kv.second->job.state;
    if (state == JobState::DOWNLOADING || state == JobState::PAUSED) {
      out.push_back(kv.second->job);
    }
  }
  return out;
}

std::vector<Job> DownloadOrchestrator::listFinished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> out;
  for (JobId id : finishedOrder_) {
    auto it = jobs_.find(id);
    if (it != jobs_.end()) out.push_back(it->second->job);
  }
  return out;
}

std::optional<Job> DownloadOrchestrator::statusOf(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second->job;
}

std::optional<double> DownloadOrchestrator::progressOf(JobId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second->job.progress;
}

int DownloadOrchestrator::workerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return liveWorkers_;
}

size_t DownloadOrchestrator::clearFinished() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t cleared = 0;
  for (JobId id : finishedOrder_) cleared += jobs_.erase(id);
  finishedOrder_.clear();
  return cleared;
}

bool DownloadOrchestrator::waitUntilIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return stateCv_.wait_for(lock, timeout,
                           [this]() { return queue_.empty() && activeJobs_ == 0; });
}

void DownloadOrchestrator::subscribe(std::shared_ptr<JobEventListener> listener) {
  events_.subscribe(std::move(listener));
}

DownloadConfig DownloadOrchestrator::config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_;
}

void DownloadOrchestrator::spawnWorkerLocked() {
  auto slot = std::make_unique<WorkerSlot>();
  WorkerSlot* raw = slot.get();
  uint64_t epoch = epoch_;
  ++liveWorkers_;
  slot->thread = std::thread([this, raw, epoch]() { workerLoop(raw, epoch); });
  workers_.push_back(std::move(slot));
}

std::list<std::unique_ptr<DownloadOrchestrator::WorkerSlot>>
DownloadOrchestrator::takeExitedLocked() {
  std::list<std::unique_ptr<WorkerSlot>> exited;
  for (auto it = workers_.begin(); it != workers_.end();) {
    if ((*it)->exited) {
      exited.push_back(std::move(*it));
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
  return exited;
}

void DownloadOrchestrator::workerLoop(WorkerSlot* slot, uint64_t epoch) {
  LOG(DEBUG) << "Worker started";
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_ && epoch_ == epoch && liveWorkers_ <= targetWorkers_) {
    auto item = queue_.pop();
    if (!item) {
      stateCv_.notify_all();
      queueCv_.wait_for(lock, config_.pollInterval);
      continue;
    }
    auto it = jobs_.find(item->id);
    if (it == jobs_.end() || it->second->job.state != JobState::QUEUED) continue;

    std::shared_ptr<JobEntry> entry = it->second;
    entry->job.state = JobState::DOWNLOADING;
    entry->job.startedAt = Clock::now();
    entry->job.finishedAt.reset();
    entry->job.attempts = 0;
    entry->job.progress = 0.0;
    entry->job.bytesDownloaded = 0;
    entry->job.lastError.reset();
    entry->job.errorKind = ErrorKind::NONE;
    entry->lastReported = 0.0;
    entry->lastReportedBytes = -1;
    entry->interruptRequested = false;
    entry->pauseRequested = false;
    uint64_t run = ++entry->run;
    ++activeJobs_;
    // Wakes a stale worker of this job still parked in a pause.
    stateCv_.notify_all();

    lock.unlock();
    try {
      runJob(entry, epoch, run);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Unexpected error in job " << entry->job.id << ": " << e.what();
      failJob(entry, epoch, ErrorKind::INTERNAL, e.what());
    }
    lock.lock();
    if (epoch_ == epoch) --activeJobs_;
    stateCv_.notify_all();
  }
  if (epoch_ == epoch) {
    --liveWorkers_;
    if (running_ && liveWorkers_ >= targetWorkers_) {
      LOG(INFO) << "Worker retired, " << liveWorkers_ << " remain";
    }
  }
  slot->exited = true;
  stateCv_.notify_all();
  LOG(DEBUG) << "Worker exited";
}

void DownloadOrchestrator::runJob(const std::shared_ptr<JobEntry>& entry, uint64_t epoch,
                                  uint64_t run) {
  JobSpec spec;
  DownloadConfig config;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    spec = entry->job.spec;
    config = config_;
  }

  TransferRequest request;
  request.url = spec.url;
  request.category = spec.destinationCategory;
  request.displayName = spec.displayName;
  request.fileType = spec.fileType;
  request.sizeHint = spec.sizeHint;

  std::string claimedKey;
  {
    std::lock_guard<std::mutex> persist(persistMutex_);
    if (epoch_ != epoch) return;
    int64_t historyId = history_.createDownload(spec.remoteFileId);
    history_.markStarted(historyId);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      entry->historyId = historyId;
    }
    request.destination =
        claimDestinationLocked(spec, request, config.downloadDirectory, &claimedKey);
  }
  DestinationClaim claim(*this, claimedKey);

  Job started;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    started = entry->job;
  }
  LOG(INFO) << "Job " << started.id << " started: " << spec.url << " -> "
            << request.destination.string();
  publish(JobEventType::STARTED, started);

  JobControl control(*this, entry, run);
  Transfer transfer(fetcher_, limiter_, validators_, config);
  TransferResult result = transfer.run(request, control);
  finishJob(entry, epoch, result);
}

std::filesystem::path DownloadOrchestrator::claimDestinationLocked(
    const JobSpec& spec, const TransferRequest& request, const std::string& downloadDirectory,
    std::string* key) {
  namespace fs = std::filesystem;
  if (spec.remoteFileId != 0) {
    auto existing = locals_.getByRemoteId(spec.remoteFileId);
    if (existing && !existing->path.empty()) {
      std::string existingKey = normalPath(existing->path);
      if (claimedPaths_.insert(existingKey).second) {
        *key = existingKey;
        return fs::path(existing->path);
      }
    }
  }

  fs::path base = Transfer::destinationFor(request, downloadDirectory);
  std::string stem = base.stem().string();
  std::string extension = base.extension().string();
  for (int n = 0; n <= kMaxNameSuffix; ++n) {
    fs::path candidate =
        n == 0 ? base : base.parent_path() / (stem + " (" + std::to_string(n) + ")" + extension);
    std::string candidateKey = normalPath(candidate);
    if (claimedPaths_.count(candidateKey) != 0) continue;
    if (locals_.getByPath(candidateKey)) continue;
    std::error_code ec;
    if (fs::exists(candidate, ec) || ec) continue;
    claimedPaths_.insert(candidateKey);
    *key = candidateKey;
    if (n > 0) {
      LOG(INFO) << base.filename().string() << " is taken, saving as "
                << candidate.filename().string();
    }
    return candidate;
  }
  throw IoError("No free file name for " + base.string());
}

void DownloadOrchestrator::finishJob(const std::shared_ptr<JobEntry>& entry, uint64_t epoch,
                                     const TransferResult& result) {
  std::lock_guard<std::mutex> persist(persistMutex_);
  if (epoch_ != epoch) {
    LOG(DEBUG) << "Job " << entry->job.id << " finished after shutdown, result dropped";
    return;
  }

  bool cancelled = entry->cancelRequested;
  bool interrupted = !cancelled && entry->interruptRequested &&
                     result.state == TransferState::CANCELLED;
  std::optional<std::string> persistError;
  try {
    if (cancelled) {
      if (result.ok()) {
        std::error_code ec;
        std::filesystem::remove(result.path, ec);
      }
      history_.markCancelled(entry->historyId);
    } else if (interrupted) {
      history_.markFailed(entry->historyId, kShutdownReason);
    } else if (result.ok()) {
      LocalFileRecord local;
      local.path = std::filesystem::absolute(result.path).lexically_normal().string();
      local.size = result.bytes;
      local.fileType = entry->job.spec.fileType;
      if (local.fileType.empty()) {
        std::string key = validators_.keyForExtension(result.path.extension().string());
        local.fileType = key.empty() ? "generic" : key;
      }
      local.lastCheckedAt = Clock::now();
      history_.markCompleted(entry->historyId, local);
    } else {
      history_.markFailed(entry->historyId, result.error);
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Cannot record outcome of job " << entry->job.id << ": " << e.what();
    persistError = e.what();
  }

  Job snapshot;
  JobEventType type = JobEventType::FAILED;
  std::string reason;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Job& job = entry->job;
    job.attempts = std::max(job.attempts, result.attempts);
    job.bytesDownloaded = result.bytes;
    entry->historyId = 0;
    if (interrupted) {
      job.state = JobState::QUEUED;
      job.progress = 0.0;
      job.bytesDownloaded = 0;
      job.startedAt.reset();
      entry->interruptRequested = false;
      queue_.requeue(job.id, job.priority, entry->seq);
      LOG(INFO) << "Job " << job.id << " interrupted, back in the queue";
      return;
    }
    if (cancelled) {
      markTerminalLocked(*entry, JobState::CANCELLED);
      type = JobEventType::CANCELLED;
    } else if (result.ok() && !persistError) {
      job.localPath = result.path.string();
      job.progress = 1.0;
      markTerminalLocked(*entry, JobState::COMPLETED);
      type = JobEventType::COMPLETED;
    } else {
      reason = persistError ? "could not record download: " + *persistError : result.error;
      job.lastError = reason;
      job.errorKind = persistError ? ErrorKind::IO : result.errorKind;
      markTerminalLocked(*entry, JobState::FAILED);
      type = JobEventType::FAILED;
    }
    snapshot = job;
  }
  stateCv_.notify_all();
  LOG(INFO) << "Job " << snapshot.id << " " << jobStateName(snapshot.state)
            << (reason.empty() ? "" : ": " + reason);
  publish(type, snapshot, snapshot.progress, reason);
}

void DownloadOrchestrator::failJob(const std::shared_ptr<JobEntry>& entry, uint64_t epoch,
                                   ErrorKind kind, const std::string& reason) {
  std::lock_guard<std::mutex> persist(persistMutex_);
  if (epoch_ != epoch) return;
  Job snapshot;
  int64_t historyId = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isTerminal(entry->job.state) || entry->job.state == JobState::QUEUED) return;
    historyId = entry->historyId;
    entry->historyId = 0;
    entry->job.lastError = reason;
    entry->job.errorKind = kind;
    markTerminalLocked(*entry, JobState::FAILED);
    snapshot = entry->job;
  }
  if (historyId != 0) {
    try {
      history_.markFailed(historyId, reason);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Cannot record failure of job " << snapshot.id << ": " << e.what();
    }
  }
  stateCv_.notify_all();
  publish(JobEventType::FAILED, snapshot, snapshot.progress, reason);
}

void DownloadOrchestrator::markTerminalLocked(JobEntry& entry, JobState state) {
  entry.job.state = state;
  entry.job.finishedAt = Clock::now();
  entry.pauseRequested = false;
  activeKeys_.erase(identityKey(entry.job.spec));
  finishedOrder_.push_back(entry.job.id);
}

void DownloadOrchestrator::recordProgress(const std::shared_ptr<JobEntry>& entry, uint64_t run,
                                          int64_t bytes, std::optional<int64_t> total) {
  Job snapshot;
  double reported = 0.0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry->run != run) return;
    Job& job = entry->job;
    job.bytesDownloaded = bytes;
    if (total && *total > 0) {
      double fraction = std::min(1.0, static_cast<double>(bytes) / static_cast<double>(*total));
      // Never goes backwards, not even when a retry starts over.
      if (fraction <= job.progress) return;
      job.progress = fraction;
      if (fraction - entry->lastReported < 0.01 && fraction < 1.0) return;
      entry->lastReported = fraction;
      reported = fraction;
    } else {
      if (entry->lastReportedBytes >= 0 &&
          bytes - entry->lastReportedBytes < kIndeterminateReportBytes) {
        return;
      }
      entry->lastReportedBytes = bytes;
      reported = -1.0;
    }
    snapshot = job;
  }
  publish(JobEventType::PROGRESS, snapshot, reported);
}

void DownloadOrchestrator::publish(JobEventType type, const Job& job, double progress,
                                   const std::string& reason) {
  JobEvent event;
  event.type = type;
  event.job = job;
  event.progress = progress;
  event.reason = reason;
  events_.publish(std::move(event));
}

}  // namespace docfetch
