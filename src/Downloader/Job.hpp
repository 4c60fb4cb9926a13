#ifndef DOCFETCH_JOB_HPP_
#define DOCFETCH_JOB_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "Common/Errors.hpp"
#include "Common/Types.hpp"

namespace docfetch {

using JobId = int64_t;

// Lower value = more urgent.
constexpr int kDefaultPriority = 5;

enum class JobState { QUEUED, DOWNLOADING, PAUSED, COMPLETED, FAILED, CANCELLED };

const char* jobStateName(JobState state);
bool isTerminal(JobState state);

// What to download and where it belongs.
struct JobSpec {
  int64_t remoteFileId = 0;
  int64_t siteId = 0;
  std::string url;
  std::string displayName;
  std::optional<int64_t> sizeHint;
  std::string fileType;
  std::string destinationCategory;
};

// Snapshot of a job as the orchestrator sees it.
struct Job {
  JobId id = 0;
  JobSpec spec;
  int priority = kDefaultPriority;
  JobState state = JobState::QUEUED;
  double progress = 0.0;  // -1 while the total size is unknown
  int64_t bytesDownloaded = 0;
  int attempts = 0;
  std::optional<std::string> lastError;
  ErrorKind errorKind = ErrorKind::NONE;
  std::optional<std::string> localPath;
  TimePoint createdAt{};
  std::optional<TimePoint> startedAt;
  std::optional<TimePoint> finishedAt;
};

}  // namespace docfetch

#endif  // DOCFETCH_JOB_HPP_
