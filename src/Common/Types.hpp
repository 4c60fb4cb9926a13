#ifndef DOCFETCH_TYPES_HPP_
#define DOCFETCH_TYPES_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace docfetch {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct Site {
  int64_t id = 0;
  std::string name;
  std::string url;
  std::string scraperType;
  std::optional<TimePoint> lastScanAt;
};

// A category as reported by a scraper. `id` is the scraper's own key.
struct Category {
  std::string id;
  std::string name;
  std::string url;
  std::optional<std::string> parentId;
};

// A file as reported by a scraper.
struct RemoteFile {
  std::string name;
  std::string url;
  std::optional<int64_t> size;
  std::string fileType;
  std::string categoryId;
};

struct CategoryRecord {
  int64_t id = 0;
  int64_t siteId = 0;
  std::string key;
  std::string name;
  std::string url;
  std::optional<int64_t> parentId;
};

struct RemoteFileRecord {
  int64_t id = 0;
  int64_t siteId = 0;
  std::optional<int64_t> categoryId;
  std::string url;
  std::string name;
  std::optional<int64_t> size;
  std::string fileType;
  TimePoint lastCheckedAt{};
};

struct LocalFileRecord {
  int64_t id = 0;
  std::string path;
  int64_t size = 0;
  std::string fileType;
  std::optional<int64_t> linkedRemoteId;
  TimePoint lastCheckedAt{};
};

enum class DownloadStatus { PENDING, IN_PROGRESS, COMPLETED, FAILED, CANCELLED };

struct DownloadRecord {
  int64_t id = 0;
  int64_t remoteFileId = 0;
  std::optional<int64_t> localFileId;
  DownloadStatus status = DownloadStatus::PENDING;
  std::optional<TimePoint> startedAt;
  std::optional<TimePoint> completedAt;
  std::optional<std::string> errorMessage;
};

const char* downloadStatusName(DownloadStatus status);
std::optional<DownloadStatus> parseDownloadStatus(const std::string& name);

// "2024-05-01 12:00:00" in UTC, the format the inventory persists.
std::string formatTime(TimePoint tp);
std::optional<TimePoint> parseTime(const std::string& text);

}  // namespace docfetch

#endif  // DOCFETCH_TYPES_HPP_
