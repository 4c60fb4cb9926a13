#include "Types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace docfetch {

const char* downloadStatusName(DownloadStatus status) {
  switch (status) {
    case DownloadStatus::PENDING:
      return "pending";
    case DownloadStatus::IN_PROGRESS:
      return "in_progress";
    case DownloadStatus::COMPLETED:
      return "completed";
    case DownloadStatus::FAILED:
      return "failed";
    case DownloadStatus::CANCELLED:
      return "cancelled";
  }
  return "pending";
}

std::optional<DownloadStatus> parseDownloadStatus(const std::string& name) {
  if (name == "pending") return DownloadStatus::PENDING;
  if (name == "in_progress") return DownloadStatus::IN_PROGRESS;
  if (name == "completed") return DownloadStatus::COMPLETED;
  if (name == "failed") return DownloadStatus::FAILED;
  if (name == "cancelled") return DownloadStatus::CANCELLED;
  return std::nullopt;
}

std::string formatTime(TimePoint tp) {
  auto t = Clock::to_time_t(tp);
  std::tm tm;
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::optional<TimePoint> parseTime(const std::string& text) {
  if (text.empty()) return std::nullopt;
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  if (iss.fail()) return std::nullopt;
  return Clock::from_time_t(timegm(&tm));
}

}  // namespace docfetch
