#ifndef DOCFETCH_CONFIG_HPP_
#define DOCFETCH_CONFIG_HPP_

#include <gflags/gflags.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/logger.hpp"

DECLARE_int32(concurrent_downloads);
DECLARE_int32(rate_limit_kbps);
DECLARE_int32(retry_count);
DECLARE_int32(retry_delay);
DECLARE_string(download_directory);
DECLARE_int32(timeout);
DECLARE_string(proxy);
DECLARE_string(user_agent);
DECLARE_int32(poll_interval_ms);
DECLARE_int32(stop_timeout_ms);
DECLARE_string(database);
DECLARE_string(plugin_modules);
DECLARE_string(document_extensions);
DECLARE_string(log_dir);
DECLARE_string(log_level);
DECLARE_int32(log_max_file_size_mb);
DECLARE_int32(log_max_backups);

namespace docfetch {

constexpr size_t kDefaultChunkSize = 8 * 1024;

// Snapshot of the download settings. Read once when the orchestrator is
// built and again on reconfigure.
struct DownloadConfig {
  int concurrentDownloads = 3;
  int64_t rateLimitKbps = 0;  // 0 = unlimited
  int retryCount = 3;
  std::chrono::milliseconds retryDelay{5000};
  std::string downloadDirectory = "downloads";
  std::chrono::seconds timeout{30};
  std::string proxy;
  std::string userAgent;
  std::chrono::milliseconds pollInterval{1000};
  std::chrono::milliseconds stopTimeout{10000};
  size_t chunkSize = kDefaultChunkSize;

  int64_t rateLimitBytesPerSecond() const { return rateLimitKbps * 1024; }

  // Throws ConfigurationError naming the first bad setting.
  void validate() const;

  static DownloadConfig fromFlags();
};

std::string defaultUserAgent();

// Extensions the scrapers treat as documents, e.g. {".pdf", ".epub"}.
std::vector<std::string> documentExtensionsFromFlags();
std::vector<std::string> pluginModulesFromFlags();

utils::LogConfig logConfigFromFlags();

}  // namespace docfetch

#endif  // DOCFETCH_CONFIG_HPP_
