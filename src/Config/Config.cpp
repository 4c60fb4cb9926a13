#include "Config.hpp"

#include "Common/Errors.hpp"
#include "utils/url.hpp"

DEFINE_int32(concurrent_downloads, 3, "Number of concurrent downloads (>= 1)");
DEFINE_int32(rate_limit_kbps, 0,
             "Aggregate download bandwidth cap in KiB/s (0 for unlimited)");
DEFINE_int32(retry_count, 3, "Retries after a transient download failure");
DEFINE_int32(retry_delay, 5, "Seconds to wait between download attempts");
DEFINE_string(download_directory, "downloads",
              "Root directory downloaded files are saved under");
DEFINE_int32(timeout, 30, "Network timeout in seconds");
DEFINE_string(proxy, "", "Proxy URL, e.g. http://proxy.example.com:8080");
DEFINE_string(user_agent, "", "User agent for HTTP requests");
DEFINE_int32(poll_interval_ms, 1000,
             "How long an idle worker waits for a job before re-checking");
DEFINE_int32(stop_timeout_ms, 10000,
             "How long stop() waits for in-flight workers to exit");
DEFINE_string(database, "docfetch.db", "SQLite inventory database");
DEFINE_string(plugin_modules, "",
              "Comma separated shared objects providing extra scrapers or "
              "validators");
DEFINE_string(document_extensions, ".pdf,.epub,.txt",
              "Comma separated file extensions scrapers collect");
DEFINE_string(log_dir, "logs", "Log directory");
DEFINE_string(log_level, "info", "Minimum log level (debug, info, warn, error)");
DEFINE_int32(log_max_file_size_mb, 10, "Rotate the log file at this size");
DEFINE_int32(log_max_backups, 3, "Rotated log files to keep");

namespace docfetch {

std::string defaultUserAgent() {
  return "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
         "(KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36";
}

void DownloadConfig::validate() const {
  if (concurrentDownloads < 1) {
    throw ConfigurationError("concurrent downloads must be at least 1, got " +
                             std::to_string(concurrentDownloads));
  }
  if (rateLimitKbps < 0) {
    throw ConfigurationError("rate limit must not be negative, got " +
                             std::to_string(rateLimitKbps));
  }
  if (retryCount < 0) {
    throw ConfigurationError("retry count must not be negative, got " +
                             std::to_string(retryCount));
  }
  if (retryDelay.count() < 0) {
    throw ConfigurationError("retry delay must not be negative");
  }
  if (timeout.count() <= 0) {
    throw ConfigurationError("timeout must be positive");
  }
  if (downloadDirectory.empty()) {
    throw ConfigurationError("download directory must be set");
  }
  if (pollInterval.count() <= 0) {
    throw ConfigurationError("poll interval must be positive");
  }
  if (chunkSize == 0) {
    throw ConfigurationError("chunk size must be positive");
  }
}

DownloadConfig DownloadConfig::fromFlags() {
  DownloadConfig config;
  config.concurrentDownloads = FLAGS_concurrent_downloads;
  config.rateLimitKbps = FLAGS_rate_limit_kbps;
  config.retryCount = FLAGS_retry_count;
  config.retryDelay = std::chrono::seconds(FLAGS_retry_delay);
  config.downloadDirectory = FLAGS_download_directory;
  config.timeout = std::chrono::seconds(FLAGS_timeout);
  config.proxy = FLAGS_proxy;
  config.userAgent =
      FLAGS_user_agent.empty() ? defaultUserAgent() : FLAGS_user_agent;
  config.pollInterval = std::chrono::milliseconds(FLAGS_poll_interval_ms);
  config.stopTimeout = std::chrono::milliseconds(FLAGS_stop_timeout_ms);
  config.validate();
  return config;
}

std::vector<std::string> documentExtensionsFromFlags() {
  std::vector<std::string> exts;
  for (auto ext : utils::splitList(FLAGS_document_extensions)) {
    ext = utils::toLower(ext);
    if (ext[0] != '.') ext = "." + ext;
    exts.push_back(ext);
  }
  if (exts.empty()) exts.push_back(".pdf");
  return exts;
}

std::vector<std::string> pluginModulesFromFlags() {
  return utils::splitList(FLAGS_plugin_modules);
}

utils::LogConfig logConfigFromFlags() {
  utils::LogConfig config;
  config.logFilePath = FLAGS_log_dir;
  config.maxFileSize =
      static_cast<size_t>(FLAGS_log_max_file_size_mb > 0 ? FLAGS_log_max_file_size_mb : 10) *
      1024 * 1024;
  config.maxBackupFiles =
      static_cast<size_t>(FLAGS_log_max_backups > 0 ? FLAGS_log_max_backups : 3);
  if (!utils::parseLogLevel(FLAGS_log_level, &config.minLevel)) {
    throw ConfigurationError("unknown log level: " + FLAGS_log_level);
  }
  return config;
}

}  // namespace docfetch
