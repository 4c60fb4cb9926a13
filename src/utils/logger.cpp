#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
std::string log_dir = "logs";
std::string log_name = "docfetch.log";
std::string log_file_path;
size_t max_file_size = 10 * 1024 * 1024;  // 10MB
size_t max_backup_files = 3;
bool log_to_console = true;
std::atomic<int> min_level{static_cast<int>(LogLevel::INFO)};

const char* getLevelStr(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// Only the basename of __FILE__ goes into the line prefix.
const char* baseName(const char* file) {
  const char* base = file;
  for (const char* p = file; *p; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty() || !std::filesystem::exists(log_file_path, ec) ||
      std::filesystem::file_size(log_file_path, ec) < max_file_size || ec) {
    return;
  }
  log_file.close();
  // Rotate old logs
  for (int i = static_cast<int>(max_backup_files) - 1; i >= 0; --i) {
    std::string old_name =
        log_file_path + (i == 0 ? "" : ("." + std::to_string(i)));
    std::string new_name = log_file_path + "." + std::to_string(i + 1);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  log_file.open(log_file_path, std::ios::trunc);
}

void openLogFile() {
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  log_file_path = (std::filesystem::path(log_dir) / log_name).string();
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
  }
}
}  // namespace

bool parseLogLevel(const std::string& text, LogLevel* level) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    *level = LogLevel::DEBUG;
  } else if (lower == "info") {
    *level = LogLevel::INFO;
  } else if (lower == "warn" || lower == "warning") {
    *level = LogLevel::WARN;
  } else if (lower == "error") {
    *level = LogLevel::ERROR;
  } else if (lower == "fatal") {
    *level = LogLevel::FATAL;
  } else {
    return false;
  }
  return true;
}

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) log_file.close();
  log_dir = config.logFilePath.empty() ? "logs" : config.logFilePath;
  log_name = config.fileName.empty() ? "docfetch.log" : config.fileName;
  max_file_size = config.maxFileSize ? config.maxFileSize : 10 * 1024 * 1024;
  max_backup_files = config.maxBackupFiles ? config.maxBackupFiles : 3;
  log_to_console = config.console;
  min_level.store(static_cast<int>(config.minLevel));
  openLogFile();
}

void Logger::setMinLevel(LogLevel level) {
  min_level.store(static_cast<int>(level));
}

bool Logger::enabled(LogLevel level) {
  return static_cast<int>(level) >= min_level.load(std::memory_order_relaxed);
}

Logger::LogStream::LogStream(LogLevel level, const char* file, const char* func,
                             int line)
    : level_(level), enabled_(Logger::enabled(level)), oss_() {
  if (!enabled_) return;
  oss_ << "[" << getLevelStr(level) << "] " << getCurrentTime() << " "
       << baseName(file) << ":" << line << " " << func << ": ";
}

Logger::LogStream::~LogStream() {
  if (!enabled_) return;
  oss_ << "\n";
  std::string msg = oss_.str();
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) openLogFile();
    rotateLogsIfNeeded();
    if (log_to_console) {
      (level_ >= LogLevel::WARN ? std::cerr : std::cout) << msg;
    }
    if (log_file.is_open()) log_file << msg, log_file.flush();
  }
}

}  // namespace utils
