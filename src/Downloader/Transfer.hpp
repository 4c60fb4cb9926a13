#ifndef DOCFETCH_TRANSFER_HPP_
#define DOCFETCH_TRANSFER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "Common/Errors.hpp"
#include "Config/Config.hpp"
#include "Http/HttpFetcher.hpp"
#include "RateLimiter.hpp"
#include "Validator/ValidatorRegistry.hpp"

namespace docfetch {

enum class TransferState { PENDING, CONNECTING, STREAMING, COMPLETED, FAILED, CANCELLED };

const char* transferStateName(TransferState state);

// How the owner of a transfer steers it. Called from the transfer's thread.
class TransferControl {
 public:
  virtual ~TransferControl() = default;
  // Non-blocking: true once the transfer has to give up.
  virtual bool stopRequested() const = 0;
  // Blocks while paused. False when the transfer has to give up.
  virtual bool shouldContinue() = 0;
  // Sleeps for `delay` unless stopped first; false when stopped.
  virtual bool waitFor(std::chrono::milliseconds delay) = 0;
  // total is empty while the size is unknown.
  virtual void onProgress(int64_t bytes, std::optional<int64_t> total) = 0;
  virtual void onAttempt(int /*attempt*/) {}
};

struct TransferRequest {
  std::string url;
  std::string category;
  std::string displayName;
  std::string fileType;
  std::optional<int64_t> sizeHint;
  // Empty: destinationFor()
  std::filesystem::path destination;
};

struct TransferResult {
  TransferState state = TransferState::PENDING;
  std::filesystem::path path;
  int64_t bytes = 0;
  int attempts = 0;
  std::string error;
  ErrorKind errorKind = ErrorKind::NONE;
  std::optional<ValidationOutcome> validation;

  bool ok() const { return state == TransferState::COMPLETED; }
};

/**
 * @brief One GET-to-file download with retries, rate-limited chunked
 * writes, progress reporting and post-download validation.
 *
 * Network errors are retried from scratch after retryDelay, up to
 * retryCount more attempts. Non-2xx responses and local I/O errors fail
 * at once. The partial file is removed on failure; a file that
 * downloads but fails validation is kept.
 */
class Transfer {
 public:
  Transfer(HttpFetcher& fetcher, RateLimiter& limiter, const ValidatorRegistry& validators,
           const DownloadConfig& config);

  // Never throws.
  TransferResult run(const TransferRequest& request, TransferControl& control);

  TransferState state() const { return state_.load(); }

  // <download dir>/<category>/<file name>
  static std::filesystem::path destinationFor(const TransferRequest& request,
                                              const std::string& downloadDirectory);

 private:
  void attempt(const TransferRequest& request, const std::filesystem::path& path,
               TransferControl& control, TransferResult& result);
  void finish(TransferResult& result, TransferState state, ErrorKind kind,
              const std::string& error);

  HttpFetcher& fetcher_;
  RateLimiter& limiter_;
  const ValidatorRegistry& validators_;
  DownloadConfig config_;
  std::atomic<TransferState> state_{TransferState::PENDING};
};

}  // namespace docfetch

#endif  // DOCFETCH_TRANSFER_HPP_
