#include "Transfer.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <system_error>

#include "utils/logger.hpp"
#include "utils/url.hpp"

namespace docfetch {

namespace fs = std::filesystem;

namespace {

// Streams the body into the destination file slice by slice.
class FileSink : public HttpBodySink {
 public:
  FileSink(std::ofstream& out, RateLimiter& limiter, TransferControl& control,
           size_t chunkSize, std::optional<int64_t> sizeHint,
           std::atomic<TransferState>& state, int64_t& bytes)
      : out_(out),
        limiter_(limiter),
        control_(control),
        chunkSize_(chunkSize),
        total_(sizeHint),
        state_(state),
        bytes_(bytes) {}

  void onResponseStart(long, std::optional<int64_t> contentLength) override {
    if (contentLength) total_ = contentLength;
    state_ = TransferState::STREAMING;
    control_.onProgress(bytes_, total_);
  }

  void onBodyData(const char* data, size_t size) override {
    size_t offset = 0;
    while (offset < size) {
      if (!control_.shouldContinue()) throw TransferAborted();
      size_t piece = std::min(chunkSize_, size - offset);
      if (!limiter_.acquire(piece, [this] { return !control_.stopRequested(); })) {
        throw TransferAborted();
      }
      out_.write(data + offset, static_cast<std::streamsize>(piece));
      if (!out_) throw IoError("write failed");
      offset += piece;
      bytes_ += static_cast<int64_t>(piece);
      control_.onProgress(bytes_, total_);
    }
  }

 private:
  std::ofstream& out_;
  RateLimiter& limiter_;
  TransferControl& control_;
  size_t chunkSize_;
  std::optional<int64_t> total_;
  std::atomic<TransferState>& state_;
  int64_t& bytes_;
};

void removePartial(const fs::path& path) {
  std::error_code ec;
  if (fs::remove(path, ec)) {
    LOG(DEBUG) << "Removed partial download " << path.string();
  } else if (ec) {
    LOG(ERROR) << "Error removing partial download " << path.string() << ": " << ec.message();
  }
}

std::string timestampName() {
  std::time_t now = std::time(nullptr);
  std::tm tm;
  localtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return std::string("download_") + buf;
}

}  // namespace

const char* transferStateName(TransferState state) {
  switch (state) {
    case TransferState::PENDING:
      return "pending";
    case TransferState::CONNECTING:
      return "connecting";
    case TransferState::STREAMING:
      return "streaming";
    case TransferState::COMPLETED:
      return "completed";
    case TransferState::FAILED:
      return "failed";
    case TransferState::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

Transfer::Transfer(HttpFetcher& fetcher, RateLimiter& limiter,
                   const ValidatorRegistry& validators, const DownloadConfig& config)
    : fetcher_(fetcher), limiter_(limiter), validators_(validators), config_(config) {}

fs::path Transfer::destinationFor(const TransferRequest& request,
                                  const std::string& downloadDirectory) {
  std::string name = utils::sanitizeFilename(utils::fileNameFromUrl(request.url));
  if (utils::extensionOf(name).empty()) {
    std::string type = utils::toLower(request.fileType);
    std::string base = utils::sanitizeFilename(request.displayName);
    if (base.empty()) base = name.empty() ? timestampName() : name;
    if (!type.empty() && type != "generic" && !utils::endsWith(utils::toLower(base), "." + type)) {
      base += "." + type;
    }
    name = base;
  }

  fs::path dir(downloadDirectory);
  std::string category = utils::sanitizeFilename(request.category);
  if (!category.empty()) dir /= category;
  return dir / name;
}

void Transfer::finish(TransferResult& result, TransferState state, ErrorKind kind,
                      const std::string& error) {
  result.state = state;
  result.errorKind = kind;
  result.error = error;
  state_ = state;
}

TransferResult Transfer::run(const TransferRequest& request, TransferControl& control) {
  TransferResult result;
  state_ = TransferState::PENDING;
  result.path = request.destination.empty() ? destinationFor(request, config_.downloadDirectory)
                                            : request.destination;

  std::error_code ec;
  fs::create_directories(result.path.parent_path(), ec);
  if (ec) {
    finish(result, TransferState::FAILED, ErrorKind::IO,
           "Cannot create " + result.path.parent_path().string() + ": " + ec.message());
    LOG(ERROR) << result.error;
    return result;
  }

  const int maxAttempts = config_.retryCount + 1;
  for (int attemptNo = 1; attemptNo <= maxAttempts; ++attemptNo) {
    if (control.stopRequested()) {
      finish(result, TransferState::CANCELLED, ErrorKind::CANCELLED, "transfer aborted");
      return result;
    }
    result.attempts = attemptNo;
    control.onAttempt(attemptNo);

    bool retry = false;
    try {
      attempt(request, result.path, control, result);
      break;
    } catch (const TransferAborted& e) {
      removePartial(result.path);
      finish(result, TransferState::CANCELLED, ErrorKind::CANCELLED, e.what());
      LOG(INFO) << "Download of " << request.url << " stopped";
      return result;
    } catch (const NetworkError& e) {
      removePartial(result.path);
      finish(result, TransferState::FAILED, e.kind(), e.what());
      retry = true;
    } catch (const Error& e) {
      removePartial(result.path);
      finish(result, TransferState::FAILED, e.kind(), e.what());
    } catch (const std::exception& e) {
      removePartial(result.path);
      finish(result, TransferState::FAILED, ErrorKind::IO, e.what());
    }

    if (!retry) {
      LOG(ERROR) << "Error downloading " << request.url << ": " << result.error;
      return result;
    }
    if (attemptNo == maxAttempts) {
      LOG(ERROR) << "Giving up on " << request.url << " after " << attemptNo
                 << " attempts: " << result.error;
      return result;
    }
    LOG(WARN) << "Download attempt " << attemptNo << " failed for " << request.url << ": "
              << result.error << "; retrying in " << config_.retryDelay.count() << " ms";
    if (!control.waitFor(config_.retryDelay)) {
      finish(result, TransferState::CANCELLED, ErrorKind::CANCELLED, "transfer aborted");
      return result;
    }
  }

  auto validator = validators_.resolveForFile(result.path, request.fileType);
  auto outcome = validator->validate(result.path);
  result.validation = outcome;
  if (!outcome.valid) {
    finish(result, TransferState::FAILED, ErrorKind::VALIDATION,
           "Validation failed: " + outcome.error.value_or("unknown reason"));
    LOG(WARN) << result.path.string() << ": " << result.error;
    return result;
  }

  finish(result, TransferState::COMPLETED, ErrorKind::NONE, "");
  LOG(INFO) << "Downloaded " << request.url << " to " << result.path.string() << " ("
            << result.bytes << " bytes)";
  return result;
}

void Transfer::attempt(const TransferRequest& request, const fs::path& path,
                       TransferControl& control, TransferResult& result) {
  state_ = TransferState::CONNECTING;
  result.bytes = 0;

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) throw IoError("Cannot open " + path.string() + " for writing");

  HttpRequest http;
  http.url = request.url;
  http.timeout = config_.timeout;
  http.proxy = config_.proxy;
  http.userAgent = config_.userAgent;

  FileSink sink(out, limiter_, control, config_.chunkSize, request.sizeHint, state_,
                result.bytes);
  fetcher_.get(http, sink);
  out.close();
  if (!out) throw IoError("Error closing " + path.string());
}

}  // namespace docfetch
