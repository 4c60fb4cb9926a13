#include "CurlFetcher.hpp"

#include <curl/curl.h>

#include <exception>
#include <memory>
#include <mutex>

#include "Common/Errors.hpp"
#include "utils/logger.hpp"

namespace docfetch {

namespace {

std::once_flag curl_global_flag;

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

struct WriteContext {
  CURL* curl = nullptr;
  HttpBodySink* sink = nullptr;
  bool started = false;
  std::exception_ptr error;
};

void startResponse(WriteContext* ctx) {
  long status = 0;
  curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    throw HttpStatusError(status);
  }
  curl_off_t length = -1;
  curl_easy_getinfo(ctx->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
  ctx->started = true;
  ctx->sink->onResponseStart(
      status, length >= 0 ? std::optional<int64_t>(static_cast<int64_t>(length))
                          : std::nullopt);
}

// 写入回调：异常不能穿过 libcurl，先保存，perform 返回后再抛出
size_t write_data(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<WriteContext*>(userdata);
  size_t total = size * nmemb;
  try {
    if (!ctx->started) startResponse(ctx);
    ctx->sink->onBodyData(ptr, total);
  } catch (...) {
    ctx->error = std::current_exception();
    return 0;  // CURLE_WRITE_ERROR
  }
  return total;
}

}  // namespace

CurlFetcher::CurlFetcher() {
  std::call_once(curl_global_flag, []() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
      LOG(ERROR) << "curl_global_init failed: " << curl_easy_strerror(rc);
    }
  });
}

CurlFetcher::~CurlFetcher() = default;

void CurlFetcher::get(const HttpRequest& request, HttpBodySink& sink) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw NetworkError("curl_easy_init failed for " + request.url);
  }

  std::unique_ptr<curl_slist, SlistDeleter> headers;
  for (const auto& header : request.headers) {
    std::string line = header.first + ": " + header.second;
    curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
    if (!appended) throw NetworkError("curl_slist_append failed");
    headers.release();
    headers.reset(appended);
  }

  WriteContext ctx;
  ctx.curl = curl.get();
  ctx.sink = &sink;
  char errbuf[CURL_ERROR_SIZE] = {0};
  long timeout = static_cast<long>(request.timeout.count());

  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_data);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
  // A connection that cannot be opened, or that stalls, for `timeout`
  // seconds is a timeout. Slow but steady transfers are not cut off.
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, timeout);
  curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, timeout);
  if (!request.userAgent.empty()) {
    curl_easy_setopt(h, CURLOPT_USERAGENT, request.userAgent.c_str());
  }
  if (!request.proxy.empty()) {
    curl_easy_setopt(h, CURLOPT_PROXY, request.proxy.c_str());
  }
  if (headers) {
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  }

  LOG(DEBUG) << "GET " << request.url;
  CURLcode res = curl_easy_perform(h);
  if (ctx.error) {
    std::rethrow_exception(ctx.error);
  }
  if (res != CURLE_OK) {
    std::string detail = errbuf[0] ? errbuf : curl_easy_strerror(res);
    throw NetworkError(request.url + ": " + detail);
  }
  if (!ctx.started) {
    // Empty body: the status has not been checked yet.
    startResponse(&ctx);
  }
}

}  // namespace docfetch
