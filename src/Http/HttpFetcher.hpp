#ifndef DOCFETCH_HTTP_FETCHER_HPP_
#define DOCFETCH_HTTP_FETCHER_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace docfetch {

struct HttpRequest {
  std::string url;
  std::chrono::seconds timeout{30};
  std::string proxy;
  std::string userAgent;
  std::vector<std::pair<std::string, std::string>> headers;
};

// Receives a 2xx response body as it streams in.
class HttpBodySink {
 public:
  virtual ~HttpBodySink() = default;
  // Called once, before any body data. contentLength is empty when the
  // server sent no usable Content-Length.
  virtual void onResponseStart(long status,
                               std::optional<int64_t> contentLength) = 0;
  virtual void onBodyData(const char* data, size_t size) = 0;
};

/**
 * @brief Blocking HTTP GET.
 *
 * get() throws NetworkError for connect/read failures and timeouts and
 * HttpStatusError for non-2xx responses (no body is delivered then).
 * Exceptions thrown by the sink propagate out of get() unchanged.
 */
class HttpFetcher {
 public:
  virtual ~HttpFetcher() = default;
  virtual void get(const HttpRequest& request, HttpBodySink& sink) = 0;

  // Whole body as a string.
  std::string getText(const HttpRequest& request);
};

}  // namespace docfetch

#endif  // DOCFETCH_HTTP_FETCHER_HPP_
