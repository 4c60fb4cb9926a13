#include "HttpFetcher.hpp"

namespace docfetch {

namespace {

class StringSink : public HttpBodySink {
 public:
  void onResponseStart(long, std::optional<int64_t> contentLength) override {
    if (contentLength && *contentLength > 0) {
      body.reserve(static_cast<size_t>(*contentLength));
    }
  }
  void onBodyData(const char* data, size_t size) override {
    body.append(data, size);
  }

  std::string body;
};

}  // namespace

std::string HttpFetcher::getText(const HttpRequest& request) {
  StringSink sink;
  get(request, sink);
  return std::move(sink.body);
}

}  // namespace docfetch
