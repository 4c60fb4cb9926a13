#ifndef DOCFETCH_CURL_FETCHER_HPP_
#define DOCFETCH_CURL_FETCHER_HPP_

#include "HttpFetcher.hpp"

namespace docfetch {

// libcurl easy-interface implementation. One easy handle per call, so a
// single instance is safe to share between workers.
class CurlFetcher : public HttpFetcher {
 public:
  CurlFetcher();
  ~CurlFetcher() override;

  void get(const HttpRequest& request, HttpBodySink& sink) override;
};

}  // namespace docfetch

#endif  // DOCFETCH_CURL_FETCHER_HPP_
