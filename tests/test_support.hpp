#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "Common/Errors.hpp"
#include "Http/HttpFetcher.hpp"

namespace docfetch {
namespace testing_support {

// Canned HTTP responses keyed by url. Unknown urls answer 404.
class FakeFetcher : public HttpFetcher {
 public:
  struct Response {
    long status = 200;
    std::string body;
    bool sendLength = true;
    // Network errors thrown before the first successful answer.
    int failuresBefore = 0;
    bool alwaysNetworkError = false;
    size_t chunkSize = 4096;
    std::chrono::milliseconds chunkDelay{0};
    // Only the first request of the url waits this long before answering.
    std::chrono::milliseconds firstCallDelay{0};
  };

  void set(const std::string& url, Response response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[url] = std::move(response);
  }

  void setBody(const std::string& url, const std::string& body) {
    Response response;
    response.body = body;
    set(url, response);
  }

  void get(const HttpRequest& request, HttpBodySink& sink) override {
    Response response;
    bool firstCall = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      firstCall = ++calls_[request.url] == 1;
      lastUserAgent_ = request.userAgent;
      auto it = responses_.find(request.url);
      if (it == responses_.end()) throw HttpStatusError(404);
      if (it->second.alwaysNetworkError) throw NetworkError("connection refused");
      if (it->second.failuresBefore > 0) {
        --it->second.failuresBefore;
        throw NetworkError("connection reset");
      }
      response = it->second;
    }
    if (firstCall && response.firstCallDelay.count() > 0) {
      std::this_thread::sleep_for(response.firstCallDelay);
    }
    if (response.status < 200 || response.status >= 300) {
      throw HttpStatusError(response.status);
    }
    std::optional<int64_t> length;
    if (response.sendLength) length = static_cast<int64_t>(response.body.size());
    sink.onResponseStart(response.status, length);
    size_t offset = 0;
    while (offset < response.body.size()) {
      if (response.chunkDelay.count() > 0) std::this_thread::sleep_for(response.chunkDelay);
      size_t piece = std::min(response.chunkSize, response.body.size() - offset);
      sink.onBodyData(response.body.data() + offset, piece);
      offset += piece;
    }
  }

  int calls(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(url);
    return it == calls_.end() ? 0 : it->second;
  }

  std::string lastUserAgent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastUserAgent_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Response> responses_;
  std::map<std::string, int> calls_;
  std::string lastUserAgent_;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("docfetch_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path write(const std::string& relative, const std::string& content) const {
    std::filesystem::path file = path_ / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file;
  }

 private:
  std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Smallest file the PDF validator accepts.
// Well-formed PDF with an xref table; `pages` empty page objects.
inline std::string minimalPdf(const std::string& title = "Sample", int pages = 1) {
  std::string kids;
  for (int i = 0; i < pages; ++i) kids += std::to_string(4 + i) + " 0 R ";
  std::vector<std::string> objects = {
      "<< /Type /Catalog /Pages 2 0 R >>",
      "<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pages) + " >>",
      "<< /Title (" + title + ") >>"};
  for (int i = 0; i < pages; ++i) {
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] >>");
  }

  std::string out = "%PDF-1.4\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); ++i) {
    offsets.push_back(out.size());
    out += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }
  size_t xref = out.size();
  out += "xref\n0 " + std::to_string(objects.size() + 1) + "\n0000000000 65535 f \n";
  for (size_t offset : offsets) {
    char line[32];
    std::snprintf(line, sizeof(line), "%010zu 00000 n \n", offset);
    out += line;
  }
  out += "trailer\n<< /Size " + std::to_string(objects.size() + 1) +
         " /Root 1 0 R /Info 3 0 R >>\nstartxref\n" + std::to_string(xref) + "\n%%EOF\n";
  return out;
}

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

}  // namespace testing_support
}  // namespace docfetch
