#include "DirectoryScanner.hpp"

#include <filesystem>
#include <mutex>
#include <system_error>
#include <vector>

#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"

namespace docfetch {

namespace fs = std::filesystem;

namespace {

struct Candidate {
  fs::path path;
  std::string fileType;
  bool checked = false;
  bool valid = false;
  uintmax_t size = 0;
};

}  // namespace

DirectoryScanner::DirectoryScanner(LocalInventory& local, const ValidatorRegistry& validators)
    : local_(local), validators_(validators) {}

void DirectoryScanner::cancelScan() {
  cancelRequested_ = true;
  LOG(INFO) << "Directory scan cancellation requested";
}

DirectoryScanResult DirectoryScanner::scanDirectory(const std::string& rootDir,
                                                    const ProgressCallback& progress) {
  DirectoryScanResult result;
  result.rootDir = rootDir;
  cancelRequested_ = false;

  std::error_code ec;
  if (!fs::is_directory(rootDir, ec)) {
    result.error = "Directory " + rootDir + " does not exist";
    LOG(WARN) << result.error;
    return result;
  }

  std::vector<Candidate> candidates;
  fs::recursive_directory_iterator it(rootDir, fs::directory_options::skip_permission_denied, ec);
  for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    std::string key = validators_.keyForExtension(it->path().extension().string());
    if (key.empty()) continue;
    Candidate candidate;
    candidate.path = fs::absolute(it->path()).lexically_normal();
    candidate.fileType = key;
    candidates.push_back(std::move(candidate));
  }
  if (ec) {
    result.error = "Error walking " + rootDir + ": " + ec.message();
    LOG(ERROR) << result.error;
    return result;
  }
  result.filesFound = candidates.size();
  LOG(INFO) << "Found " << candidates.size() << " candidate files under " << rootDir;

  std::atomic<size_t> processed{0};
  std::mutex progressMutex;
  const size_t total = candidates.size();
  utils::TBBManager::GetInstance().ParallelFor<size_t>(
      "scan", 0, total, [&](size_t idx) {
        if (cancelRequested_) return;
        Candidate& candidate = candidates[idx];
        auto validator = validators_.resolve(candidate.fileType);
        auto outcome = validator->validate(candidate.path);
        std::error_code sizeEc;
        candidate.size = fs::file_size(candidate.path, sizeEc);
        candidate.valid = outcome.valid && !sizeEc;
        candidate.checked = true;
        if (!outcome.valid) {
          LOG(WARN) << "Invalid file: " << candidate.path.string() << " - "
                    << outcome.error.value_or("unknown");
        }
        size_t done = ++processed;
        if (progress) {
          std::lock_guard<std::mutex> lock(progressMutex);
          progress(done, total, candidate.path.string());
        }
      });
  result.cancelled = cancelRequested_;

  TimePoint now = Clock::now();
  for (const auto& candidate : candidates) {
    if (!candidate.checked) continue;
    if (!candidate.valid) {
      ++result.filesInvalid;
      continue;
    }
    LocalFileRecord record;
    record.path = candidate.path.string();
    record.size = static_cast<int64_t>(candidate.size);
    record.fileType = candidate.fileType;
    record.lastCheckedAt = now;
    auto existing = local_.getByPath(record.path);
    if (existing) {
      record.linkedRemoteId = existing->linkedRemoteId;
      ++result.filesUpdated;
    } else {
      ++result.filesAdded;
    }
    local_.upsertLocal(record);
    ++result.filesByType[candidate.fileType];
  }

  result.success = true;
  LOG(INFO) << "Directory scan of " << rootDir << (result.cancelled ? " cancelled" : " done")
            << ": " << result.filesAdded << " added, " << result.filesUpdated << " updated, "
            << result.filesInvalid << " invalid";
  return result;
}

}  // namespace docfetch
