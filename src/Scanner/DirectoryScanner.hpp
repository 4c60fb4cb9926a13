#ifndef DOCFETCH_DIRECTORY_SCANNER_HPP_
#define DOCFETCH_DIRECTORY_SCANNER_HPP_

#include <atomic>
#include <functional>
#include <map>
#include <string>

#include "Inventory/Inventory.hpp"
#include "Validator/ValidatorRegistry.hpp"

namespace docfetch {

struct DirectoryScanResult {
  bool success = false;
  bool cancelled = false;
  std::string rootDir;
  size_t filesFound = 0;
  size_t filesAdded = 0;
  size_t filesUpdated = 0;
  size_t filesInvalid = 0;
  std::map<std::string, size_t> filesByType;
  std::string error;
};

/**
 * @brief Walks a directory tree and records every file with a registered
 * extension that passes validation in the local inventory.
 *
 * Validation runs on the "scan" TBB arena. Existing records keep their
 * link to a remote file.
 */
class DirectoryScanner {
 public:
  // (processed, total, current path); may be called from arena threads.
  using ProgressCallback = std::function<void(size_t, size_t, const std::string&)>;

  DirectoryScanner(LocalInventory& local, const ValidatorRegistry& validators);

  DirectoryScanResult scanDirectory(const std::string& rootDir,
                                    const ProgressCallback& progress = nullptr);
  void cancelScan();

 private:
  LocalInventory& local_;
  const ValidatorRegistry& validators_;
  std::atomic<bool> cancelRequested_{false};
};

}  // namespace docfetch

#endif  // DOCFETCH_DIRECTORY_SCANNER_HPP_
