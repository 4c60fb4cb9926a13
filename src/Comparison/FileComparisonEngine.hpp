#ifndef DOCFETCH_FILE_COMPARISON_ENGINE_HPP_
#define DOCFETCH_FILE_COMPARISON_ENGINE_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "Common/Types.hpp"
#include "Downloader/Job.hpp"
#include "Validator/ValidatorRegistry.hpp"

namespace docfetch {

struct UpdatedFile {
  RemoteFileRecord remote;
  LocalFileRecord local;
};

struct CorruptedFile {
  RemoteFileRecord remote;
  LocalFileRecord local;
  std::string reason;
};

struct ComparisonResult {
  std::vector<RemoteFileRecord> newFiles;
  std::vector<UpdatedFile> updatedFiles;
  std::vector<CorruptedFile> corruptedFiles;
  std::vector<RemoteFileRecord> okFiles;

  size_t total() const {
    return newFiles.size() + updatedFiles.size() + corruptedFiles.size() + okFiles.size();
  }
};

/**
 * @brief Sorts remote files into new / updated / corrupted / ok against the
 * local files linked to them.
 *
 * Each remote file lands in exactly one bucket, and every bucket keeps the
 * order of the input. An unknown remote size counts as a match.
 */
class FileComparisonEngine {
 public:
  explicit FileComparisonEngine(const ValidatorRegistry& validators);

  ComparisonResult compare(const std::vector<RemoteFileRecord>& remoteFiles,
                           const std::vector<LocalFileRecord>& localFiles) const;

  // categoryNames maps category record ids to the sub-directory the
  // download goes to; unknown categories download to the root.
  static std::vector<JobSpec> buildDownloadQueue(
      const ComparisonResult& result, bool includeNew = true, bool includeUpdated = true,
      bool includeCorrupted = true,
      const std::map<int64_t, std::string>& categoryNames = {});

 private:
  const ValidatorRegistry& validators_;
};

}  // namespace docfetch

#endif  // DOCFETCH_FILE_COMPARISON_ENGINE_HPP_
