#include "FileComparisonEngine.hpp"

#include <optional>
#include <unordered_map>

#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"

namespace docfetch {

namespace {

enum class Verdict { NEW, UPDATED, CHECK, CORRUPTED, OK };

struct Slot {
  Verdict verdict = Verdict::NEW;
  const LocalFileRecord* local = nullptr;
  std::string reason;
};

JobSpec specFor(const RemoteFileRecord& remote,
                const std::map<int64_t, std::string>& categoryNames) {
  JobSpec spec;
  spec.remoteFileId = remote.id;
  spec.siteId = remote.siteId;
  spec.url = remote.url;
  spec.displayName = remote.name;
  spec.sizeHint = remote.size;
  spec.fileType = remote.fileType;
  if (remote.categoryId) {
    auto it = categoryNames.find(*remote.categoryId);
    if (it != categoryNames.end()) spec.destinationCategory = it->second;
  }
  return spec;
}

}  // namespace

FileComparisonEngine::FileComparisonEngine(const ValidatorRegistry& validators)
    : validators_(validators) {}

ComparisonResult FileComparisonEngine::compare(
    const std::vector<RemoteFileRecord>& remoteFiles,
    const std::vector<LocalFileRecord>& localFiles) const {
  // 远程文件 id -> 关联的本地文件
  std::unordered_map<int64_t, const LocalFileRecord*> linked;
  for (const auto& local : localFiles) {
    if (local.linkedRemoteId) linked.emplace(*local.linkedRemoteId, &local);
  }

  std::vector<Slot> slots(remoteFiles.size());
  std::vector<size_t> toValidate;
  for (size_t i = 0; i < remoteFiles.size(); ++i) {
    const RemoteFileRecord& remote = remoteFiles[i];
    auto it = linked.find(remote.id);
    if (it == linked.end()) continue;
    slots[i].local = it->second;
    if (remote.size && *remote.size != it->second->size) {
      slots[i].verdict = Verdict::UPDATED;
    } else {
      slots[i].verdict = Verdict::CHECK;
      toValidate.push_back(i);
    }
  }

  utils::TBBManager::GetInstance().ParallelFor<size_t>(
      "validate", 0, toValidate.size(), [&](size_t n) {
        Slot& slot = slots[toValidate[n]];
        auto validator = validators_.resolveForFile(slot.local->path, slot.local->fileType);
        auto outcome = validator->validate(slot.local->path);
        if (outcome.valid) {
          slot.verdict = Verdict::OK;
        } else {
          slot.verdict = Verdict::CORRUPTED;
          slot.reason = outcome.error.value_or("validation failed");
        }
      });

  ComparisonResult result;
  for (size_t i = 0; i < remoteFiles.size(); ++i) {
    const RemoteFileRecord& remote = remoteFiles[i];
    Slot& slot = slots[i];
    switch (slot.verdict) {
      case Verdict::NEW:
        result.newFiles.push_back(remote);
        break;
      case Verdict::UPDATED:
        result.updatedFiles.push_back({remote, *slot.local});
        break;
      case Verdict::CHECK:
        // The validation task threw; ParallelFor already logged it.
        result.corruptedFiles.push_back({remote, *slot.local, "validation did not complete"});
        break;
      case Verdict::CORRUPTED:
        result.corruptedFiles.push_back({remote, *slot.local, slot.reason});
        break;
      case Verdict::OK:
        result.okFiles.push_back(remote);
        break;
    }
  }

  LOG(INFO) << "Compared " << remoteFiles.size() << " remote files: " << result.newFiles.size()
            << " new, " << result.updatedFiles.size() << " updated, "
            << result.corruptedFiles.size() << " corrupted, " << result.okFiles.size() << " ok";
  return result;
}

std::vector<JobSpec> FileComparisonEngine::buildDownloadQueue(
    const ComparisonResult& result, bool includeNew, bool includeUpdated,
    bool includeCorrupted, const std::map<int64_t, std::string>& categoryNames) {
  std::vector<JobSpec> specs;
  if (includeNew) {
    for (const auto& remote : result.newFiles) specs.push_back(specFor(remote, categoryNames));
  }
  if (includeUpdated) {
    for (const auto& item : result.updatedFiles) {
      specs.push_back(specFor(item.remote, categoryNames));
    }
  }
  if (includeCorrupted) {
    for (const auto& item : result.corruptedFiles) {
      specs.push_back(specFor(item.remote, categoryNames));
    }
  }
  LOG(DEBUG) << "Built a download queue of " << specs.size() << " jobs";
  return specs;
}

}  // namespace docfetch
