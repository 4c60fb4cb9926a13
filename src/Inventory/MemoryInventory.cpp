#include "MemoryInventory.hpp"

#include <set>
#include <unordered_map>

#include "Common/Errors.hpp"
#include "utils/logger.hpp"

namespace docfetch {

int64_t MemoryInventory::addSite(const Site& site) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : sites_) {
    if (kv.second.url == site.url) {
      throw ConfigurationError("site already registered: " + site.url);
    }
  }
  Site stored = site;
  stored.id = nextSiteId_++;
  sites_[stored.id] = stored;
  return stored.id;
}

std::optional<Site> MemoryInventory::getSite(int64_t siteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sites_.find(siteId);
  if (it == sites_.end()) return std::nullopt;
  return it->second;
}

std::vector<Site> MemoryInventory::listSites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Site> out;
  for (const auto& kv : sites_) out.push_back(kv.second);
  return out;
}

void MemoryInventory::markScanned(int64_t siteId, TimePoint when) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sites_.find(siteId);
  if (it != sites_.end()) it->second.lastScanAt = when;
}

std::optional<RemoteFileRecord> MemoryInventory::getById(int64_t remoteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = remoteFiles_.find(remoteId);
  if (it == remoteFiles_.end()) return std::nullopt;
  return it->second;
}

std::vector<CategoryRecord> MemoryInventory::replaceCategories(
    int64_t siteId, const std::vector<Category>& categories) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = categories_.begin(); it != categories_.end();) {
    if (it->second.siteId == siteId) {
      it = categories_.erase(it);
    } else {
      ++it;
    }
  }

  std::vector<CategoryRecord> stored;
  std::unordered_map<std::string, int64_t> idByKey;
  for (const auto& category : categories) {
    CategoryRecord record;
    record.id = nextCategoryId_++;
    record.siteId = siteId;
    record.key = category.id;
    record.name = category.name;
    record.url = category.url;
    idByKey[record.key] = record.id;
    stored.push_back(record);
  }
  for (size_t i = 0; i < stored.size(); ++i) {
    if (categories[i].parentId) {
      auto parent = idByKey.find(*categories[i].parentId);
      if (parent != idByKey.end()) stored[i].parentId = parent->second;
    }
    categories_[stored[i].id] = stored[i];
  }
  return stored;
}

std::vector<CategoryRecord> MemoryInventory::listCategories(int64_t siteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CategoryRecord> out;
  for (const auto& kv : categories_) {
    if (kv.second.siteId == siteId) out.push_back(kv.second);
  }
  return out;
}

std::vector<RemoteFileRecord> MemoryInventory::upsertMany(
    int64_t siteId, const std::vector<RemoteFileRecord>& records) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, int64_t> existing;
  for (const auto& kv : remoteFiles_) {
    if (kv.second.siteId == siteId) existing[kv.second.url] = kv.first;
  }

  std::vector<RemoteFileRecord> stored;
  std::set<int64_t> kept;
  for (const auto& record : records) {
    RemoteFileRecord row = record;
    row.siteId = siteId;
    auto it = existing.find(row.url);
    if (it != existing.end()) {
      row.id = it->second;
    } else {
      row.id = nextRemoteId_++;
      existing[row.url] = row.id;
    }
    kept.insert(row.id);
    remoteFiles_[row.id] = row;
    stored.push_back(row);
  }

  for (auto it = remoteFiles_.begin(); it != remoteFiles_.end();) {
    if (it->second.siteId == siteId && kept.count(it->first) == 0) {
      for (auto& local : localFiles_) {
        if (local.second.linkedRemoteId == it->first) local.second.linkedRemoteId.reset();
      }
      it = remoteFiles_.erase(it);
    } else {
      ++it;
    }
  }
  return stored;
}

std::vector<RemoteFileRecord> MemoryInventory::listBySite(int64_t siteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RemoteFileRecord> out;
  for (const auto& kv : remoteFiles_) {
    if (kv.second.siteId == siteId) out.push_back(kv.second);
  }
  return out;
}

std::vector<RemoteFileRecord> MemoryInventory::listByCategory(int64_t categoryId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RemoteFileRecord> out;
  for (const auto& kv : remoteFiles_) {
    if (kv.second.categoryId == categoryId) out.push_back(kv.second);
  }
  return out;
}

std::vector<RemoteFileRecord> MemoryInventory::listAll() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RemoteFileRecord> out;
  for (const auto& kv : remoteFiles_) out.push_back(kv.second);
  return out;
}

std::optional<LocalFileRecord> MemoryInventory::getLocalById(int64_t localId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = localFiles_.find(localId);
  if (it == localFiles_.end()) return std::nullopt;
  return it->second;
}

std::optional<LocalFileRecord> MemoryInventory::getByRemoteId(int64_t remoteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : localFiles_) {
    if (kv.second.linkedRemoteId == remoteId) return kv.second;
  }
  return std::nullopt;
}

std::optional<LocalFileRecord> MemoryInventory::getByPath(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& kv : localFiles_) {
    if (kv.second.path == path) return kv.second;
  }
  return std::nullopt;
}

int64_t MemoryInventory::upsertLocal(const LocalFileRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  return upsertLocalLocked(record);
}

int64_t MemoryInventory::upsertLocalLocked(const LocalFileRecord& record) {
  LocalFileRecord row = record;
  row.id = 0;
  for (const auto& kv : localFiles_) {
    if (kv.second.path == record.path) {
      row.id = kv.first;
      break;
    }
  }
  if (row.id == 0) row.id = nextLocalId_++;
  localFiles_[row.id] = row;
  return row.id;
}

std::vector<LocalFileRecord> MemoryInventory::listLocal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LocalFileRecord> out;
  for (const auto& kv : localFiles_) out.push_back(kv.second);
  return out;
}

bool MemoryInventory::link(int64_t localId, int64_t remoteId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto local = localFiles_.find(localId);
  if (local == localFiles_.end() || remoteFiles_.count(remoteId) == 0) return false;
  local->second.linkedRemoteId = remoteId;
  return true;
}

bool MemoryInventory::unlink(int64_t localId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto local = localFiles_.find(localId);
  if (local == localFiles_.end()) return false;
  local->second.linkedRemoteId.reset();
  return true;
}

int64_t MemoryInventory::createDownload(int64_t remoteFileId) {
  std::lock_guard<std::mutex> lock(mutex_);
  DownloadRecord record;
  record.id = nextDownloadId_++;
  record.remoteFileId = remoteFileId;
  downloads_[record.id] = record;
  return record.id;
}

DownloadRecord& MemoryInventory::historyLocked(int64_t historyId) {
  auto it = downloads_.find(historyId);
  if (it == downloads_.end()) {
    throw IoError("no download record " + std::to_string(historyId));
  }
  return it->second;
}

void MemoryInventory::markStarted(int64_t historyId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = historyLocked(historyId);
  record.status = DownloadStatus::IN_PROGRESS;
  record.startedAt = Clock::now();
}

int64_t MemoryInventory::markCompleted(int64_t historyId, const LocalFileRecord& localFile) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = historyLocked(historyId);
  LocalFileRecord row = localFile;
  if (remoteFiles_.count(record.remoteFileId)) {
    row.linkedRemoteId = record.remoteFileId;
  } else {
    LOG(WARN) << "Remote file " << record.remoteFileId
              << " vanished during its download; " << row.path << " stays unlinked";
  }
  int64_t localId = upsertLocalLocked(row);
  record.status = DownloadStatus::COMPLETED;
  record.completedAt = Clock::now();
  record.localFileId = localId;
  record.errorMessage.reset();
  return localId;
}

void MemoryInventory::markFailed(int64_t historyId, const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = historyLocked(historyId);
  record.status = DownloadStatus::FAILED;
  record.completedAt = Clock::now();
  record.errorMessage = error;
}

void MemoryInventory::markCancelled(int64_t historyId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& record = historyLocked(historyId);
  record.status = DownloadStatus::CANCELLED;
  record.completedAt = Clock::now();
}

std::optional<DownloadRecord> MemoryInventory::getDownload(int64_t historyId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = downloads_.find(historyId);
  if (it == downloads_.end()) return std::nullopt;
  return it->second;
}

std::vector<DownloadRecord> MemoryInventory::listDownloads(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DownloadRecord> out;
  for (auto it = downloads_.rbegin(); it != downloads_.rend() && out.size() < limit; ++it) {
    out.push_back(it->second);
  }
  return out;
}

}  // namespace docfetch
