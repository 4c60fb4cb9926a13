#ifndef DOCFETCH_MEMORY_INVENTORY_HPP_
#define DOCFETCH_MEMORY_INVENTORY_HPP_

#include <map>
#include <mutex>

#include "Inventory.hpp"

namespace docfetch {

// Process-local inventory for tests and throwaway runs.
class MemoryInventory : public Inventory {
 public:
  int64_t addSite(const Site& site) override;
  std::optional<Site> getSite(int64_t siteId) const override;
  std::vector<Site> listSites() const override;
  void markScanned(int64_t siteId, TimePoint when) override;

  std::optional<RemoteFileRecord> getById(int64_t remoteId) const override;
  std::vector<CategoryRecord> replaceCategories(
      int64_t siteId, const std::vector<Category>& categories) override;
  std::vector<CategoryRecord> listCategories(int64_t siteId) const override;
  std::vector<RemoteFileRecord> upsertMany(
      int64_t siteId, const std::vector<RemoteFileRecord>& records) override;
  std::vector<RemoteFileRecord> listBySite(int64_t siteId) const override;
  std::vector<RemoteFileRecord> listByCategory(int64_t categoryId) const override;
  std::vector<RemoteFileRecord> listAll() const override;

  std::optional<LocalFileRecord> getLocalById(int64_t localId) const override;
  std::optional<LocalFileRecord> getByRemoteId(int64_t remoteId) const override;
  std::optional<LocalFileRecord> getByPath(const std::string& path) const override;
  int64_t upsertLocal(const LocalFileRecord& record) override;
  std::vector<LocalFileRecord> listLocal() const override;
  bool link(int64_t localId, int64_t remoteId) override;
  bool unlink(int64_t localId) override;

  int64_t createDownload(int64_t remoteFileId) override;
  void markStarted(int64_t historyId) override;
  int64_t markCompleted(int64_t historyId, const LocalFileRecord& localFile) override;
  void markFailed(int64_t historyId, const std::string& error) override;
  void markCancelled(int64_t historyId) override;
  std::optional<DownloadRecord> getDownload(int64_t historyId) const override;
  std::vector<DownloadRecord> listDownloads(size_t limit = 100) const override;

 private:
  int64_t upsertLocalLocked(const LocalFileRecord& record);
  DownloadRecord& historyLocked(int64_t historyId);

  mutable std::mutex mutex_;
  // std::map keeps ids, and so insertion order, sorted.
  std::map<int64_t, Site> sites_;
  std::map<int64_t, CategoryRecord> categories_;
  std::map<int64_t, RemoteFileRecord> remoteFiles_;
  std::map<int64_t, LocalFileRecord> localFiles_;
  std::map<int64_t, DownloadRecord> downloads_;
  int64_t nextSiteId_ = 1;
  int64_t nextCategoryId_ = 1;
  int64_t nextRemoteId_ = 1;
  int64_t nextLocalId_ = 1;
  int64_t nextDownloadId_ = 1;
};

}  // namespace docfetch

#endif  // DOCFETCH_MEMORY_INVENTORY_HPP_
