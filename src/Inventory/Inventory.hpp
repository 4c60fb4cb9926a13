#ifndef DOCFETCH_INVENTORY_HPP_
#define DOCFETCH_INVENTORY_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Common/Types.hpp"

namespace docfetch {

// Implementations of the stores below are safe to call from several threads.

class SiteStore {
 public:
  virtual ~SiteStore() = default;

  // Throws ConfigurationError when a site with the same url exists.
  virtual int64_t addSite(const Site& site) = 0;
  virtual std::optional<Site> getSite(int64_t siteId) const = 0;
  virtual std::vector<Site> listSites() const = 0;
  virtual void markScanned(int64_t siteId, TimePoint when) = 0;
};

class RemoteInventory {
 public:
  virtual ~RemoteInventory() = default;

  virtual std::optional<RemoteFileRecord> getById(int64_t remoteId) const = 0;

  // Replaces every category of the site. Parent ids are resolved from the
  // scraper keys; the stored records come back in input order.
  virtual std::vector<CategoryRecord> replaceCategories(
      int64_t siteId, const std::vector<Category>& categories) = 0;
  virtual std::vector<CategoryRecord> listCategories(int64_t siteId) const = 0;

  // Full replace of the site's files. A url already known keeps its id;
  // files absent from `records` are dropped and local files linked to them
  // are unlinked. Returns the stored records in input order.
  virtual std::vector<RemoteFileRecord> upsertMany(
      int64_t siteId, const std::vector<RemoteFileRecord>& records) = 0;

  virtual std::vector<RemoteFileRecord> listBySite(int64_t siteId) const = 0;
  virtual std::vector<RemoteFileRecord> listByCategory(int64_t categoryId) const = 0;
  virtual std::vector<RemoteFileRecord> listAll() const = 0;
};

class LocalInventory {
 public:
  virtual ~LocalInventory() = default;

  virtual std::optional<LocalFileRecord> getLocalById(int64_t localId) const = 0;
  virtual std::optional<LocalFileRecord> getByRemoteId(int64_t remoteId) const = 0;
  virtual std::optional<LocalFileRecord> getByPath(const std::string& path) const = 0;
  // Keyed by path; returns the record id.
  virtual int64_t upsertLocal(const LocalFileRecord& record) = 0;
  virtual std::vector<LocalFileRecord> listLocal() const = 0;
  // False when either side does not exist.
  virtual bool link(int64_t localId, int64_t remoteId) = 0;
  virtual bool unlink(int64_t localId) = 0;
};

class DownloadHistory {
 public:
  virtual ~DownloadHistory() = default;

  virtual int64_t createDownload(int64_t remoteFileId) = 0;
  virtual void markStarted(int64_t historyId) = 0;
  // Upserts `localFile`, links it to the download's remote file when that
  // still exists, and completes the record. Returns the local file id.
  virtual int64_t markCompleted(int64_t historyId, const LocalFileRecord& localFile) = 0;
  virtual void markFailed(int64_t historyId, const std::string& error) = 0;
  virtual void markCancelled(int64_t historyId) = 0;
  virtual std::optional<DownloadRecord> getDownload(int64_t historyId) const = 0;
  // Newest first.
  virtual std::vector<DownloadRecord> listDownloads(size_t limit = 100) const = 0;
};

// All four stores over one backing.
class Inventory : public SiteStore,
                  public RemoteInventory,
                  public LocalInventory,
                  public DownloadHistory {};

}  // namespace docfetch

#endif  // DOCFETCH_INVENTORY_HPP_
