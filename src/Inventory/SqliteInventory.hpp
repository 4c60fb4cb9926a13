#ifndef DOCFETCH_SQLITE_INVENTORY_HPP_
#define DOCFETCH_SQLITE_INVENTORY_HPP_

#include <memory>
#include <mutex>
#include <string>

#include "Inventory.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace docfetch {

/**
 * @brief Inventory persisted in one SQLite database file.
 *
 * Tables: sites, categories, remote_files, local_files, downloads. A single
 * connection is shared behind a mutex. Pass ":memory:" for a private
 * in-memory database. Storage failures throw IoError.
 */
class SqliteInventory : public Inventory {
 public:
  explicit SqliteInventory(const std::string& dbPath);
  ~SqliteInventory() override;

  SqliteInventory(const SqliteInventory&) = delete;
  SqliteInventory& operator=(const SqliteInventory&) = delete;

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
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };
  using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

  void init();
  void exec(const std::string& sql) const;
  Stmt prepare(const char* sql) const;
  void stepDone(sqlite3_stmt* stmt, const char* what) const;

  std::vector<RemoteFileRecord> queryRemote(const char* sql, int64_t arg) const;
  std::optional<LocalFileRecord> queryLocal(sqlite3_stmt* stmt) const;
  std::optional<int64_t> localIdByPathLocked(const std::string& path) const;
  int64_t upsertLocalLocked(const LocalFileRecord& record);
  bool remoteExistsLocked(int64_t remoteId) const;
  void setDownloadStatus(int64_t historyId, const char* sql, const std::string& text);

  std::string dbPath_;
  sqlite3* db_ = nullptr;
  mutable std::mutex mutex_;
};

}  // namespace docfetch

#endif  // DOCFETCH_SQLITE_INVENTORY_HPP_
