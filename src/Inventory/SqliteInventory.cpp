#include "SqliteInventory.hpp"

#include <sqlite3.h>

#include <set>
#include <unordered_map>

#include "Common/Errors.hpp"
#include "utils/logger.hpp"

namespace docfetch {

namespace {

const char* const kSchema = R"sql(
CREATE TABLE IF NOT EXISTS sites (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    url TEXT NOT NULL UNIQUE,
    scraper_type TEXT NOT NULL,
    last_scan_date TEXT,
    created_at TEXT DEFAULT (datetime('now')),
    updated_at TEXT DEFAULT (datetime('now'))
);
CREATE TABLE IF NOT EXISTS categories (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    site_id INTEGER NOT NULL,
    key TEXT NOT NULL,
    name TEXT NOT NULL,
    url TEXT,
    parent_id INTEGER,
    created_at TEXT DEFAULT (datetime('now')),
    updated_at TEXT DEFAULT (datetime('now')),
    FOREIGN KEY (site_id) REFERENCES sites (id) ON DELETE CASCADE,
    FOREIGN KEY (parent_id) REFERENCES categories (id) ON DELETE SET NULL,
    UNIQUE (site_id, key) ON CONFLICT REPLACE
);
CREATE TABLE IF NOT EXISTS remote_files (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    site_id INTEGER NOT NULL,
    category_id INTEGER,
    name TEXT NOT NULL,
    url TEXT NOT NULL,
    size INTEGER,
    file_type TEXT,
    last_checked TEXT,
    created_at TEXT DEFAULT (datetime('now')),
    updated_at TEXT DEFAULT (datetime('now')),
    FOREIGN KEY (site_id) REFERENCES sites (id) ON DELETE CASCADE,
    FOREIGN KEY (category_id) REFERENCES categories (id) ON DELETE SET NULL,
    UNIQUE (site_id, url) ON CONFLICT REPLACE
);
CREATE TABLE IF NOT EXISTS local_files (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    remote_file_id INTEGER,
    path TEXT NOT NULL,
    size INTEGER,
    file_type TEXT,
    last_checked TEXT,
    created_at TEXT DEFAULT (datetime('now')),
    updated_at TEXT DEFAULT (datetime('now')),
    FOREIGN KEY (remote_file_id) REFERENCES remote_files (id) ON DELETE SET NULL,
    UNIQUE (path) ON CONFLICT REPLACE
);
CREATE TABLE IF NOT EXISTS downloads (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    remote_file_id INTEGER NOT NULL,
    local_file_id INTEGER,
    status TEXT NOT NULL,
    started_at TEXT,
    completed_at TEXT,
    error_message TEXT,
    created_at TEXT DEFAULT (datetime('now')),
    updated_at TEXT DEFAULT (datetime('now')),
    FOREIGN KEY (remote_file_id) REFERENCES remote_files (id) ON DELETE CASCADE,
    FOREIGN KEY (local_file_id) REFERENCES local_files (id) ON DELETE SET NULL
);
CREATE INDEX IF NOT EXISTS idx_remote_files_site ON remote_files(site_id);
CREATE INDEX IF NOT EXISTS idx_local_files_remote ON local_files(remote_file_id);
)sql";

const char* const kSiteColumns = "id, name, url, scraper_type, last_scan_date";
const char* const kRemoteColumns =
    "id, site_id, category_id, url, name, size, file_type, last_checked";
const char* const kLocalColumns = "id, path, size, file_type, remote_file_id, last_checked";
const char* const kDownloadColumns =
    "id, remote_file_id, local_file_id, status, started_at, completed_at, error_message";

void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
  sqlite3_bind_text(st, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

void bind_optional(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    sqlite3_bind_int64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string column_text(sqlite3_stmt* st, int col) {
  const unsigned char* text = sqlite3_column_text(st, col);
  return text ? reinterpret_cast<const char*>(text) : std::string();
}

std::optional<int64_t> column_optional_int(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int64(st, col);
}

std::optional<TimePoint> column_time(sqlite3_stmt* st, int col) {
  return parseTime(column_text(st, col));
}

Site readSite(sqlite3_stmt* st) {
  Site site;
  site.id = sqlite3_column_int64(st, 0);
  site.name = column_text(st, 1);
  site.url = column_text(st, 2);
  site.scraperType = column_text(st, 3);
  site.lastScanAt = column_time(st, 4);
  return site;
}

CategoryRecord readCategory(sqlite3_stmt* st) {
  CategoryRecord record;
  record.id = sqlite3_column_int64(st, 0);
  record.siteId = sqlite3_column_int64(st, 1);
  record.key = column_text(st, 2);
  record.name = column_text(st, 3);
  record.url = column_text(st, 4);
  record.parentId = column_optional_int(st, 5);
  return record;
}

RemoteFileRecord readRemote(sqlite3_stmt* st) {
  RemoteFileRecord record;
  record.id = sqlite3_column_int64(st, 0);
  record.siteId = sqlite3_column_int64(st, 1);
  record.categoryId = column_optional_int(st, 2);
  record.url = column_text(st, 3);
  record.name = column_text(st, 4);
  record.size = column_optional_int(st, 5);
  record.fileType = column_text(st, 6);
  record.lastCheckedAt = column_time(st, 7).value_or(TimePoint{});
  return record;
}

LocalFileRecord readLocal(sqlite3_stmt* st) {
  LocalFileRecord record;
  record.id = sqlite3_column_int64(st, 0);
  record.path = column_text(st, 1);
  record.size = sqlite3_column_int64(st, 2);
  record.fileType = column_text(st, 3);
  record.linkedRemoteId = column_optional_int(st, 4);
  record.lastCheckedAt = column_time(st, 5).value_or(TimePoint{});
  return record;
}

DownloadRecord readDownload(sqlite3_stmt* st) {
  DownloadRecord record;
  record.id = sqlite3_column_int64(st, 0);
  record.remoteFileId = sqlite3_column_int64(st, 1);
  record.localFileId = column_optional_int(st, 2);
  record.status = parseDownloadStatus(column_text(st, 3)).value_or(DownloadStatus::PENDING);
  record.startedAt = column_time(st, 4);
  record.completedAt = column_time(st, 5);
  if (sqlite3_column_type(st, 6) != SQLITE_NULL) record.errorMessage = column_text(st, 6);
  return record;
}

std::string selectFrom(const char* columns, const char* rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

}  // namespace

void SqliteInventory::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  sqlite3_finalize(stmt);
}

SqliteInventory::SqliteInventory(const std::string& dbPath) : dbPath_(dbPath) {
  if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw IoError("Failed to open SQLite DB " + dbPath + ": " + msg);
  }
  sqlite3_busy_timeout(db_, 5000);
  init();
  LOG(INFO) << "Inventory database " << dbPath << " ready";
}

SqliteInventory::~SqliteInventory() {
  if (db_) sqlite3_close(db_);
}

void SqliteInventory::init() {
  if (dbPath_ != ":memory:") exec("PRAGMA journal_mode=WAL;");
  exec(kSchema);
}

void SqliteInventory::exec(const std::string& sql) const {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown";
    sqlite3_free(err);
    throw IoError("SQLite error: " + msg);
  }
}

SqliteInventory::Stmt SqliteInventory::prepare(const char* sql) const {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
    throw IoError(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db_));
  }
  return Stmt(raw);
}

void SqliteInventory::stepDone(sqlite3_stmt* stmt, const char* what) const {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    throw IoError(std::string(what) + " failed: " + sqlite3_errmsg(db_));
  }
}

// ---- sites ----

int64_t SqliteInventory::addSite(const Site& site) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto check = prepare("SELECT id FROM sites WHERE url = ?;");
  bind_text(check.get(), 1, site.url);
  if (sqlite3_step(check.get()) == SQLITE_ROW) {
    throw ConfigurationError("site already registered: " + site.url);
  }

  auto st = prepare(
      "INSERT INTO sites (name, url, scraper_type, last_scan_date) VALUES (?, ?, ?, ?);");
  bind_text(st.get(), 1, site.name);
  bind_text(st.get(), 2, site.url);
  bind_text(st.get(), 3, site.scraperType);
  if (site.lastScanAt) {
    bind_text(st.get(), 4, formatTime(*site.lastScanAt));
  } else {
    sqlite3_bind_null(st.get(), 4);
  }
  stepDone(st.get(), "insert site");
  return sqlite3_last_insert_rowid(db_);
}

std::optional<Site> SqliteInventory::getSite(int64_t siteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(selectFrom(kSiteColumns, "FROM sites WHERE id = ?;").c_str());
  sqlite3_bind_int64(st.get(), 1, siteId);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return readSite(st.get());
}

std::vector<Site> SqliteInventory::listSites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(selectFrom(kSiteColumns, "FROM sites ORDER BY id;").c_str());
  std::vector<Site> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(readSite(st.get()));
  return out;
}

void SqliteInventory::markScanned(int64_t siteId, TimePoint when) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(
      "UPDATE sites SET last_scan_date = ?, updated_at = datetime('now') WHERE id = ?;");
  bind_text(st.get(), 1, formatTime(when));
  sqlite3_bind_int64(st.get(), 2, siteId);
  stepDone(st.get(), "update site");
}

// ---- remote inventory ----

std::optional<RemoteFileRecord> SqliteInventory::getById(int64_t remoteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(selectFrom(kRemoteColumns, "FROM remote_files WHERE id = ?;").c_str());
  sqlite3_bind_int64(st.get(), 1, remoteId);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return readRemote(st.get());
}

std::vector<CategoryRecord> SqliteInventory::replaceCategories(
    int64_t siteId, const std::vector<Category>& categories) {
  std::lock_guard<std::mutex> lock(mutex_);
  exec("BEGIN IMMEDIATE;");
  try {
    auto del = prepare("DELETE FROM categories WHERE site_id = ?;");
    sqlite3_bind_int64(del.get(), 1, siteId);
    stepDone(del.get(), "delete categories");

    std::vector<CategoryRecord> stored;
    std::unordered_map<std::string, int64_t> idByKey;
    auto ins = prepare("INSERT INTO categories (site_id, key, name, url) VALUES (?, ?, ?, ?);");
    for (const auto& category : categories) {
      sqlite3_reset(ins.get());
      sqlite3_clear_bindings(ins.get());
      sqlite3_bind_int64(ins.get(), 1, siteId);
      bind_text(ins.get(), 2, category.id);
      bind_text(ins.get(), 3, category.name);
      bind_text(ins.get(), 4, category.url);
      stepDone(ins.get(), "insert category");

      CategoryRecord record;
      record.id = sqlite3_last_insert_rowid(db_);
      record.siteId = siteId;
      record.key = category.id;
      record.name = category.name;
      record.url = category.url;
      idByKey[record.key] = record.id;
      stored.push_back(record);
    }

    auto parent = prepare("UPDATE categories SET parent_id = ? WHERE id = ?;");
    for (size_t i = 0; i < stored.size(); ++i) {
      if (!categories[i].parentId) continue;
      auto it = idByKey.find(*categories[i].parentId);
      if (it == idByKey.end()) continue;
      stored[i].parentId = it->second;
      sqlite3_reset(parent.get());
      sqlite3_bind_int64(parent.get(), 1, it->second);
      sqlite3_bind_int64(parent.get(), 2, stored[i].id);
      stepDone(parent.get(), "update category parent");
    }
    exec("COMMIT;");
    return stored;
  } catch (const std::exception&) {
    exec("ROLLBACK;");
    throw;
  }
}

std::vector<CategoryRecord> SqliteInventory::listCategories(int64_t siteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(
      "SELECT id, site_id, key, name, url, parent_id FROM categories "
      "WHERE site_id = ? ORDER BY id;");
  sqlite3_bind_int64(st.get(), 1, siteId);
  std::vector<CategoryRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(readCategory(st.get()));
  return out;
}

std::vector<RemoteFileRecord> SqliteInventory::upsertMany(
    int64_t siteId, const std::vector<RemoteFileRecord>& records) {
  std::lock_guard<std::mutex> lock(mutex_);
  exec("BEGIN IMMEDIATE;");
  try {
    std::unordered_map<std::string, int64_t> existing;
    {
      auto st = prepare("SELECT id, url FROM remote_files WHERE site_id = ?;");
      sqlite3_bind_int64(st.get(), 1, siteId);
      while (sqlite3_step(st.get()) == SQLITE_ROW) {
        existing[column_text(st.get(), 1)] = sqlite3_column_int64(st.get(), 0);
      }
    }

    auto upd = prepare(
        "UPDATE remote_files SET category_id = ?, name = ?, size = ?, file_type = ?, "
        "last_checked = ?, updated_at = datetime('now') WHERE id = ?;");
    auto ins = prepare(
        "INSERT INTO remote_files (site_id, category_id, url, name, size, file_type, "
        "last_checked) VALUES (?, ?, ?, ?, ?, ?, ?);");

    std::vector<RemoteFileRecord> stored;
    std::set<int64_t> kept;
    for (const auto& record : records) {
      RemoteFileRecord row = record;
      row.siteId = siteId;
      auto it = existing.find(row.url);
      if (it != existing.end()) {
        row.id = it->second;
        sqlite3_reset(upd.get());
        sqlite3_clear_bindings(upd.get());
        bind_optional(upd.get(), 1, row.categoryId);
        bind_text(upd.get(), 2, row.name);
        bind_optional(upd.get(), 3, row.size);
        bind_text(upd.get(), 4, row.fileType);
        bind_text(upd.get(), 5, formatTime(row.lastCheckedAt));
        sqlite3_bind_int64(upd.get(), 6, row.id);
        stepDone(upd.get(), "update remote file");
      } else {
        sqlite3_reset(ins.get());
        sqlite3_clear_bindings(ins.get());
        sqlite3_bind_int64(ins.get(), 1, siteId);
        bind_optional(ins.get(), 2, row.categoryId);
        bind_text(ins.get(), 3, row.url);
        bind_text(ins.get(), 4, row.name);
        bind_optional(ins.get(), 5, row.size);
        bind_text(ins.get(), 6, row.fileType);
        bind_text(ins.get(), 7, formatTime(row.lastCheckedAt));
        stepDone(ins.get(), "insert remote file");
        row.id = sqlite3_last_insert_rowid(db_);
        existing[row.url] = row.id;
      }
      kept.insert(row.id);
      stored.push_back(row);
    }

    auto unlinkStmt =
        prepare("UPDATE local_files SET remote_file_id = NULL WHERE remote_file_id = ?;");
    auto del = prepare("DELETE FROM remote_files WHERE id = ?;");
    for (const auto& kv : existing) {
      if (kept.count(kv.second)) continue;
      sqlite3_reset(unlinkStmt.get());
      sqlite3_bind_int64(unlinkStmt.get(), 1, kv.second);
      stepDone(unlinkStmt.get(), "unlink local file");
      sqlite3_reset(del.get());
      sqlite3_bind_int64(del.get(), 1, kv.second);
      stepDone(del.get(), "delete remote file");
    }
    exec("COMMIT;");
    return stored;
  } catch (const std::exception&) {
    exec("ROLLBACK;");
    throw;
  }
}

std::vector<RemoteFileRecord> SqliteInventory::queryRemote(const char* sql, int64_t arg) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(sql);
  if (sqlite3_bind_parameter_count(st.get()) > 0) sqlite3_bind_int64(st.get(), 1, arg);
  std::vector<RemoteFileRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(readRemote(st.get()));
  return out;
}

std::vector<RemoteFileRecord> SqliteInventory::listBySite(int64_t siteId) const {
  return queryRemote(
      selectFrom(kRemoteColumns, "FROM remote_files WHERE site_id = ? ORDER BY id;").c_str(),
      siteId);
}

std::vector<RemoteFileRecord> SqliteInventory::listByCategory(int64_t categoryId) const {
  return queryRemote(
      selectFrom(kRemoteColumns, "FROM remote_files WHERE category_id = ? ORDER BY id;").c_str(),
      categoryId);
}

std::vector<RemoteFileRecord> SqliteInventory::listAll() const {
  return queryRemote(selectFrom(kRemoteColumns, "FROM remote_files ORDER BY id;").c_str(), 0);
}

// ---- local inventory ----

std::optional<LocalFileRecord> SqliteInventory::queryLocal(sqlite3_stmt* stmt) const {
  if (sqlite3_step(stmt) != SQLITE_ROW) return std::nullopt;
  return readLocal(stmt);
}

std::optional<LocalFileRecord> SqliteInventory::getLocalById(int64_t localId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(selectFrom(kLocalColumns, "FROM local_files WHERE id = ?;").c_str());
  sqlite3_bind_int64(st.get(), 1, localId);
  return queryLocal(st.get());
}

std::optional<LocalFileRecord> SqliteInventory::getByRemoteId(int64_t remoteId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(selectFrom(kLocalColumns,
                               "FROM local_files WHERE remote_file_id = ? ORDER BY id LIMIT 1;")
                        .c_str());
  sqlite3_bind_int64(st.get(), 1, remoteId);
  return queryLocal(st.get());
}

std::optional<LocalFileRecord> SqliteInventory::getByPath(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(selectFrom(kLocalColumns, "FROM local_files WHERE path = ?;").c_str());
  bind_text(st.get(), 1, path);
  return queryLocal(st.get());
}

std::optional<int64_t> SqliteInventory::localIdByPathLocked(const std::string& path) const {
  auto st = prepare("SELECT id FROM local_files WHERE path = ?;");
  bind_text(st.get(), 1, path);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return sqlite3_column_int64(st.get(), 0);
}

int64_t SqliteInventory::upsertLocal(const LocalFileRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  return upsertLocalLocked(record);
}

int64_t SqliteInventory::upsertLocalLocked(const LocalFileRecord& record) {
  auto existing = localIdByPathLocked(record.path);
  if (existing) {
    auto st = prepare(
        "UPDATE local_files SET size = ?, file_type = ?, remote_file_id = ?, last_checked = ?, "
        "updated_at = datetime('now') WHERE id = ?;");
    sqlite3_bind_int64(st.get(), 1, record.size);
    bind_text(st.get(), 2, record.fileType);
    bind_optional(st.get(), 3, record.linkedRemoteId);
    bind_text(st.get(), 4, formatTime(record.lastCheckedAt));
    sqlite3_bind_int64(st.get(), 5, *existing);
    stepDone(st.get(), "update local file");
    return *existing;
  }
  auto st = prepare(
      "INSERT INTO local_files (path, size, file_type, remote_file_id, last_checked) "
      "VALUES (?, ?, ?, ?, ?);");
  bind_text(st.get(), 1, record.path);
  sqlite3_bind_int64(st.get(), 2, record.size);
  bind_text(st.get(), 3, record.fileType);
  bind_optional(st.get(), 4, record.linkedRemoteId);
  bind_text(st.get(), 5, formatTime(record.lastCheckedAt));
  stepDone(st.get(), "insert local file");
  return sqlite3_last_insert_rowid(db_);
}

std::vector<LocalFileRecord> SqliteInventory::listLocal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(selectFrom(kLocalColumns, "FROM local_files ORDER BY id;").c_str());
  std::vector<LocalFileRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(readLocal(st.get()));
  return out;
}

bool SqliteInventory::remoteExistsLocked(int64_t remoteId) const {
  auto st = prepare("SELECT 1 FROM remote_files WHERE id = ?;");
  sqlite3_bind_int64(st.get(), 1, remoteId);
  return sqlite3_step(st.get()) == SQLITE_ROW;
}

bool SqliteInventory::link(int64_t localId, int64_t remoteId) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!remoteExistsLocked(remoteId)) return false;
  auto st = prepare(
      "UPDATE local_files SET remote_file_id = ?, updated_at = datetime('now') WHERE id = ?;");
  sqlite3_bind_int64(st.get(), 1, remoteId);
  sqlite3_bind_int64(st.get(), 2, localId);
  stepDone(st.get(), "link local file");
  return sqlite3_changes(db_) > 0;
}

bool SqliteInventory::unlink(int64_t localId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(
      "UPDATE local_files SET remote_file_id = NULL, updated_at = datetime('now') WHERE id = ?;");
  sqlite3_bind_int64(st.get(), 1, localId);
  stepDone(st.get(), "unlink local file");
  return sqlite3_changes(db_) > 0;
}

// ---- download history ----

int64_t SqliteInventory::createDownload(int64_t remoteFileId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare("INSERT INTO downloads (remote_file_id, status) VALUES (?, ?);");
  sqlite3_bind_int64(st.get(), 1, remoteFileId);
  bind_text(st.get(), 2, downloadStatusName(DownloadStatus::PENDING));
  stepDone(st.get(), "insert download");
  return sqlite3_last_insert_rowid(db_);
}

void SqliteInventory::setDownloadStatus(int64_t historyId, const char* sql,
                                        const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(sql);
  bind_text(st.get(), 1, formatTime(Clock::now()));
  bind_text(st.get(), 2, text);
  sqlite3_bind_int64(st.get(), 3, historyId);
  stepDone(st.get(), "update download");
  if (sqlite3_changes(db_) == 0) {
    throw IoError("no download record " + std::to_string(historyId));
  }
}

void SqliteInventory::markStarted(int64_t historyId) {
  setDownloadStatus(historyId,
                    "UPDATE downloads SET started_at = ?, status = ?, "
                    "updated_at = datetime('now') WHERE id = ?;",
                    downloadStatusName(DownloadStatus::IN_PROGRESS));
}

int64_t SqliteInventory::markCompleted(int64_t historyId, const LocalFileRecord& localFile) {
  std::lock_guard<std::mutex> lock(mutex_);
  exec("BEGIN IMMEDIATE;");
  try {
    int64_t remoteId = 0;
    {
      auto st = prepare("SELECT remote_file_id FROM downloads WHERE id = ?;");
      sqlite3_bind_int64(st.get(), 1, historyId);
      if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw IoError("no download record " + std::to_string(historyId));
      }
      remoteId = sqlite3_column_int64(st.get(), 0);
    }

    LocalFileRecord row = localFile;
    if (remoteExistsLocked(remoteId)) {
      row.linkedRemoteId = remoteId;
    } else {
      LOG(WARN) << "Remote file " << remoteId << " vanished during its download; "
                << row.path << " stays unlinked";
    }
    int64_t localId = upsertLocalLocked(row);

    auto st = prepare(
        "UPDATE downloads SET status = ?, completed_at = ?, local_file_id = ?, "
        "error_message = NULL, updated_at = datetime('now') WHERE id = ?;");
    bind_text(st.get(), 1, downloadStatusName(DownloadStatus::COMPLETED));
    bind_text(st.get(), 2, formatTime(Clock::now()));
    sqlite3_bind_int64(st.get(), 3, localId);
    sqlite3_bind_int64(st.get(), 4, historyId);
    stepDone(st.get(), "complete download");
    exec("COMMIT;");
    return localId;
  } catch (const std::exception&) {
    exec("ROLLBACK;");
    throw;
  }
}

void SqliteInventory::markFailed(int64_t historyId, const std::string& error) {
  setDownloadStatus(historyId,
                    "UPDATE downloads SET completed_at = ?, error_message = ?, status = 'failed', "
                    "updated_at = datetime('now') WHERE id = ?;",
                    error);
}

void SqliteInventory::markCancelled(int64_t historyId) {
  setDownloadStatus(historyId,
                    "UPDATE downloads SET completed_at = ?, status = ?, "
                    "updated_at = datetime('now') WHERE id = ?;",
                    downloadStatusName(DownloadStatus::CANCELLED));
}

std::optional<DownloadRecord> SqliteInventory::getDownload(int64_t historyId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st = prepare(selectFrom(kDownloadColumns, "FROM downloads WHERE id = ?;").c_str());
  sqlite3_bind_int64(st.get(), 1, historyId);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return readDownload(st.get());
}

std::vector<DownloadRecord> SqliteInventory::listDownloads(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto st =
      prepare(selectFrom(kDownloadColumns, "FROM downloads ORDER BY id DESC LIMIT ?;").c_str());
  sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(limit));
  std::vector<DownloadRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(readDownload(st.get()));
  return out;
}

}  // namespace docfetch
