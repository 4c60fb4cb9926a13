#include <gtest/gtest.h>

#include <memory>

#include "Common/Errors.hpp"
#include "Inventory/MemoryInventory.hpp"
#include "Inventory/SqliteInventory.hpp"

using namespace docfetch;

namespace {

template <typename T>
std::unique_ptr<Inventory> makeInventory();

template <>
std::unique_ptr<Inventory> makeInventory<MemoryInventory>() {
  return std::make_unique<MemoryInventory>();
}

template <>
std::unique_ptr<Inventory> makeInventory<SqliteInventory>() {
  return std::make_unique<SqliteInventory>(":memory:");
}

RemoteFileRecord remote(const std::string& url, std::optional<int64_t> size = std::nullopt) {
  RemoteFileRecord record;
  record.url = url;
  record.name = url.substr(url.rfind('/') + 1);
  record.size = size;
  record.fileType = "pdf";
  record.lastCheckedAt = Clock::now();
  return record;
}

LocalFileRecord local(const std::string& path, int64_t size) {
  LocalFileRecord record;
  record.path = path;
  record.size = size;
  record.fileType = "pdf";
  record.lastCheckedAt = Clock::now();
  return record;
}

}  // namespace

template <typename T>
class InventoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    inventory_ = makeInventory<T>();
    Site site;
    site.name = "Library";
    site.url = "http://example.com/library";
    site.scraperType = "generic";
    siteId_ = inventory_->addSite(site);
  }

  std::unique_ptr<Inventory> inventory_;
  int64_t siteId_ = 0;
};

using InventoryTypes = ::testing::Types<MemoryInventory, SqliteInventory>;
TYPED_TEST_SUITE(InventoryTest, InventoryTypes);

TYPED_TEST(InventoryTest, Sites) {
  auto& inv = *this->inventory_;
  auto site = inv.getSite(this->siteId_);
  ASSERT_TRUE(site.has_value());
  EXPECT_EQ(site->name, "Library");
  EXPECT_FALSE(site->lastScanAt.has_value());

  Site duplicate;
  duplicate.name = "Again";
  duplicate.url = "http://example.com/library";
  duplicate.scraperType = "index";
  EXPECT_THROW(inv.addSite(duplicate), ConfigurationError);

  inv.markScanned(this->siteId_, Clock::now());
  EXPECT_TRUE(inv.getSite(this->siteId_)->lastScanAt.has_value());
  EXPECT_EQ(inv.listSites().size(), 1u);
  EXPECT_FALSE(inv.getSite(999).has_value());
}

TYPED_TEST(InventoryTest, CategoriesResolveParents) {
  auto& inv = *this->inventory_;
  Category root{"root", "Root", "http://example.com/", std::nullopt};
  Category child{"child", "Child", "http://example.com/child/", std::string("root")};
  Category orphan{"orphan", "Orphan", "http://example.com/o/", std::string("missing")};

  auto stored = inv.replaceCategories(this->siteId_, {root, child, orphan});
  ASSERT_EQ(stored.size(), 3u);
  EXPECT_EQ(stored[0].key, "root");
  EXPECT_EQ(stored[1].parentId.value_or(0), stored[0].id);
  EXPECT_FALSE(stored[2].parentId.has_value());

  auto replaced = inv.replaceCategories(this->siteId_, {root});
  ASSERT_EQ(replaced.size(), 1u);
  EXPECT_EQ(inv.listCategories(this->siteId_).size(), 1u);
}

TYPED_TEST(InventoryTest, FullReplaceKeepsIdsAndUnlinksDropped) {
  auto& inv = *this->inventory_;
  auto first = inv.upsertMany(this->siteId_, {remote("http://example.com/a.pdf", 10),
                                              remote("http://example.com/b.pdf", 20)});
  ASSERT_EQ(first.size(), 2u);
  int64_t idA = first[0].id;
  int64_t idB = first[1].id;

  int64_t localB = inv.upsertLocal(local("/data/b.pdf", 20));
  ASSERT_TRUE(inv.link(localB, idB));
  EXPECT_EQ(inv.getByRemoteId(idB)->id, localB);

  auto second = inv.upsertMany(this->siteId_, {remote("http://example.com/a.pdf", 11),
                                               remote("http://example.com/c.pdf")});
  ASSERT_EQ(second.size(), 2u);
  EXPECT_EQ(second[0].id, idA);
  EXPECT_NE(second[1].id, idB);
  EXPECT_EQ(inv.getById(idA)->size.value_or(0), 11);
  EXPECT_FALSE(inv.getById(second[1].id)->size.has_value());
  EXPECT_FALSE(inv.getById(idB).has_value());
  EXPECT_EQ(inv.listBySite(this->siteId_).size(), 2u);

  // The local file of the dropped remote file survives, unlinked.
  auto orphan = inv.getLocalById(localB);
  ASSERT_TRUE(orphan.has_value());
  EXPECT_FALSE(orphan->linkedRemoteId.has_value());
}

TYPED_TEST(InventoryTest, FilesByCategory) {
  auto& inv = *this->inventory_;
  auto cats = inv.replaceCategories(this->siteId_, {Category{"math", "Math", "", std::nullopt}});
  RemoteFileRecord inMath = remote("http://example.com/m.pdf");
  inMath.categoryId = cats[0].id;
  inv.upsertMany(this->siteId_, {inMath, remote("http://example.com/x.pdf")});

  auto files = inv.listByCategory(cats[0].id);
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].url, "http://example.com/m.pdf");
  EXPECT_EQ(inv.listAll().size(), 2u);
}

TYPED_TEST(InventoryTest, LocalFilesKeyedByPath) {
  auto& inv = *this->inventory_;
  int64_t id = inv.upsertLocal(local("/data/a.pdf", 1));
  EXPECT_EQ(inv.upsertLocal(local("/data/a.pdf", 2)), id);
  EXPECT_EQ(inv.getByPath("/data/a.pdf")->size, 2);
  EXPECT_EQ(inv.listLocal().size(), 1u);

  EXPECT_FALSE(inv.link(id, 12345));
  EXPECT_FALSE(inv.link(999, 1));
  EXPECT_FALSE(inv.unlink(999));
  EXPECT_TRUE(inv.unlink(id));
}

TYPED_TEST(InventoryTest, DownloadHistoryLifecycle) {
  auto& inv = *this->inventory_;
  auto files = inv.upsertMany(this->siteId_, {remote("http://example.com/a.pdf", 5)});
  int64_t remoteId = files[0].id;

  int64_t ok = inv.createDownload(remoteId);
  EXPECT_EQ(inv.getDownload(ok)->status, DownloadStatus::PENDING);
  inv.markStarted(ok);
  EXPECT_EQ(inv.getDownload(ok)->status, DownloadStatus::IN_PROGRESS);
  EXPECT_TRUE(inv.getDownload(ok)->startedAt.has_value());

  int64_t localId = inv.markCompleted(ok, local("/downloads/a.pdf", 5));
  auto done = inv.getDownload(ok);
  EXPECT_EQ(done->status, DownloadStatus::COMPLETED);
  EXPECT_EQ(done->localFileId.value_or(0), localId);
  EXPECT_EQ(inv.getByRemoteId(remoteId)->path, "/downloads/a.pdf");

  int64_t failed = inv.createDownload(remoteId);
  inv.markFailed(failed, "HTTP status 500");
  EXPECT_EQ(inv.getDownload(failed)->errorMessage.value_or(""), "HTTP status 500");

  int64_t cancelled = inv.createDownload(remoteId);
  inv.markCancelled(cancelled);
  EXPECT_EQ(inv.getDownload(cancelled)->status, DownloadStatus::CANCELLED);

  auto history = inv.listDownloads();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].id, cancelled);
  EXPECT_EQ(history[2].id, ok);
  EXPECT_EQ(inv.listDownloads(1).size(), 1u);

  EXPECT_THROW(inv.markFailed(4242, "nope"), IoError);
}

TYPED_TEST(InventoryTest, CompletionAfterRemoteVanishedStaysUnlinked) {
  auto& inv = *this->inventory_;
  auto files = inv.upsertMany(this->siteId_, {remote("http://example.com/gone.pdf", 5)});
  int64_t historyId = inv.createDownload(files[0].id);
  inv.markStarted(historyId);

  // A rescan drops the file while it downloads.
  inv.upsertMany(this->siteId_, {});

  int64_t localId = inv.markCompleted(historyId, local("/downloads/gone.pdf", 5));
  EXPECT_FALSE(inv.getLocalById(localId)->linkedRemoteId.has_value());
  EXPECT_EQ(inv.getDownload(historyId)->status, DownloadStatus::COMPLETED);
}
