#include <gtest/gtest.h>

#include "Comparison/FileComparisonEngine.hpp"
#include "Downloader/DownloadOrchestrator.hpp"
#include "Inventory/MemoryInventory.hpp"
#include "test_support.hpp"

using namespace docfetch;
using testing_support::FakeFetcher;
using testing_support::TempDir;

namespace {

RemoteFileRecord remote(int64_t id, const std::string& name, std::optional<int64_t> size,
                        std::optional<int64_t> categoryId = std::nullopt) {
  RemoteFileRecord record;
  record.id = id;
  record.siteId = 1;
  record.categoryId = categoryId;
  record.url = "http://example.com/files/" + name;
  record.name = name;
  record.size = size;
  record.fileType = "txt";
  return record;
}

class FileComparisonEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registerBuiltinValidators(validators_);
    validators_.freeze();
  }

  LocalFileRecord local(int64_t id, const std::string& name, const std::string& content,
                        std::optional<int64_t> linkedTo) {
    LocalFileRecord record;
    record.id = id;
    record.path = dir_.write(name, content).string();
    record.size = static_cast<int64_t>(content.size());
    record.fileType = "txt";
    record.linkedRemoteId = linkedTo;
    return record;
  }

  TempDir dir_;
  ValidatorRegistry validators_;
};

}  // namespace

TEST_F(FileComparisonEngineTest, SortsEveryRemoteFileIntoOneBucket) {
  std::vector<RemoteFileRecord> remotes = {
      remote(1, "new.txt", 10),
      remote(2, "grown.txt", 100),
      remote(3, "empty.txt", 0),
      remote(4, "fine.txt", 6),
      remote(5, "sizeless.txt", std::nullopt),
      remote(6, "also-new.txt", std::nullopt),
  };
  std::vector<LocalFileRecord> locals = {
      local(10, "grown.txt", "short\n", 2),
      local(11, "empty.txt", "", 3),
      local(12, "fine.txt", "hello\n", 4),
      local(13, "sizeless.txt", "whatever size\n", 5),
      local(14, "stray.txt", "not linked\n", std::nullopt),
  };

  FileComparisonEngine engine(validators_);
  auto result = engine.compare(remotes, locals);

  EXPECT_EQ(result.total(), remotes.size());
  ASSERT_EQ(result.newFiles.size(), 2u);
  EXPECT_EQ(result.newFiles[0].id, 1);
  EXPECT_EQ(result.newFiles[1].id, 6);

  ASSERT_EQ(result.updatedFiles.size(), 1u);
  EXPECT_EQ(result.updatedFiles[0].remote.id, 2);
  EXPECT_EQ(result.updatedFiles[0].local.id, 10);

  ASSERT_EQ(result.corruptedFiles.size(), 1u);
  EXPECT_EQ(result.corruptedFiles[0].remote.id, 3);
  EXPECT_EQ(result.corruptedFiles[0].reason, "File is empty");

  ASSERT_EQ(result.okFiles.size(), 2u);
  EXPECT_EQ(result.okFiles[0].id, 4);
  EXPECT_EQ(result.okFiles[1].id, 5);
}

TEST_F(FileComparisonEngineTest, MissingLocalFileIsCorrupted) {
  LocalFileRecord gone;
  gone.id = 1;
  gone.path = (dir_.path() / "deleted.txt").string();
  gone.size = 4;
  gone.fileType = "txt";
  gone.linkedRemoteId = 9;

  FileComparisonEngine engine(validators_);
  auto result = engine.compare({remote(9, "deleted.txt", 4)}, {gone});
  ASSERT_EQ(result.corruptedFiles.size(), 1u);
  EXPECT_FALSE(result.corruptedFiles[0].reason.empty());
}

TEST_F(FileComparisonEngineTest, EmptyInputs) {
  FileComparisonEngine engine(validators_);
  auto result = engine.compare({}, {local(1, "a.txt", "a\n", 1)});
  EXPECT_EQ(result.total(), 0u);
  EXPECT_TRUE(FileComparisonEngine::buildDownloadQueue(result).empty());
}

TEST_F(FileComparisonEngineTest, BuildsQueueFromSelectedBuckets) {
  ComparisonResult result;
  result.newFiles.push_back(remote(1, "new.txt", 10, 100));
  result.updatedFiles.push_back({remote(2, "upd.txt", 20), LocalFileRecord{}});
  result.corruptedFiles.push_back({remote(3, "bad.txt", std::nullopt, 200), LocalFileRecord{},
                                   "File is empty"});
  result.okFiles.push_back(remote(4, "ok.txt", 5));

  std::map<int64_t, std::string> categories = {{100, "Physics"}};
  auto all = FileComparisonEngine::buildDownloadQueue(result, true, true, true, categories);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].remoteFileId, 1);
  EXPECT_EQ(all[0].siteId, 1);
  EXPECT_EQ(all[0].url, "http://example.com/files/new.txt");
  EXPECT_EQ(all[0].displayName, "new.txt");
  EXPECT_EQ(all[0].sizeHint.value_or(-1), 10);
  EXPECT_EQ(all[0].fileType, "txt");
  EXPECT_EQ(all[0].destinationCategory, "Physics");
  EXPECT_EQ(all[1].remoteFileId, 2);
  EXPECT_EQ(all[1].destinationCategory, "");
  EXPECT_EQ(all[2].remoteFileId, 3);
  EXPECT_FALSE(all[2].sizeHint.has_value());
  EXPECT_EQ(all[2].destinationCategory, "");

  auto onlyNew = FileComparisonEngine::buildDownloadQueue(result, true, false, false);
  ASSERT_EQ(onlyNew.size(), 1u);
  EXPECT_EQ(onlyNew[0].remoteFileId, 1);

  auto repairs = FileComparisonEngine::buildDownloadQueue(result, false, true, true);
  ASSERT_EQ(repairs.size(), 2u);
  EXPECT_EQ(repairs[0].remoteFileId, 2);
  EXPECT_EQ(repairs[1].remoteFileId, 3);
}

TEST_F(FileComparisonEngineTest, DownloadedFilesCompareAsOk) {
  MemoryInventory inventory;
  Site site;
  site.name = "Library";
  site.url = "http://example.com/";
  site.scraperType = "generic";
  int64_t siteId = inventory.addSite(site);

  RemoteFileRecord a = remote(0, "a.txt", 8);
  RemoteFileRecord b = remote(0, "b.txt", std::nullopt);
  auto stored = inventory.upsertMany(siteId, {a, b});

  FileComparisonEngine engine(validators_);
  auto before = engine.compare(inventory.listBySite(siteId), inventory.listLocal());
  ASSERT_EQ(before.newFiles.size(), 2u);

  FakeFetcher fetcher;
  fetcher.setBody(stored[0].url, "alpha...");
  fetcher.setBody(stored[1].url, "beta\n");

  DownloadConfig config;
  config.concurrentDownloads = 2;
  config.downloadDirectory = dir_.path().string();
  config.retryCount = 0;
  config.pollInterval = std::chrono::milliseconds(20);
  {
    DownloadOrchestrator orchestrator(config, fetcher, validators_, inventory, inventory);
    for (const auto& spec : FileComparisonEngine::buildDownloadQueue(before)) {
      orchestrator.enqueue(spec);
    }
    orchestrator.start();
    ASSERT_TRUE(orchestrator.waitUntilIdle(std::chrono::seconds(5)));
    for (const auto& job : orchestrator.listFinished()) {
      EXPECT_EQ(job.state, JobState::COMPLETED) << job.lastError.value_or("");
    }
  }

  auto after = engine.compare(inventory.listBySite(siteId), inventory.listLocal());
  EXPECT_TRUE(after.newFiles.empty());
  EXPECT_TRUE(after.updatedFiles.empty());
  EXPECT_TRUE(after.corruptedFiles.empty());
  EXPECT_EQ(after.okFiles.size(), 2u);
}

TEST_F(FileComparisonEngineTest, SameNameInTwoFoldersConverges) {
  MemoryInventory inventory;
  Site site;
  site.name = "Reports";
  site.url = "http://example.com/";
  site.scraperType = "generic";
  int64_t siteId = inventory.addSite(site);

  RemoteFileRecord older = remote(0, "report.txt", 5);
  older.url = "http://example.com/2023/report.txt";
  RemoteFileRecord newer = remote(0, "report.txt", 5);
  newer.url = "http://example.com/2024/report.txt";
  auto stored = inventory.upsertMany(siteId, {older, newer});
  ASSERT_EQ(stored.size(), 2u);

  FakeFetcher fetcher;
  fetcher.setBody(stored[0].url, "2023\n");
  fetcher.setBody(stored[1].url, "2024\n");

  DownloadConfig config;
  config.concurrentDownloads = 2;
  config.downloadDirectory = dir_.path().string();
  config.retryCount = 0;
  config.pollInterval = std::chrono::milliseconds(20);

  FileComparisonEngine engine(validators_);
  for (int round = 0; round < 2; ++round) {
    auto comparison = engine.compare(inventory.listBySite(siteId), inventory.listLocal());
    DownloadOrchestrator orchestrator(config, fetcher, validators_, inventory, inventory);
    for (const auto& spec : FileComparisonEngine::buildDownloadQueue(comparison)) {
      orchestrator.enqueue(spec);
    }
    orchestrator.start();
    ASSERT_TRUE(orchestrator.waitUntilIdle(std::chrono::seconds(5)));
  }

  auto first = inventory.getByRemoteId(stored[0].id);
  auto second = inventory.getByRemoteId(stored[1].id);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(first->path, second->path);
  EXPECT_EQ(testing_support::readFile(first->path), "2023\n");
  EXPECT_EQ(testing_support::readFile(second->path), "2024\n");
  EXPECT_EQ(inventory.listLocal().size(), 2u);

  auto settled = engine.compare(inventory.listBySite(siteId), inventory.listLocal());
  EXPECT_EQ(settled.okFiles.size(), 2u);
  EXPECT_TRUE(settled.newFiles.empty());
  EXPECT_TRUE(settled.corruptedFiles.empty());
  // Nothing left to fetch, so the second round downloaded nothing.
  EXPECT_EQ(fetcher.calls(stored[0].url), 1);
  EXPECT_EQ(fetcher.calls(stored[1].url), 1);
}
