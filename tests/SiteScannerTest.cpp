#include <gtest/gtest.h>

#include "Inventory/MemoryInventory.hpp"
#include "Scanner/SiteScanner.hpp"
#include "test_support.hpp"

using namespace docfetch;
using testing_support::FakeFetcher;

class SiteScannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registerBuiltinScrapers(scrapers_);
    scrapers_.freeze();
    defaults_.fetcher = &fetcher_;
  }

  int64_t addSite(const std::string& url, const std::string& type) {
    Site site;
    site.name = url;
    site.url = url;
    site.scraperType = type;
    return inventory_.addSite(site);
  }

  void setManifest(const std::string& files) {
    fetcher_.setBody("http://example.com/m/manifest.json",
                     R"({"categories": [{"id": "books", "name": "Books", "files": [)" + files +
                         "]}]}");
  }

  FakeFetcher fetcher_;
  MemoryInventory inventory_;
  ScraperRegistry scrapers_{"scraper"};
  ScraperContext defaults_;
};

TEST_F(SiteScannerTest, ScansAndStoresFiles) {
  int64_t siteId = addSite("http://example.com/m", "manifest");
  setManifest(R"({"name": " Algebra ", "url": "a.pdf", "size": 10},
                 {"url": "b.epub"},
                 {"url": "a.pdf", "name": "duplicate"},
                 {"url": "notes"})");

  SiteScanner scanner(inventory_, inventory_, scrapers_, defaults_);
  ScanResult result = scanner.scanSite(siteId);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.categoryCount, 1u);
  EXPECT_EQ(result.fileCount, 3u);

  auto categories = inventory_.listCategories(siteId);
  ASSERT_EQ(categories.size(), 1u);
  auto files = inventory_.listBySite(siteId);
  ASSERT_EQ(files.size(), 3u);
  EXPECT_EQ(files[0].name, "Algebra");
  EXPECT_EQ(files[0].categoryId.value_or(0), categories[0].id);
  EXPECT_EQ(files[1].fileType, "epub");
  EXPECT_EQ(files[2].fileType, "generic");
  EXPECT_TRUE(inventory_.getSite(siteId)->lastScanAt.has_value());
}

TEST_F(SiteScannerTest, RescanReplacesAndKeepsIds) {
  int64_t siteId = addSite("http://example.com/m", "manifest");
  setManifest(R"({"url": "a.pdf"}, {"url": "b.pdf"})");
  SiteScanner scanner(inventory_, inventory_, scrapers_, defaults_);
  ASSERT_TRUE(scanner.scanSite(siteId).success);
  auto before = inventory_.listBySite(siteId);
  ASSERT_EQ(before.size(), 2u);

  // Each scan builds a fresh scraper, so the new manifest is picked up.
  setManifest(R"({"url": "a.pdf", "size": 42}, {"url": "c.pdf"})");
  ASSERT_TRUE(scanner.scanSite(siteId).success);
  auto after = inventory_.listBySite(siteId);
  ASSERT_EQ(after.size(), 2u);
  EXPECT_EQ(after[0].id, before[0].id);
  EXPECT_EQ(after[0].size.value_or(0), 42);
  EXPECT_EQ(after[1].url, "http://example.com/m/c.pdf");
  EXPECT_FALSE(inventory_.getById(before[1].id).has_value());
}

TEST_F(SiteScannerTest, UnknownScraperLeavesTimestamp) {
  int64_t siteId = addSite("http://example.com/x", "nonexistent");
  SiteScanner scanner(inventory_, inventory_, scrapers_, defaults_);
  ScanResult result = scanner.scanSite(siteId);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::UNKNOWN_CAPABILITY);
  EXPECT_EQ(result.error, "unknown scraper type: nonexistent");
  EXPECT_FALSE(inventory_.getSite(siteId)->lastScanAt.has_value());
}

TEST_F(SiteScannerTest, UnknownSite) {
  SiteScanner scanner(inventory_, inventory_, scrapers_, defaults_);
  ScanResult result = scanner.scanSite(77);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::CONFIGURATION);
  EXPECT_EQ(result.error, "Site with ID 77 not found");
}

TEST_F(SiteScannerTest, DiscoveryFailureWritesNothing) {
  int64_t siteId = addSite("http://example.com/m", "manifest");
  setManifest(R"({"url": "a.pdf"})");
  SiteScanner scanner(inventory_, inventory_, scrapers_, defaults_);
  ASSERT_TRUE(scanner.scanSite(siteId).success);
  auto scannedAt = inventory_.getSite(siteId)->lastScanAt;

  FakeFetcher::Response down;
  down.alwaysNetworkError = true;
  fetcher_.set("http://example.com/m/manifest.json", down);
  ScanResult result = scanner.scanSite(siteId);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.errorKind, ErrorKind::NETWORK);
  EXPECT_EQ(inventory_.listBySite(siteId).size(), 1u);
  EXPECT_EQ(inventory_.getSite(siteId)->lastScanAt, scannedAt);
}
