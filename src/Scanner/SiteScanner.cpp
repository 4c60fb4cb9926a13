#include "SiteScanner.hpp"

#include <unordered_map>
#include <unordered_set>

#include "utils/logger.hpp"
#include "utils/url.hpp"

namespace docfetch {

SiteScanner::SiteScanner(SiteStore& sites, RemoteInventory& remote,
                         const ScraperRegistry& scrapers, const ScraperContext& defaults)
    : sites_(sites), remote_(remote), scrapers_(scrapers), defaults_(defaults) {}

ScanResult SiteScanner::scanSite(int64_t siteId) {
  try {
    return runScan(siteId);
  } catch (const Error& e) {
    LOG(ERROR) << "Error scanning site " << siteId << ": " << e.what();
    ScanResult result;
    result.siteId = siteId;
    result.errorKind = e.kind();
    result.error = e.what();
    return result;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error scanning site " << siteId << ": " << e.what();
    ScanResult result;
    result.siteId = siteId;
    result.errorKind = ErrorKind::INTERNAL;
    result.error = e.what();
    return result;
  }
}

ScanResult SiteScanner::runScan(int64_t siteId) {
  ScanResult result;
  result.siteId = siteId;

  auto site = sites_.getSite(siteId);
  if (!site) {
    result.errorKind = ErrorKind::CONFIGURATION;
    result.error = "Site with ID " + std::to_string(siteId) + " not found";
    LOG(WARN) << result.error;
    return result;
  }

  ScraperContext context = defaults_;
  context.baseUrl = site->url;
  auto scraper = scrapers_.tryResolve(site->scraperType, context);
  if (!scraper) {
    result.errorKind = ErrorKind::UNKNOWN_CAPABILITY;
    result.error = "unknown scraper type: " + site->scraperType;
    LOG(WARN) << "Site " << siteId << ": " << result.error;
    return result;
  }

  LOG(INFO) << "Scanning site " << siteId << " (" << site->url << ") with '"
            << site->scraperType << "'";

  // Discovery first; nothing is written if it throws.
  auto categories = scraper->listCategories();
  std::vector<RemoteFile> discovered;
  std::unordered_set<std::string> seenUrls;
  for (const auto& category : categories) {
    for (auto& file : scraper->listFilesInCategory(category.id)) {
      if (file.url.empty() || !seenUrls.insert(file.url).second) continue;
      file.categoryId = category.id;
      discovered.push_back(std::move(file));
    }
  }

  auto storedCategories = remote_.replaceCategories(siteId, categories);
  std::unordered_map<std::string, int64_t> categoryIds;
  for (const auto& record : storedCategories) categoryIds[record.key] = record.id;

  TimePoint now = Clock::now();
  std::vector<RemoteFileRecord> records;
  records.reserve(discovered.size());
  for (const auto& file : discovered) {
    RemoteFileRecord record;
    record.siteId = siteId;
    auto it = categoryIds.find(file.categoryId);
    if (it != categoryIds.end()) record.categoryId = it->second;
    record.url = file.url;
    record.name = utils::trim(file.name);
    if (record.name.empty()) record.name = utils::fileNameFromUrl(file.url);
    record.size = file.size;
    record.fileType = utils::toLower(file.fileType);
    if (record.fileType.empty()) {
      std::string ext = utils::extensionOf(utils::fileNameFromUrl(file.url));
      record.fileType = ext.empty() ? "generic" : ext.substr(1);
    }
    record.lastCheckedAt = now;
    records.push_back(std::move(record));
  }
  remote_.upsertMany(siteId, records);
  sites_.markScanned(siteId, now);

  result.success = true;
  result.categoryCount = categories.size();
  result.fileCount = records.size();
  LOG(INFO) << "Scanned site " << siteId << ": " << result.categoryCount
            << " categories, " << result.fileCount << " files";
  return result;
}

}  // namespace docfetch
