#ifndef DOCFETCH_SITE_SCANNER_HPP_
#define DOCFETCH_SITE_SCANNER_HPP_

#include <cstdint>
#include <string>

#include "Common/Errors.hpp"
#include "Inventory/Inventory.hpp"
#include "Scraper/Scraper.hpp"

namespace docfetch {

struct ScanResult {
  bool success = false;
  int64_t siteId = 0;
  size_t categoryCount = 0;
  size_t fileCount = 0;
  ErrorKind errorKind = ErrorKind::NONE;
  std::string error;
};

/**
 * @brief Runs a site's scraper and full-replaces the site's categories and
 * files in the remote inventory.
 *
 * Discovery completes before anything is written: a scan that fails while
 * listing leaves the inventory untouched. The last-scan timestamp moves only
 * on success.
 */
class SiteScanner {
 public:
  // `defaults` supplies fetcher, user agent, proxy, timeout and document
  // extensions; its baseUrl is replaced with each site's url.
  SiteScanner(SiteStore& sites, RemoteInventory& remote,
              const ScraperRegistry& scrapers, const ScraperContext& defaults);

  // Never throws for per-site failures.
  ScanResult scanSite(int64_t siteId);

 private:
  ScanResult runScan(int64_t siteId);

  SiteStore& sites_;
  RemoteInventory& remote_;
  const ScraperRegistry& scrapers_;
  ScraperContext defaults_;
};

}  // namespace docfetch

#endif  // DOCFETCH_SITE_SCANNER_HPP_
