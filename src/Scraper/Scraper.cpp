#include "Scraper.hpp"

#include <memory>

#include "Common/Errors.hpp"
#include "GenericScraper.hpp"
#include "IndexScraper.hpp"
#include "ManifestScraper.hpp"
#include "utils/url.hpp"

namespace docfetch {

Scraper::Scraper(const ScraperContext& context) : context_(context) {
  for (auto& ext : context_.extensions) {
    ext = utils::toLower(utils::trim(ext));
    if (!ext.empty() && ext[0] != '.') ext = "." + ext;
  }
}

std::string Scraper::fetchPage(const std::string& url) const {
  if (context_.fetcher == nullptr) {
    throw ConfigurationError("scraper for " + context_.baseUrl +
                             " has no HTTP fetcher");
  }
  HttpRequest request;
  request.url = url;
  request.timeout = context_.timeout;
  request.proxy = context_.proxy;
  request.userAgent = context_.userAgent;
  return context_.fetcher->getText(request);
}

bool Scraper::isDocument(const std::string& url) const {
  return !documentType(url).empty();
}

std::string Scraper::documentType(const std::string& url) const {
  std::string ext = utils::extensionOf(utils::fileNameFromUrl(url));
  if (ext.empty()) return {};
  for (const auto& wanted : context_.extensions) {
    if (wanted == ext) return ext.substr(1);
  }
  return {};
}

void registerBuiltinScrapers(ScraperRegistry& registry) {
  registry.registerFactory("generic", [](const ScraperContext& context) {
    return std::make_unique<GenericScraper>(context);
  });
  registry.registerFactory("index", [](const ScraperContext& context) {
    return std::make_unique<IndexScraper>(context);
  });
  registry.registerFactory("manifest", [](const ScraperContext& context) {
    return std::make_unique<ManifestScraper>(context);
  });
}

}  // namespace docfetch
