#ifndef DOCFETCH_SCRAPER_HPP_
#define DOCFETCH_SCRAPER_HPP_

#include <chrono>
#include <string>
#include <vector>

#include "Common/Types.hpp"
#include "Http/HttpFetcher.hpp"
#include "Registry/CapabilityRegistry.hpp"

namespace docfetch {

// Everything a scraper instance needs to talk to one site.
struct ScraperContext {
  std::string baseUrl;
  HttpFetcher* fetcher = nullptr;  // not owned
  std::string userAgent;
  std::string proxy;
  std::chrono::seconds timeout{30};
  // Lower-case with the leading dot.
  std::vector<std::string> extensions{".pdf", ".epub", ".txt"};
};

/**
 * @brief Discovers categories and documents on one remote site.
 *
 * Both calls may throw NetworkError, HttpStatusError or ParseError.
 */
class Scraper {
 public:
  explicit Scraper(const ScraperContext& context);
  virtual ~Scraper() = default;

  virtual std::string scraperType() const = 0;
  virtual std::vector<Category> listCategories() = 0;
  virtual std::vector<RemoteFile> listFilesInCategory(const std::string& categoryId) = 0;

  const ScraperContext& context() const { return context_; }

 protected:
  std::string fetchPage(const std::string& url) const;
  bool isDocument(const std::string& url) const;
  // "pdf" for ".../a.PDF"; empty when the extension is not a document one.
  std::string documentType(const std::string& url) const;

  ScraperContext context_;
};

using ScraperRegistry = CapabilityRegistry<Scraper, const ScraperContext&>;

// generic, index, manifest
void registerBuiltinScrapers(ScraperRegistry& registry);

}  // namespace docfetch

#endif  // DOCFETCH_SCRAPER_HPP_
