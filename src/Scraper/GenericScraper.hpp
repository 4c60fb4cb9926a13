#ifndef DOCFETCH_GENERIC_SCRAPER_HPP_
#define DOCFETCH_GENERIC_SCRAPER_HPP_

#include "Scraper.hpp"

namespace docfetch {

// Single page site: one "default" category holding every document linked
// from the base page.
class GenericScraper : public Scraper {
 public:
  static constexpr const char* kDefaultCategory = "default";

  explicit GenericScraper(const ScraperContext& context) : Scraper(context) {}

  std::string scraperType() const override { return "generic"; }
  std::vector<Category> listCategories() override;
  std::vector<RemoteFile> listFilesInCategory(const std::string& categoryId) override;

 protected:
  // Documents linked from `pageUrl`, tagged with `categoryId`.
  std::vector<RemoteFile> documentsOnPage(const std::string& pageUrl,
                                          const std::string& categoryId);
};

}  // namespace docfetch

#endif  // DOCFETCH_GENERIC_SCRAPER_HPP_
