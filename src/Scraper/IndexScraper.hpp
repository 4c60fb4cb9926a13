#ifndef DOCFETCH_INDEX_SCRAPER_HPP_
#define DOCFETCH_INDEX_SCRAPER_HPP_

#include "GenericScraper.hpp"

namespace docfetch {

/**
 * @brief Directory-index site (Apache/nginx autoindex and the like).
 *
 * The base directory is the root category; every sub-directory linked from
 * it becomes a child category. Only one level is followed.
 */
class IndexScraper : public GenericScraper {
 public:
  explicit IndexScraper(const ScraperContext& context) : GenericScraper(context) {}

  std::string scraperType() const override { return "index"; }
  std::vector<Category> listCategories() override;
  std::vector<RemoteFile> listFilesInCategory(const std::string& categoryId) override;

 private:
  std::string rootUrl() const;
};

}  // namespace docfetch

#endif  // DOCFETCH_INDEX_SCRAPER_HPP_
