#ifndef DOCFETCH_MANIFEST_SCRAPER_HPP_
#define DOCFETCH_MANIFEST_SCRAPER_HPP_

#include <nlohmann/json.hpp>

#include <optional>

#include "Scraper.hpp"

namespace docfetch {

/**
 * @brief Site publishing a JSON manifest:
 *
 *   {"categories": [{"id": "math", "name": "Math", "parent": null,
 *                    "files": [{"name": "Algebra", "url": "alg.pdf",
 *                               "size": 1024, "type": "pdf"}]}]}
 *
 * The manifest lives at the base url when it ends in ".json", otherwise at
 * "<base>/manifest.json". Relative file urls resolve against it. The
 * manifest is fetched once per scraper instance.
 */
class ManifestScraper : public Scraper {
 public:
  explicit ManifestScraper(const ScraperContext& context) : Scraper(context) {}

  std::string scraperType() const override { return "manifest"; }
  std::vector<Category> listCategories() override;
  std::vector<RemoteFile> listFilesInCategory(const std::string& categoryId) override;

  std::string manifestUrl() const;

 private:
  const nlohmann::json& manifest();

  std::optional<nlohmann::json> manifest_;
};

}  // namespace docfetch

#endif  // DOCFETCH_MANIFEST_SCRAPER_HPP_
