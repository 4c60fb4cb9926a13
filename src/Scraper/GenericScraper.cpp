#include "GenericScraper.hpp"

#include "HtmlLinks.hpp"
#include "utils/logger.hpp"
#include "utils/url.hpp"

namespace docfetch {

std::vector<Category> GenericScraper::listCategories() {
  Category category;
  category.id = kDefaultCategory;
  category.name = "Default";
  category.url = context_.baseUrl;
  return {category};
}

std::vector<RemoteFile> GenericScraper::listFilesInCategory(const std::string& categoryId) {
  std::string url = categoryId == kDefaultCategory ? context_.baseUrl : categoryId;
  return documentsOnPage(url, categoryId);
}

std::vector<RemoteFile> GenericScraper::documentsOnPage(const std::string& pageUrl,
                                                        const std::string& categoryId) {
  std::string html = fetchPage(pageUrl);
  std::vector<RemoteFile> files;
  for (const auto& link : extractLinks(html, pageUrl)) {
    std::string type = documentType(link.url);
    if (type.empty()) continue;
    RemoteFile file;
    file.url = link.url;
    file.name = link.text.empty() ? utils::fileNameFromUrl(link.url) : link.text;
    file.fileType = type;
    file.categoryId = categoryId;
    files.push_back(std::move(file));
  }
  LOG(INFO) << "Found " << files.size() << " documents at " << pageUrl;
  return files;
}

}  // namespace docfetch
