#include "IndexScraper.hpp"

#include "HtmlLinks.hpp"
#include "utils/logger.hpp"
#include "utils/url.hpp"

namespace docfetch {

std::string IndexScraper::rootUrl() const {
  std::string root = context_.baseUrl;
  if (!utils::endsWith(root, "/")) root += "/";
  return root;
}

std::vector<Category> IndexScraper::listCategories() {
  std::string root = rootUrl();
  Category rootCategory;
  rootCategory.id = root;
  rootCategory.name = "/";
  rootCategory.url = root;
  std::vector<Category> categories{rootCategory};

  std::string html = fetchPage(root);
  for (const auto& link : extractLinks(html, root)) {
    std::string path = link.url.substr(0, link.url.find('?'));
    if (!utils::endsWith(path, "/")) continue;
    // Parent links and links leaving the tree are not sub-directories.
    if (!utils::startsWith(path, root) || path == root) continue;
    std::string rest = path.substr(root.size(), path.size() - root.size() - 1);
    if (rest.empty() || rest.find('/') != std::string::npos) continue;

    Category category;
    category.id = path;
    category.name = utils::percentDecode(rest);
    category.url = path;
    category.parentId = root;
    categories.push_back(std::move(category));
  }
  LOG(INFO) << "Index " << root << " has " << categories.size() - 1
            << " sub-directories";
  return categories;
}

std::vector<RemoteFile> IndexScraper::listFilesInCategory(const std::string& categoryId) {
  return documentsOnPage(categoryId, categoryId);
}

}  // namespace docfetch
