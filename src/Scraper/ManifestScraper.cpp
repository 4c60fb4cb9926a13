#include "ManifestScraper.hpp"

#include "Common/Errors.hpp"
#include "utils/logger.hpp"
#include "utils/url.hpp"

namespace docfetch {

using json = nlohmann::json;

namespace {

std::string stringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return {};
  if (it->is_string()) return it->get<std::string>();
  if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
  throw ParseError(std::string("manifest field '") + key + "' is not a string");
}

}  // namespace

std::string ManifestScraper::manifestUrl() const {
  const std::string& base = context_.baseUrl;
  if (utils::endsWith(utils::toLower(base), ".json")) return base;
  return utils::endsWith(base, "/") ? base + "manifest.json" : base + "/manifest.json";
}

const json& ManifestScraper::manifest() {
  if (!manifest_) {
    std::string url = manifestUrl();
    std::string body = fetchPage(url);
    json parsed;
    try {
      parsed = json::parse(body);
    } catch (const json::parse_error& e) {
      throw ParseError("invalid manifest at " + url + ": " + e.what());
    }
    if (!parsed.is_object() || !parsed.contains("categories") ||
        !parsed["categories"].is_array()) {
      throw ParseError("manifest at " + url + " has no 'categories' array");
    }
    manifest_ = std::move(parsed);
  }
  return *manifest_;
}

std::vector<Category> ManifestScraper::listCategories() {
  std::vector<Category> categories;
  for (const auto& entry : manifest()["categories"]) {
    if (!entry.is_object()) throw ParseError("manifest category is not an object");
    Category category;
    category.id = stringField(entry, "id");
    category.name = stringField(entry, "name");
    if (category.id.empty()) category.id = category.name;
    if (category.id.empty()) throw ParseError("manifest category without id or name");
    if (category.name.empty()) category.name = category.id;
    std::string url = stringField(entry, "url");
    category.url = url.empty() ? manifestUrl() : utils::joinUrl(manifestUrl(), url);
    std::string parent = stringField(entry, "parent");
    if (!parent.empty()) category.parentId = parent;
    categories.push_back(std::move(category));
  }
  return categories;
}

std::vector<RemoteFile> ManifestScraper::listFilesInCategory(const std::string& categoryId) {
  std::vector<RemoteFile> files;
  for (const auto& entry : manifest()["categories"]) {
    std::string id = stringField(entry, "id");
    if (id.empty()) id = stringField(entry, "name");
    if (id != categoryId) continue;
    auto list = entry.find("files");
    if (list == entry.end()) break;
    if (!list->is_array()) throw ParseError("'files' of category " + id + " is not an array");

    for (const auto& item : *list) {
      if (!item.is_object()) throw ParseError("manifest file entry is not an object");
      RemoteFile file;
      std::string url = stringField(item, "url");
      if (url.empty()) throw ParseError("manifest file without url in " + id);
      file.url = utils::joinUrl(manifestUrl(), url);
      file.name = stringField(item, "name");
      if (file.name.empty()) file.name = utils::fileNameFromUrl(file.url);
      auto size = item.find("size");
      if (size != item.end() && size->is_number_integer() && size->get<int64_t>() >= 0) {
        file.size = size->get<int64_t>();
      }
      file.fileType = utils::toLower(stringField(item, "type"));
      if (file.fileType.empty()) {
        std::string ext = utils::extensionOf(utils::fileNameFromUrl(file.url));
        file.fileType = ext.empty() ? "generic" : ext.substr(1);
      }
      file.categoryId = categoryId;
      files.push_back(std::move(file));
    }
    break;
  }
  LOG(DEBUG) << "Manifest category " << categoryId << ": " << files.size() << " files";
  return files;
}

}  // namespace docfetch
