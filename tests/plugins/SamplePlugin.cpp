// Test plugin: adds a "static" scraper and a "csv" validator.
#include <memory>
#include <string>
#include <vector>

#include "Registry/PluginLoader.hpp"

namespace {

class StaticScraper : public docfetch::Scraper {
 public:
  explicit StaticScraper(const docfetch::ScraperContext& context) : Scraper(context) {}

  std::string scraperType() const override { return "static"; }

  std::vector<docfetch::Category> listCategories() override {
    docfetch::Category category;
    category.id = "all";
    category.name = "All";
    category.url = context_.baseUrl;
    return {category};
  }

  std::vector<docfetch::RemoteFile> listFilesInCategory(const std::string& categoryId) override {
    docfetch::RemoteFile file;
    file.name = "Static";
    file.url = context_.baseUrl + "/static.csv";
    file.size = 3;
    file.fileType = "csv";
    file.categoryId = categoryId;
    return {file};
  }
};

class CsvValidator : public docfetch::Validator {
 public:
  std::string fileType() const override { return "csv"; }
  std::vector<std::string> extensions() const override { return {".csv"}; }
  docfetch::ValidationOutcome validate(const std::filesystem::path& path) const override {
    uintmax_t size = 0;
    if (auto error = checkRegularFile(path, &size)) {
      return docfetch::ValidationOutcome::failure(*error);
    }
    return docfetch::ValidationOutcome::success();
  }
};

}  // namespace

extern "C" void docfetch_register_plugin(docfetch::PluginRegistrar* registrar) {
  registrar->scrapers.registerFactory("static", [](const docfetch::ScraperContext& context) {
    return std::make_unique<StaticScraper>(context);
  });
  registrar->validators.registerFactory("csv", [] { return std::make_unique<CsvValidator>(); });
}
