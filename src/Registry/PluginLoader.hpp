#ifndef DOCFETCH_PLUGIN_LOADER_HPP_
#define DOCFETCH_PLUGIN_LOADER_HPP_

#include <string>
#include <vector>

#include "Scraper/Scraper.hpp"
#include "Validator/ValidatorRegistry.hpp"

namespace docfetch {

// Handed to a plugin's entry point; the plugin registers its factories here.
struct PluginRegistrar {
  ScraperRegistry& scrapers;
  ValidatorRegistry& validators;
};

}  // namespace docfetch

// Entry point every plugin module exports.
extern "C" {
typedef void (*docfetch_register_plugin_fn)(docfetch::PluginRegistrar* registrar);
}
#define DOCFETCH_PLUGIN_ENTRY "docfetch_register_plugin"

namespace docfetch {

struct PluginLoadResult {
  std::string path;
  bool loaded = false;
  std::string error;
};

/**
 * @brief Loads the shared objects named on the command line and lets each
 * register its scrapers and validators.
 *
 * A module that cannot be opened or lacks the entry point is logged and
 * skipped. Loaded modules stay mapped until the loader is destroyed, so the
 * loader must outlive the registries it populated.
 */
class PluginLoader {
 public:
  PluginLoader() = default;
  ~PluginLoader();

  PluginLoader(const PluginLoader&) = delete;
  PluginLoader& operator=(const PluginLoader&) = delete;

  std::vector<PluginLoadResult> loadAll(const std::vector<std::string>& paths,
                                        PluginRegistrar& registrar);
  PluginLoadResult load(const std::string& path, PluginRegistrar& registrar);

  size_t loadedCount() const { return handles_.size(); }

 private:
  std::vector<void*> handles_;
};

}  // namespace docfetch

#endif  // DOCFETCH_PLUGIN_LOADER_HPP_
