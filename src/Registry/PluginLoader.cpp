#include "PluginLoader.hpp"

#include <dlfcn.h>

#include "utils/logger.hpp"

namespace docfetch {

PluginLoader::~PluginLoader() {
  for (auto it = handles_.rbegin(); it != handles_.rend(); ++it) {
    dlclose(*it);
  }
}

std::vector<PluginLoadResult> PluginLoader::loadAll(const std::vector<std::string>& paths,
                                                    PluginRegistrar& registrar) {
  std::vector<PluginLoadResult> results;
  for (const auto& path : paths) {
    results.push_back(load(path, registrar));
  }
  return results;
}

PluginLoadResult PluginLoader::load(const std::string& path, PluginRegistrar& registrar) {
  PluginLoadResult result;
  result.path = path;

  void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (handle == nullptr) {
    const char* err = dlerror();
    result.error = err ? err : "dlopen failed";
    LOG(ERROR) << "[plugin] Cannot load " << path << ": " << result.error;
    return result;
  }

  dlerror();
  auto entry = reinterpret_cast<docfetch_register_plugin_fn>(
      dlsym(handle, DOCFETCH_PLUGIN_ENTRY));
  if (entry == nullptr) {
    const char* err = dlerror();
    result.error = std::string("missing ") + DOCFETCH_PLUGIN_ENTRY +
                   (err ? std::string(": ") + err : std::string());
    LOG(ERROR) << "[plugin] Skipping " << path << ": " << result.error;
    dlclose(handle);
    return result;
  }

  try {
    entry(&registrar);
  } catch (const std::exception& e) {
    // Factories registered before the throw stay; the module stays mapped
    // for them.
    result.error = std::string("registration failed: ") + e.what();
    LOG(ERROR) << "[plugin] " << path << ": " << result.error;
    handles_.push_back(handle);
    return result;
  }

  handles_.push_back(handle);
  result.loaded = true;
  LOG(INFO) << "[plugin] Loaded " << path;
  return result;
}

}  // namespace docfetch
