#include "ValidatorRegistry.hpp"

#include <utility>

#include "EpubValidator.hpp"
#include "PdfValidator.hpp"
#include "TextValidator.hpp"
#include "utils/logger.hpp"
#include "utils/url.hpp"

namespace docfetch {

namespace {

std::string normalizeExtension(const std::string& extension) {
  std::string ext = utils::toLower(utils::trim(extension));
  if (!ext.empty() && ext[0] != '.') ext = "." + ext;
  return ext;
}

}  // namespace

ValidatorRegistry::ValidatorRegistry() : registry_("validator") {}

void ValidatorRegistry::registerFactory(const std::string& key, Factory factory) {
  std::vector<std::string> extensions;
  if (factory) {
    // Probe one instance for the extensions it claims.
    auto probe = factory();
    if (probe) extensions = probe->extensions();
  }
  registry_.registerFactory(key, std::move(factory));

  for (const auto& raw : extensions) {
    std::string ext = normalizeExtension(raw);
    if (ext.empty()) continue;
    auto it = extensionIndex_.find(ext);
    if (it != extensionIndex_.end() && it->second != key) {
      LOG(WARN) << "[validator] Extension " << ext << " moves from '"
                << it->second << "' to '" << key << "'";
    }
    extensionIndex_[ext] = key;
  }
}

std::unique_ptr<Validator> ValidatorRegistry::resolve(const std::string& key) const {
  return registry_.resolve(key);
}

std::unique_ptr<Validator> ValidatorRegistry::tryResolve(const std::string& key) const {
  return registry_.tryResolve(key);
}

std::unique_ptr<Validator> ValidatorRegistry::resolveForExtension(
    const std::string& extension) const {
  std::string key = keyForExtension(extension);
  if (!key.empty()) {
    auto validator = registry_.tryResolve(key);
    if (validator) return validator;
  }
  return registry_.resolve(kGenericKey);
}

std::unique_ptr<Validator> ValidatorRegistry::resolveForType(
    const std::string& fileType) const {
  std::string type = utils::toLower(utils::trim(fileType));
  if (!type.empty()) {
    auto validator = registry_.tryResolve(type);
    if (validator) return validator;
  }
  return resolveForExtension(type);
}

std::unique_ptr<Validator> ValidatorRegistry::resolveForFile(
    const std::filesystem::path& path, const std::string& fileType) const {
  std::string type = utils::toLower(utils::trim(fileType));
  if (!type.empty() && type != kGenericKey) {
    auto validator = registry_.tryResolve(type);
    if (validator) return validator;
    if (!keyForExtension(type).empty()) return resolveForExtension(type);
  }
  return resolveForExtension(path.extension().string());
}

std::vector<std::string> ValidatorRegistry::supportedExtensions() const {
  std::vector<std::string> out;
  out.reserve(extensionIndex_.size());
  for (const auto& kv : extensionIndex_) out.push_back(kv.first);
  return out;
}

std::string ValidatorRegistry::keyForExtension(const std::string& extension) const {
  auto it = extensionIndex_.find(normalizeExtension(extension));
  return it == extensionIndex_.end() ? std::string() : it->second;
}

void registerBuiltinValidators(ValidatorRegistry& registry) {
  registry.registerFactory("pdf", [] { return std::make_unique<PdfValidator>(); });
  registry.registerFactory("epub", [] { return std::make_unique<EpubValidator>(); });
  registry.registerFactory("txt", [] { return std::make_unique<TextValidator>(); });
  registry.registerFactory("markdown",
                           [] { return std::make_unique<MarkdownValidator>(); });
  registry.registerFactory(ValidatorRegistry::kGenericKey,
                           [] { return std::make_unique<GenericValidator>(); });
}

}  // namespace docfetch
