#ifndef DOCFETCH_VALIDATOR_REGISTRY_HPP_
#define DOCFETCH_VALIDATOR_REGISTRY_HPP_

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Registry/CapabilityRegistry.hpp"
#include "Validator.hpp"

namespace docfetch {

/**
 * @brief Validator registry keyed by file type, with an extension index.
 *
 * The extension index is filled at registration time from the
 * implementation's declared extensions. When two validators claim the same
 * extension the one registered last keeps it.
 */
class ValidatorRegistry {
 public:
  using Factory = CapabilityRegistry<Validator>::Factory;

  static constexpr const char* kGenericKey = "generic";

  ValidatorRegistry();

  void registerFactory(const std::string& key, Factory factory);

  std::unique_ptr<Validator> resolve(const std::string& key) const;
  std::unique_ptr<Validator> tryResolve(const std::string& key) const;
  // Unknown extensions get the generic validator.
  std::unique_ptr<Validator> resolveForExtension(const std::string& extension) const;
  // Falls back to the extension when the type is empty or unknown.
  std::unique_ptr<Validator> resolveForType(const std::string& fileType) const;
  std::unique_ptr<Validator> resolveForFile(const std::filesystem::path& path,
                                            const std::string& fileType = "") const;

  bool contains(const std::string& key) const { return registry_.contains(key); }
  std::vector<std::string> keys() const { return registry_.keys(); }
  std::vector<std::string> supportedExtensions() const;
  // Key that currently owns `extension`, empty if none.
  std::string keyForExtension(const std::string& extension) const;

  void freeze() { registry_.freeze(); }
  bool frozen() const { return registry_.frozen(); }

 private:
  CapabilityRegistry<Validator> registry_;
  std::map<std::string, std::string> extensionIndex_;
};

void registerBuiltinValidators(ValidatorRegistry& registry);

}  // namespace docfetch

#endif  // DOCFETCH_VALIDATOR_REGISTRY_HPP_
