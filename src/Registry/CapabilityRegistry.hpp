#ifndef DOCFETCH_CAPABILITY_REGISTRY_HPP_
#define DOCFETCH_CAPABILITY_REGISTRY_HPP_

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Common/Errors.hpp"
#include "utils/logger.hpp"

namespace docfetch {

/**
 * @brief Maps a capability key to a factory producing an implementation
 * of T. Populated during startup, then frozen; lookups on a frozen registry
 * take no lock and may run from any thread.
 *
 * Args are forwarded to the factory on every resolve (scrapers take the
 * site they are bound to, validators take nothing).
 */
template <typename T, typename... Args>
class CapabilityRegistry {
 public:
  using Factory = std::function<std::unique_ptr<T>(Args...)>;

  explicit CapabilityRegistry(std::string name) : name_(std::move(name)) {}

  // Last registration for a key wins.
  void registerFactory(const std::string& key, Factory factory) {
    if (frozen_) {
      throw std::logic_error(name_ + " registry is frozen, cannot register '" +
                             key + "'");
    }
    if (!factory) {
      throw std::invalid_argument("empty factory for '" + key + "'");
    }
    auto it = factories_.find(key);
    if (it != factories_.end()) {
      LOG(WARN) << "[" << name_ << "] Replacing registration for '" << key
                << "'";
      it->second = std::move(factory);
    } else {
      LOG(INFO) << "[" << name_ << "] Registered '" << key << "'";
      factories_.emplace(key, std::move(factory));
    }
  }

  std::unique_ptr<T> resolve(const std::string& key, Args... args) const {
    auto it = factories_.find(key);
    if (it == factories_.end()) {
      throw UnknownCapabilityError("no " + name_ + " registered for '" + key +
                                   "'");
    }
    auto instance = it->second(std::forward<Args>(args)...);
    if (!instance) {
      throw UnknownCapabilityError(name_ + " factory for '" + key +
                                   "' produced nothing");
    }
    return instance;
  }

  // Null when the key is unknown.
  std::unique_ptr<T> tryResolve(const std::string& key, Args... args) const {
    auto it = factories_.find(key);
    if (it == factories_.end()) return nullptr;
    return it->second(std::forward<Args>(args)...);
  }

  bool contains(const std::string& key) const {
    return factories_.count(key) > 0;
  }

  std::vector<std::string> keys() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& kv : factories_) out.push_back(kv.first);
    return out;
  }

  size_t size() const { return factories_.size(); }

  void freeze() { frozen_ = true; }
  bool frozen() const { return frozen_; }
  const std::string& name() const { return name_; }

 private:
  std::string name_;
  std::map<std::string, Factory> factories_;
  bool frozen_ = false;
};

}  // namespace docfetch

#endif  // DOCFETCH_CAPABILITY_REGISTRY_HPP_
