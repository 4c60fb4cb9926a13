#ifndef DOCFETCH_VALIDATOR_HPP_
#define DOCFETCH_VALIDATOR_HPP_

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docfetch {

struct ValidationOutcome {
  bool valid = false;
  std::map<std::string, std::string> metadata;
  std::optional<std::string> error;

  static ValidationOutcome success() {
    ValidationOutcome outcome;
    outcome.valid = true;
    return outcome;
  }
  static ValidationOutcome failure(const std::string& reason) {
    ValidationOutcome outcome;
    outcome.error = reason;
    return outcome;
  }
};

/**
 * @brief Content check for one family of file types.
 *
 * validate() must not throw for a missing, unreadable or malformed file;
 * it reports valid=false with a reason instead. Implementations are
 * stateless and safe to call from several threads.
 */
class Validator {
 public:
  virtual ~Validator() = default;

  virtual std::string fileType() const = 0;
  // Lower-case, with the leading dot: {".pdf"}.
  virtual std::vector<std::string> extensions() const = 0;
  virtual ValidationOutcome validate(const std::filesystem::path& path) const = 0;

  bool canHandle(const std::string& extension) const;

 protected:
  // Empty when `path` is a readable regular file; *size receives its size.
  static std::optional<std::string> checkRegularFile(
      const std::filesystem::path& path, uintmax_t* size);
  // Reads at most maxBytes from offset; error text on failure.
  static std::optional<std::string> readBytes(const std::filesystem::path& path,
                                              uintmax_t offset, size_t maxBytes,
                                              std::string* out);
};

// Fallback for extensions nobody claims: the file exists and is not empty.
class GenericValidator : public Validator {
 public:
  std::string fileType() const override { return "generic"; }
  std::vector<std::string> extensions() const override { return {}; }
  ValidationOutcome validate(const std::filesystem::path& path) const override;
};

}  // namespace docfetch

#endif  // DOCFETCH_VALIDATOR_HPP_
