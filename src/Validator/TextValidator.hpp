#ifndef DOCFETCH_TEXT_VALIDATOR_HPP_
#define DOCFETCH_TEXT_VALIDATOR_HPP_

#include <string>

#include "Validator.hpp"

namespace docfetch {

// "utf-8", "utf-8-sig", "utf-16le", "utf-16be", "ascii", or empty when the
// sample is neither valid UTF-8 nor BOM-marked.
std::string detectTextEncoding(const std::string& sample, bool complete);

class TextValidator : public Validator {
 public:
  std::string fileType() const override { return "txt"; }
  std::vector<std::string> extensions() const override {
    return {".txt", ".text"};
  }
  ValidationOutcome validate(const std::filesystem::path& path) const override;
};

class MarkdownValidator : public Validator {
 public:
  std::string fileType() const override { return "markdown"; }
  std::vector<std::string> extensions() const override {
    return {".md", ".markdown"};
  }
  ValidationOutcome validate(const std::filesystem::path& path) const override;
};

}  // namespace docfetch

#endif  // DOCFETCH_TEXT_VALIDATOR_HPP_
