#ifndef DOCFETCH_EPUB_VALIDATOR_HPP_
#define DOCFETCH_EPUB_VALIDATOR_HPP_

#include "Validator.hpp"

namespace docfetch {

// Opens the EPUB container and its package document.
class EpubValidator : public Validator {
 public:
  std::string fileType() const override { return "epub"; }
  std::vector<std::string> extensions() const override { return {".epub"}; }
  ValidationOutcome validate(const std::filesystem::path& path) const override;
};

}  // namespace docfetch

#endif  // DOCFETCH_EPUB_VALIDATOR_HPP_
