#ifndef DOCFETCH_PDF_VALIDATOR_HPP_
#define DOCFETCH_PDF_VALIDATOR_HPP_

#include "Validator.hpp"

namespace docfetch {

// Header and trailer sniffing, then a MuPDF open that must find a page.
class PdfValidator : public Validator {
 public:
  std::string fileType() const override { return "pdf"; }
  std::vector<std::string> extensions() const override { return {".pdf"}; }
  ValidationOutcome validate(const std::filesystem::path& path) const override;
};

}  // namespace docfetch

#endif  // DOCFETCH_PDF_VALIDATOR_HPP_
