#include "PdfValidator.hpp"

#include <mupdf/fitz.h>

#include <string>

#include "utils/logger.hpp"

namespace docfetch {

namespace {

constexpr size_t kTrailerWindow = 2048;
// Resource cache of one validation context.
constexpr size_t kStoreBytes = 32 << 20;

void logMupdfMessage(void* /*user*/, const char* message) {
  LOG(DEBUG) << "[mupdf] " << message;
}

}  // namespace

ValidationOutcome PdfValidator::validate(const std::filesystem::path& path) const {
  uintmax_t size = 0;
  if (auto error = checkRegularFile(path, &size)) {
    return ValidationOutcome::failure(*error);
  }
  if (size == 0) {
    return ValidationOutcome::failure("File is empty");
  }

  std::string head;
  if (auto error = readBytes(path, 0, 1024, &head)) {
    return ValidationOutcome::failure(*error);
  }
  size_t magic = head.find("%PDF-");
  if (magic == std::string::npos) {
    return ValidationOutcome::failure("Missing %PDF- header");
  }
  std::string version = head.substr(magic + 5, 3);

  // MuPDF repairs a cut-off file silently, so the trailer is checked first.
  std::string tail;
  uintmax_t tailOffset = size > kTrailerWindow ? size - kTrailerWindow : 0;
  if (auto error = readBytes(path, tailOffset, kTrailerWindow, &tail)) {
    return ValidationOutcome::failure(*error);
  }
  if (tail.find("%%EOF") == std::string::npos) {
    return ValidationOutcome::failure("Missing %%EOF trailer (truncated file?)");
  }

  // 每次校验使用独立的 context，并行校验之间不共享状态
  fz_context* ctx = fz_new_context(nullptr, nullptr, kStoreBytes);
  if (!ctx) {
    return ValidationOutcome::failure("Cannot create MuPDF context");
  }
  fz_set_warning_callback(ctx, logMupdfMessage, nullptr);
  fz_set_error_callback(ctx, logMupdfMessage, nullptr);

  const std::string file = path.string();
  fz_document* doc = nullptr;
  int pages = 0;
  char title[256] = {0};
  bool failed = false;
  std::string error;
  fz_var(doc);
  fz_var(pages);
  fz_try(ctx) {
    fz_register_document_handlers(ctx);
    doc = fz_open_document(ctx, file.c_str());
    pages = fz_count_pages(ctx, doc);
    if (fz_lookup_metadata(ctx, doc, FZ_META_INFO_TITLE, title, sizeof(title)) < 0) {
      title[0] = '\0';
    }
  }
  fz_always(ctx) {
    fz_drop_document(ctx, doc);
  }
  fz_catch(ctx) {
    failed = true;
    error = fz_caught_message(ctx);
  }
  fz_drop_context(ctx);

  if (failed) {
    return ValidationOutcome::failure("Cannot open PDF: " + error);
  }
  if (pages <= 0) {
    return ValidationOutcome::failure("PDF has no pages");
  }

  auto outcome = ValidationOutcome::success();
  outcome.metadata["version"] = version;
  outcome.metadata["size"] = std::to_string(size);
  outcome.metadata["pages"] = std::to_string(pages);
  if (title[0] != '\0') outcome.metadata["title"] = title;
  return outcome;
}

}  // namespace docfetch
