#include "Validator.hpp"

#include <fstream>
#include <system_error>

#include "utils/url.hpp"

namespace docfetch {

namespace fs = std::filesystem;

bool Validator::canHandle(const std::string& extension) const {
  std::string ext = utils::toLower(extension);
  if (!ext.empty() && ext[0] != '.') ext = "." + ext;
  for (const auto& own : extensions()) {
    if (own == ext) return true;
  }
  return false;
}

std::optional<std::string> Validator::checkRegularFile(const fs::path& path,
                                                       uintmax_t* size) {
  std::error_code ec;
  auto status = fs::status(path, ec);
  if (ec || !fs::exists(status)) {
    return std::string("File does not exist");
  }
  if (!fs::is_regular_file(status)) {
    return std::string("Not a regular file");
  }
  uintmax_t bytes = fs::file_size(path, ec);
  if (ec) {
    return "Cannot read file size: " + ec.message();
  }
  if (size) *size = bytes;
  return std::nullopt;
}

std::optional<std::string> Validator::readBytes(const fs::path& path,
                                                uintmax_t offset,
                                                size_t maxBytes,
                                                std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    return "Cannot open " + path.string();
  }
  ifs.seekg(static_cast<std::streamoff>(offset));
  if (!ifs) {
    return std::string("Seek failed");
  }
  out->resize(maxBytes);
  ifs.read(&(*out)[0], static_cast<std::streamsize>(maxBytes));
  out->resize(static_cast<size_t>(ifs.gcount()));
  if (ifs.bad()) {
    return std::string("Read failed");
  }
  return std::nullopt;
}

ValidationOutcome GenericValidator::validate(const fs::path& path) const {
  uintmax_t size = 0;
  if (auto error = checkRegularFile(path, &size)) {
    return ValidationOutcome::failure(*error);
  }
  if (size == 0) {
    return ValidationOutcome::failure("File is empty");
  }
  auto outcome = ValidationOutcome::success();
  outcome.metadata["size"] = std::to_string(size);
  return outcome;
}

}  // namespace docfetch
