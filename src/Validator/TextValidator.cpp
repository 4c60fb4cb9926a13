#include "TextValidator.hpp"

#include <algorithm>
#include <sstream>

#include "utils/url.hpp"

namespace docfetch {

namespace {

constexpr size_t kSampleBytes = 1024 * 1024;
const char* const kDefaultEncoding = "iso-8859-1";

// Length of the UTF-8 sequence at data[pos], 0 when invalid, -1 when the
// sample ends inside the sequence.
int utf8SequenceLength(const std::string& data, size_t pos) {
  unsigned char c = static_cast<unsigned char>(data[pos]);
  int len = 0;
  if (c < 0x80) return 1;
  if (c >= 0xC2 && c <= 0xDF) {
    len = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    len = 3;
  } else if (c >= 0xF0 && c <= 0xF4) {
    len = 4;
  } else {
    return 0;
  }
  for (int i = 1; i < len; ++i) {
    if (pos + i >= data.size()) return -1;
    unsigned char cc = static_cast<unsigned char>(data[pos + i]);
    if ((cc & 0xC0) != 0x80) return 0;
  }
  return len;
}

}  // namespace

std::string detectTextEncoding(const std::string& sample, bool complete) {
  if (sample.compare(0, 3, "\xEF\xBB\xBF") == 0) return "utf-8-sig";
  if (sample.compare(0, 2, "\xFF\xFE") == 0) return "utf-16le";
  if (sample.compare(0, 2, "\xFE\xFF") == 0) return "utf-16be";

  bool ascii = true;
  for (size_t pos = 0; pos < sample.size();) {
    int len = utf8SequenceLength(sample, pos);
    if (len < 0) {
      // A sequence cut by the end of a partial sample is not an error.
      if (complete) return {};
      break;
    }
    if (len == 0) return {};
    if (len > 1) ascii = false;
    pos += static_cast<size_t>(len);
  }
  return ascii ? "ascii" : "utf-8";
}

ValidationOutcome TextValidator::validate(const std::filesystem::path& path) const {
  uintmax_t size = 0;
  if (auto error = checkRegularFile(path, &size)) {
    return ValidationOutcome::failure(*error);
  }
  if (size == 0) {
    return ValidationOutcome::failure("File is empty");
  }

  std::string sample;
  if (auto error = readBytes(path, 0, kSampleBytes, &sample)) {
    return ValidationOutcome::failure(*error);
  }
  bool complete = sample.size() == size;
  std::string encoding = detectTextEncoding(sample, complete);
  bool utf16 = encoding == "utf-16le" || encoding == "utf-16be";
  if (encoding.empty()) {
    if (sample.find('\0') != std::string::npos) {
      return ValidationOutcome::failure("Binary content in text file");
    }
    encoding = kDefaultEncoding;
  } else if (!utf16 && sample.find('\0') != std::string::npos) {
    return ValidationOutcome::failure("Binary content in text file");
  }

  auto outcome = ValidationOutcome::success();
  outcome.metadata["encoding"] = encoding;
  outcome.metadata["size"] = std::to_string(size);
  if (complete && !utf16) {
    outcome.metadata["lines"] = std::to_string(
        std::count(sample.begin(), sample.end(), '\n') +
        (sample.back() == '\n' ? 0 : 1));
  }
  return outcome;
}

ValidationOutcome MarkdownValidator::validate(const std::filesystem::path& path) const {
  uintmax_t size = 0;
  if (auto error = checkRegularFile(path, &size)) {
    return ValidationOutcome::failure(*error);
  }
  if (size == 0) {
    return ValidationOutcome::failure("File is empty");
  }
  std::string sample;
  if (auto error = readBytes(path, 0, kSampleBytes, &sample)) {
    return ValidationOutcome::failure(*error);
  }
  std::string encoding = detectTextEncoding(sample, sample.size() == size);
  if (encoding.empty() || encoding == "utf-16le" || encoding == "utf-16be") {
    return ValidationOutcome::failure("Markdown file is not UTF-8");
  }

  std::string title;
  int headers = 0;
  std::istringstream lines(sample);
  std::string line;
  while (std::getline(lines, line)) {
    std::string trimmed = utils::trim(line);
    if (trimmed.empty() || trimmed[0] != '#') continue;
    ++headers;
    if (title.empty() && utils::startsWith(trimmed, "# ")) {
      title = utils::trim(trimmed.substr(2));
    }
  }

  auto outcome = ValidationOutcome::success();
  outcome.metadata["size"] = std::to_string(size);
  outcome.metadata["header_count"] = std::to_string(headers);
  if (!title.empty()) outcome.metadata["title"] = title;
  return outcome;
}

}  // namespace docfetch
