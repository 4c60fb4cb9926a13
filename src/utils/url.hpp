#pragma once

#include <optional>
#include <string>
#include <vector>

namespace utils {

struct UrlParts {
  std::string scheme;
  std::string host;
  std::string path;
};

std::string toLower(const std::string& s);
bool startsWith(const std::string& s, const std::string& prefix);
bool endsWith(const std::string& s, const std::string& suffix);
std::string trim(const std::string& s);
std::vector<std::string> splitList(const std::string& list, char sep = ',');

std::optional<UrlParts> parseUrl(const std::string& url);
bool isAbsoluteUrl(const std::string& url);
// Resolves `link` against the page it was found on.
std::string joinUrl(const std::string& base, const std::string& link);
// Drops the fragment and a trailing slash.
std::string normalizeUrl(const std::string& url);
bool sameHost(const std::string& a, const std::string& b);

// Last path segment with query and fragment removed, percent-decoded.
std::string fileNameFromUrl(const std::string& url);
// ".pdf" for "a/b/Book.PDF"; empty when there is none.
std::string extensionOf(const std::string& name);
std::string sanitizeFilename(const std::string& name);
std::string percentDecode(const std::string& s);

}  // namespace utils
