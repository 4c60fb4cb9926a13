#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace utils {

std::string toLower(const std::string& s) {
  std::string r = s;
  for (auto& ch : r) ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
  return r;
}

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
  if (s.size() < suffix.size()) return false;
  return std::equal(s.end() - suffix.size(), s.end(), suffix.begin());
}

std::string trim(const std::string& s) {
  size_t a = s.find_first_not_of(" \t\r\n");
  if (a == std::string::npos) return {};
  size_t b = s.find_last_not_of(" \t\r\n");
  return s.substr(a, b - a + 1);
}

std::vector<std::string> splitList(const std::string& list, char sep) {
  std::vector<std::string> out;
  std::istringstream ss(list);
  std::string item;
  while (std::getline(ss, item, sep)) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

std::optional<UrlParts> parseUrl(const std::string& url) {
  static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*):\/\/([^\/?#]+)([^#]*)?)");
  std::smatch m;
  if (!std::regex_search(url, m, re)) return std::nullopt;
  UrlParts p;
  p.scheme = toLower(m[1].str());
  p.host = m[2].str();
  p.path = m.size() >= 4 ? m[3].str() : "/";
  if (p.path.empty() || p.path[0] != '/') p.path = "/" + p.path;
  return p;
}

bool isAbsoluteUrl(const std::string& url) {
  return url.find("://") != std::string::npos;
}

namespace {

std::string dirnamePath(const std::string& path) {
  std::string clean = path.substr(0, path.find('?'));
  auto pos = clean.rfind('/');
  if (pos == std::string::npos || pos == 0) return "/";
  return clean.substr(0, pos + 1);
}

// Collapses "." and ".." segments.
std::string removeDotSegments(const std::string& path) {
  std::string query;
  std::string p = path;
  auto q = p.find('?');
  if (q != std::string::npos) {
    query = p.substr(q);
    p = p.substr(0, q);
  }
  std::vector<std::string> out;
  std::istringstream ss(p);
  std::string seg;
  bool trailing = !p.empty() && p.back() == '/';
  while (std::getline(ss, seg, '/')) {
    if (seg.empty() || seg == ".") continue;
    if (seg == "..") {
      if (!out.empty()) out.pop_back();
      continue;
    }
    out.push_back(seg);
  }
  std::string result;
  for (const auto& s : out) result += "/" + s;
  if (result.empty() || trailing) result += "/";
  return result + query;
}

}  // namespace

std::string joinUrl(const std::string& base, const std::string& link) {
  auto b = parseUrl(base);
  if (!b) return link;
  if (isAbsoluteUrl(link)) return link;
  std::string origin = b->scheme + "://" + b->host;
  if (link.empty()) return origin + b->path;
  // protocol-relative
  if (link.size() > 1 && link[0] == '/' && link[1] == '/') return b->scheme + ":" + link;
  if (link[0] == '/') return origin + removeDotSegments(link);
  if (link[0] == '?') return origin + b->path.substr(0, b->path.find('?')) + link;
  if (link[0] == '#') return origin + b->path;
  return origin + removeDotSegments(dirnamePath(b->path) + link);
}

std::string normalizeUrl(const std::string& url) {
  auto hash = url.find('#');
  std::string u = hash == std::string::npos ? url : url.substr(0, hash);
  auto parts = parseUrl(u);
  if (parts && parts->path == "/") return u;
  if (u.size() > 1 && endsWith(u, "/")) u.pop_back();
  return u;
}

bool sameHost(const std::string& a, const std::string& b) {
  auto pa = parseUrl(a);
  auto pb = parseUrl(b);
  return pa && pb && toLower(pa->host) == toLower(pb->host);
}

std::string percentDecode(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%' && i + 2 < s.size() &&
        std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
      out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
      i += 2;
    } else {
      out += s[i];
    }
  }
  return out;
}

std::string fileNameFromUrl(const std::string& url) {
  std::string path = url;
  auto parts = parseUrl(url);
  if (parts) path = parts->path;
  auto cut = path.find_first_of("?#");
  if (cut != std::string::npos) path = path.substr(0, cut);
  auto slash = path.find_last_of('/');
  std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  return percentDecode(name);
}

std::string extensionOf(const std::string& name) {
  std::string base = name;
  auto cut = base.find_first_of("?#");
  if (cut != std::string::npos) base = base.substr(0, cut);
  auto slash = base.find_last_of("/\\");
  if (slash != std::string::npos) base = base.substr(slash + 1);
  auto dot = base.rfind('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) return {};
  return toLower(base.substr(dot));
}

std::string sanitizeFilename(const std::string& name) {
  std::string s = trim(name);
  for (char& c : s) {
    if (c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' ||
        c == '<' || c == '>' || c == '|' || static_cast<unsigned char>(c) < 0x20) {
      c = '_';
    }
  }
  if (s == "." || s == "..") s = "_";
  return s;
}

}  // namespace utils
