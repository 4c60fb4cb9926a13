#include "HtmlLinks.hpp"

#include <regex>
#include <unordered_set>
#include <utility>

#include "utils/url.hpp"

namespace docfetch {

namespace {

std::string stripTags(const std::string& fragment) {
  static const std::regex tag_re(R"(<[^>]*>)");
  std::string text = std::regex_replace(fragment, tag_re, " ");
  std::string collapsed;
  bool space = false;
  for (char c : text) {
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      space = true;
      continue;
    }
    if (space && !collapsed.empty()) collapsed += ' ';
    space = false;
    collapsed += c;
  }
  return collapsed;
}

std::string decodeEntities(std::string s) {
  static const std::pair<const char*, const char*> kEntities[] = {
      {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"}};
  for (const auto& entity : kEntities) {
    std::string from = entity.first;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
      s.replace(pos, from.size(), entity.second);
      pos += 1;
    }
  }
  return s;
}

}  // namespace

std::vector<HtmlLink> extractLinks(const std::string& html, const std::string& pageUrl) {
  // Only <a ... href="...">...</a>, case-insensitive
  static const std::regex a_href_re(
      R"xxx(<\s*a\b[^>]*?href\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>]+))[^>]*>([\s\S]*?)<\s*/\s*a\s*>)xxx",
      std::regex::icase);

  std::vector<HtmlLink> links;
  std::unordered_set<std::string> seen;
  for (std::sregex_iterator it(html.begin(), html.end(), a_href_re), end; it != end; ++it) {
    const auto& m = *it;
    std::string href = m[1].matched ? m[1].str() : m[2].matched ? m[2].str() : m[3].str();
    href = decodeEntities(utils::trim(href));
    if (href.empty() || href[0] == '#') continue;
    std::string lower = utils::toLower(href);
    if (utils::startsWith(lower, "javascript:") || utils::startsWith(lower, "mailto:")) {
      continue;
    }

    HtmlLink link;
    link.href = href;
    link.url = utils::isAbsoluteUrl(href) ? href : utils::joinUrl(pageUrl, href);
    auto hash = link.url.find('#');
    if (hash != std::string::npos) link.url.erase(hash);
    if (!seen.insert(link.url).second) continue;
    link.text = decodeEntities(stripTags(m[4].str()));
    links.push_back(std::move(link));
  }
  return links;
}

}  // namespace docfetch
