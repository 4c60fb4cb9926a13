#ifndef DOCFETCH_HTML_LINKS_HPP_
#define DOCFETCH_HTML_LINKS_HPP_

#include <string>
#include <vector>

namespace docfetch {

struct HtmlLink {
  std::string href;  // as written in the page
  std::string url;   // resolved against the page, fragment dropped
  std::string text;  // anchor text with tags stripped
};

// <a href="..."> links of a page in document order. Links that resolve to
// the same url are reported once.
std::vector<HtmlLink> extractLinks(const std::string& html, const std::string& pageUrl);

}  // namespace docfetch

#endif  // DOCFETCH_HTML_LINKS_HPP_
