#include "docgate/content/links.hpp"

#include "docgate/common/fs.hpp"

#include <initializer_list>
#include <regex>
#include <string_view>

namespace docgate::content {

namespace {

bool has_any_prefix(const std::string &url, std::initializer_list<std::string_view> prefixes) {
  for (const auto prefix : prefixes) {
    if (common::starts_with(url, std::string(prefix))) {
      return true;
    }
  }
  return false;
}

std::string resolve(const std::string &url, const std::string &base_url) {
  if (url.rfind('/', 0) == 0) {
    static const std::regex origin_pattern(R"(^(https?://[^/]+))");
    std::smatch origin;
    if (std::regex_search(base_url, origin, origin_pattern)) {
      return origin[1].str() + url;
    }
    return base_url + url;
  }
  return base_url + "/" + url;
}

template <typename Rewrite>
std::string rewrite_matches(const std::string &input, const std::regex &pattern, Rewrite rewrite) {
  std::string out;
  auto begin = std::sregex_iterator(input.begin(), input.end(), pattern);
  const auto end = std::sregex_iterator();
  std::size_t last = 0;
  for (auto it = begin; it != end; ++it) {
    const auto &match = *it;
    out.append(input, last, static_cast<std::size_t>(match.position()) - last);
    out += rewrite(match);
    last = static_cast<std::size_t>(match.position() + match.length());
  }
  out.append(input, last, std::string::npos);
  return out;
}

} // namespace

std::string convert_relative_urls(const std::string &markdown, const std::string &base_url) {
  if (base_url.empty()) {
    return markdown;
  }

  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  static const std::regex link_pattern(R"(\[([^\]]+)\]\(([^)]+)\))");
  static const std::regex image_pattern(R"(!\[([^\]]*)\]\(([^)]+)\))");

  std::string out = rewrite_matches(markdown, link_pattern, [&](const std::smatch &match) {
    std::string url = match[2].str();
    if (!has_any_prefix(url, {"http://", "https://", "#", "mailto:"})) {
      url = resolve(url, base);
    }
    return "[" + match[1].str() + "](" + url + ")";
  });

  out = rewrite_matches(out, image_pattern, [&](const std::smatch &match) {
    std::string url = match[2].str();
    if (!has_any_prefix(url, {"http://", "https://", "#"})) {
      url = resolve(url, base);
    }
    return "![" + match[1].str() + "](" + url + ")";
  });

  return out;
}

} // namespace docgate::content
