#pragma once

#include <string>

namespace docgate::content {

/// Rewrite relative Markdown link and image targets against `base_url`.
/// Absolute (`http://`, `https://`), fragment (`#...`) and `mailto:` targets
/// are left alone; root-relative paths resolve against the scheme and host.
[[nodiscard]] std::string convert_relative_urls(const std::string &markdown,
                                                const std::string &base_url);

} // namespace docgate::content
