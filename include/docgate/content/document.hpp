#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docgate::content {

struct ShapedDocument {
  std::string content;
  std::size_t size_bytes = 0;
  bool truncated = false;
  std::size_t sections_total = 0;
  std::size_t sections_selected = 0;
};

/// Parse and prioritize a raw Markdown document under a byte budget.
[[nodiscard]] ShapedDocument shape_document(std::string_view markdown, std::size_t max_bytes);

} // namespace docgate::content
