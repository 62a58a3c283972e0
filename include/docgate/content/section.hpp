#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docgate::content {

/// A heading-delimited span of a Markdown document.
///
/// `content` includes the heading line itself. Text that precedes the first
/// heading forms its own section with `level == 0` and an empty title. A
/// document with no heading at all yields exactly one fallback section with
/// `level == 0`, an empty title and priority 100.
struct Section {
  int level = 0;
  std::string title;
  std::string content;
  int priority = 0;
  std::size_t size_bytes = 0;
};

constexpr int DEFAULT_SECTION_SCORE = 30;
constexpr int FALLBACK_SECTION_SCORE = 100;

/// Split a Markdown document on ATX headings (`#` to `######`).
/// Empty or whitespace-only input yields no sections.
[[nodiscard]] std::vector<Section> extract_sections(std::string_view markdown);

/// Relevance score for a section title, from the first keyword bucket that
/// matches (case-insensitive substring). Unmatched or empty titles score 30.
[[nodiscard]] int score_section(std::string_view title);

/// Inverse of extract_sections: joins section contents with the line breaks
/// that separated them.
[[nodiscard]] std::string join_sections(const std::vector<Section> &sections);

} // namespace docgate::content
