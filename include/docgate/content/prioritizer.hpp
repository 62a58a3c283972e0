#pragma once

#include "docgate/content/section.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docgate::content {

inline constexpr std::string_view SECTION_SEPARATOR = "\n\n";

/// Indices (in document order) of the sections kept under `max_bytes`.
/// When the first section alone exceeds the budget only index 0 is returned.
[[nodiscard]] std::vector<std::size_t> select_sections(const std::vector<Section> &sections,
                                                       std::size_t max_bytes);

/// Greedy byte-budget selection.
///
/// The first section is always kept; if it alone exceeds `max_bytes` it is
/// smart-truncated and returned on its own. The rest are visited by priority
/// (descending, ties in document order) and kept whole when they fit in the
/// remaining budget, separator included. Kept sections are emitted in
/// document order joined by a blank line. No backtracking: a section that
/// does not fit is skipped even if a smaller, lower-priority one would have
/// used the space better.
[[nodiscard]] std::string prioritize_sections(const std::vector<Section> &sections,
                                              std::size_t max_bytes);

/// Cut `text` to at most `max_bytes` UTF-8 bytes, preferring a paragraph,
/// then sentence, then word boundary that keeps more than 70% of the budget.
/// Never splits a code point.
[[nodiscard]] std::string smart_truncate(std::string_view text, std::size_t max_bytes);

} // namespace docgate::content
