#include "docgate/content/prioritizer.hpp"

#include "docgate/common/fs.hpp"
#include "docgate/common/utf8.hpp"

#include <algorithm>
#include <numeric>
#include <optional>

namespace docgate::content {

namespace {

constexpr std::string_view PARAGRAPH_ELLIPSIS = "\n\n...";
constexpr std::string_view WORD_ELLIPSIS = "...";

// A break point is only worth taking if it keeps more than 70% of the budget.
bool keeps_enough(const std::size_t position, const std::size_t max_bytes) {
  return position * 10 > max_bytes * 7;
}

std::optional<std::string> cut_at(const std::string &prefix, const std::size_t length,
                                  const std::string_view suffix, const std::size_t max_bytes) {
  std::string candidate = common::trim(prefix.substr(0, length));
  candidate.append(suffix);
  if (candidate.size() > max_bytes) {
    return std::nullopt;
  }
  return candidate;
}

} // namespace

std::vector<std::size_t> select_sections(const std::vector<Section> &sections,
                                         const std::size_t max_bytes) {
  if (sections.empty()) {
    return {};
  }

  const Section &first = sections.front();
  if (first.size_bytes > max_bytes) {
    return {0};
  }

  std::vector<std::size_t> order(sections.size() - 1);
  std::iota(order.begin(), order.end(), std::size_t{1});
  std::stable_sort(order.begin(), order.end(), [&](const std::size_t lhs, const std::size_t rhs) {
    return sections[lhs].priority > sections[rhs].priority;
  });

  std::size_t remaining = max_bytes - first.size_bytes;
  std::vector<std::size_t> selected{0};
  for (const std::size_t index : order) {
    const std::size_t cost = sections[index].size_bytes + SECTION_SEPARATOR.size();
    if (cost <= remaining) {
      selected.push_back(index);
      remaining -= cost;
    }
  }

  std::sort(selected.begin(), selected.end());
  return selected;
}

std::string prioritize_sections(const std::vector<Section> &sections, const std::size_t max_bytes) {
  if (sections.empty()) {
    return "";
  }
  if (sections.front().size_bytes > max_bytes) {
    return smart_truncate(sections.front().content, max_bytes);
  }

  std::string out;
  bool first = true;
  for (const std::size_t index : select_sections(sections, max_bytes)) {
    if (!first) {
      out.append(SECTION_SEPARATOR);
    }
    first = false;
    out += sections[index].content;
  }
  return out;
}

std::string smart_truncate(const std::string_view text, const std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return std::string(text);
  }
  if (max_bytes == 0) {
    return "";
  }

  const std::string truncated = common::utf8::safe_prefix(text, max_bytes);

  if (const auto para = truncated.rfind("\n\n");
      para != std::string::npos && keeps_enough(para, max_bytes)) {
    if (auto cut = cut_at(truncated, para, PARAGRAPH_ELLIPSIS, max_bytes); cut.has_value()) {
      return *cut;
    }
  }

  std::size_t sentence = std::string::npos;
  for (const std::string_view punct : {".\n", "!\n", "?\n"}) {
    const auto pos = truncated.rfind(punct);
    if (pos != std::string::npos && (sentence == std::string::npos || pos > sentence)) {
      sentence = pos;
    }
  }
  if (sentence != std::string::npos && keeps_enough(sentence, max_bytes)) {
    if (auto cut = cut_at(truncated, sentence + 1, PARAGRAPH_ELLIPSIS, max_bytes);
        cut.has_value()) {
      return *cut;
    }
  }

  if (const auto space = truncated.rfind(' ');
      space != std::string::npos && keeps_enough(space, max_bytes)) {
    if (auto cut = cut_at(truncated, space, WORD_ELLIPSIS, max_bytes); cut.has_value()) {
      return *cut;
    }
  }

  if (max_bytes <= WORD_ELLIPSIS.size()) {
    return std::string(max_bytes, '.');
  }

  const std::string head = common::utf8::safe_prefix(text, max_bytes - WORD_ELLIPSIS.size());
  return common::trim(head) + std::string(WORD_ELLIPSIS);
}

} // namespace docgate::content
