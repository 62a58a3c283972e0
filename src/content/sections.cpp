#include "docgate/content/section.hpp"

#include "docgate/common/fs.hpp"

#include <array>
#include <cctype>
#include <optional>

namespace docgate::content {

namespace {

struct KeywordBucket {
  int score;
  std::vector<std::string_view> keywords;
};

// Highest score first; the first bucket with a match wins.
const std::array<KeywordBucket, 8> &keyword_buckets() {
  static const std::array<KeywordBucket, 8> buckets = {{
      {100, {"overview", "introduction", "about", "description"}},
      {90, {"install", "installation", "setup", "getting started", "get started"}},
      {85, {"quickstart", "quick start", "tutorial", "guide", "walkthrough"}},
      {80, {"usage", "example", "examples", "how to", "howto"}},
      {70, {"api", "reference", "methods", "functions", "classes"}},
      {60, {"configuration", "config", "options", "settings", "parameters"}},
      {50, {"advanced", "tips", "best practices", "patterns"}},
      {40, {"changelog", "history", "releases", "versions"}},
  }};
  return buckets;
}

struct Heading {
  int level = 0;
  std::string title;
};

std::optional<Heading> parse_heading(const std::string_view line) {
  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  if (hashes == 0 || hashes > 6) {
    return std::nullopt;
  }
  // At least one whitespace character, then at least one more character.
  if (line.size() < hashes + 2 || std::isspace(static_cast<unsigned char>(line[hashes])) == 0) {
    return std::nullopt;
  }
  return Heading{.level = static_cast<int>(hashes),
                 .title = common::trim(std::string(line.substr(hashes)))};
}

Section make_section(const int level, std::string title, std::string content) {
  Section section;
  section.level = level;
  section.priority = score_section(title);
  section.title = std::move(title);
  section.size_bytes = content.size();
  section.content = std::move(content);
  return section;
}

} // namespace

std::vector<Section> extract_sections(const std::string_view markdown) {
  std::vector<Section> sections;
  if (common::trim(std::string(markdown)).empty()) {
    return sections;
  }

  bool saw_heading = false;
  bool open = false;
  int current_level = 0;
  std::string current_title;
  std::string current_content;

  std::size_t line_start = 0;
  while (line_start <= markdown.size()) {
    std::size_t line_end = markdown.find('\n', line_start);
    if (line_end == std::string_view::npos) {
      line_end = markdown.size();
    }
    const std::string_view line = markdown.substr(line_start, line_end - line_start);

    if (auto heading = parse_heading(line); heading.has_value()) {
      if (open) {
        sections.push_back(make_section(current_level, std::move(current_title),
                                        std::move(current_content)));
      }
      saw_heading = true;
      current_level = heading->level;
      current_title = std::move(heading->title);
      current_content.assign(line);
    } else {
      if (open) {
        current_content.push_back('\n');
      }
      current_content.append(line);
    }
    open = true;
    line_start = line_end + 1;
  }

  if (open) {
    sections.push_back(
        make_section(current_level, std::move(current_title), std::move(current_content)));
  }

  if (!saw_heading) {
    sections.clear();
    Section fallback;
    fallback.level = 0;
    fallback.content = std::string(markdown);
    fallback.priority = FALLBACK_SECTION_SCORE;
    fallback.size_bytes = fallback.content.size();
    sections.push_back(std::move(fallback));
  }

  return sections;
}

int score_section(const std::string_view title) {
  if (title.empty()) {
    return DEFAULT_SECTION_SCORE;
  }

  const std::string lowered = common::to_lower(std::string(title));
  for (const auto &bucket : keyword_buckets()) {
    for (const auto keyword : bucket.keywords) {
      if (lowered.find(keyword) != std::string::npos) {
        return bucket.score;
      }
    }
  }
  return DEFAULT_SECTION_SCORE;
}

std::string join_sections(const std::vector<Section> &sections) {
  std::string out;
  for (std::size_t i = 0; i < sections.size(); ++i) {
    if (i > 0) {
      out.push_back('\n');
    }
    out += sections[i].content;
  }
  return out;
}

} // namespace docgate::content
