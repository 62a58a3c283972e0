#include "docgate/common/utf8.hpp"

namespace docgate::common::utf8 {

namespace {

constexpr bool is_continuation(const unsigned char byte) { return (byte & 0xC0U) == 0x80U; }

} // namespace

std::size_t sequence_length(const unsigned char lead) {
  if (lead < 0x80U) {
    return 1;
  }
  if (is_continuation(lead)) {
    return 0;
  }
  if ((lead & 0xE0U) == 0xC0U) {
    return 2;
  }
  if ((lead & 0xF0U) == 0xE0U) {
    return 3;
  }
  if ((lead & 0xF8U) == 0xF0U) {
    return 4;
  }
  return 1;
}

std::size_t boundary_at_or_before(const std::string_view text, const std::size_t limit) {
  if (limit >= text.size()) {
    return text.size();
  }

  // Walk back to the lead byte of the sequence that straddles `limit`.
  std::size_t start = limit;
  std::size_t steps = 0;
  while (start > 0 && steps < 3 && is_continuation(static_cast<unsigned char>(text[start]))) {
    --start;
    ++steps;
  }

  const auto lead = static_cast<unsigned char>(text[start]);
  const std::size_t length = sequence_length(lead);
  if (length == 0) {
    // Stray continuation bytes; nothing decodable to protect.
    return limit;
  }
  if (start + length <= limit) {
    return limit;
  }
  return start;
}

std::string safe_prefix(const std::string_view text, const std::size_t limit) {
  return std::string(text.substr(0, boundary_at_or_before(text, limit)));
}

bool is_valid(const std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    const std::size_t length = sequence_length(lead);
    if (length == 0 || (length == 1 && lead >= 0x80U)) {
      return false;
    }
    if (i + length > text.size()) {
      return false;
    }
    for (std::size_t j = 1; j < length; ++j) {
      if (!is_continuation(static_cast<unsigned char>(text[i + j]))) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

} // namespace docgate::common::utf8
