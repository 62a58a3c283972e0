#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace docgate::common::utf8 {

/// Largest length <= limit that does not end inside a multi-byte sequence.
[[nodiscard]] std::size_t boundary_at_or_before(std::string_view text, std::size_t limit);

/// Prefix of text no longer than limit bytes, cut on a code point boundary.
[[nodiscard]] std::string safe_prefix(std::string_view text, std::size_t limit);

/// Length in bytes of the sequence introduced by lead, 0 for a continuation byte.
[[nodiscard]] std::size_t sequence_length(unsigned char lead);

[[nodiscard]] bool is_valid(std::string_view text);

} // namespace docgate::common::utf8
