#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docgate::tokenizer {

using TokenId = std::uint64_t;

/// Token-counting oracle used to size chunks.
///
/// Implementations must be reversible on slices: decoding any contiguous run
/// of ids produced by encode() yields exactly the text those ids cover.
class ITokenizer {
public:
  virtual ~ITokenizer() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::vector<TokenId> encode(std::string_view text) = 0;
  [[nodiscard]] virtual std::string decode(std::span<const TokenId> tokens) = 0;
  [[nodiscard]] virtual std::size_t count(std::string_view text) { return encode(text).size(); }
};

} // namespace docgate::tokenizer
