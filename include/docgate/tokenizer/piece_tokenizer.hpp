#pragma once

#include "docgate/tokenizer/tokenizer.hpp"

namespace docgate::tokenizer {

/// Pre-tokenizing tokenizer whose ids carry their own bytes.
///
/// Text is split into word pieces (letters with an optional leading space),
/// digit groups of up to three, punctuation runs, whitespace runs and newline
/// runs; pieces longer than MAX_PIECE_BYTES are split on code point
/// boundaries. An id packs the piece length into its top byte and the piece
/// bytes below it, so encoding and decoding keep no vocabulary and any
/// instance decodes ids produced by any other.
class PieceTokenizer final : public ITokenizer {
public:
  static constexpr std::size_t MAX_PIECE_BYTES = 7;

  [[nodiscard]] std::string_view name() const override { return "piece"; }
  [[nodiscard]] std::vector<TokenId> encode(std::string_view text) override;
  [[nodiscard]] std::string decode(std::span<const TokenId> tokens) override;
  [[nodiscard]] std::size_t count(std::string_view text) override;

  /// Piece boundaries of `text`.
  [[nodiscard]] static std::vector<std::string_view> split(std::string_view text);

  [[nodiscard]] static TokenId piece_id(std::string_view piece);

private:
  static constexpr unsigned LENGTH_SHIFT = 56;

  static void append_piece(TokenId id, std::string &out);
};

} // namespace docgate::tokenizer
