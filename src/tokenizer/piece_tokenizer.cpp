#include "docgate/tokenizer/piece_tokenizer.hpp"

#include "docgate/common/utf8.hpp"

#include <algorithm>

namespace docgate::tokenizer {

namespace {

enum class CharClass {
  Letter,
  Digit,
  Newline,
  Space,
  Other,
};

CharClass classify(const unsigned char byte) {
  if (byte >= 0x80U || (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') ||
      byte == '_') {
    return CharClass::Letter;
  }
  if (byte >= '0' && byte <= '9') {
    return CharClass::Digit;
  }
  if (byte == '\n' || byte == '\r') {
    return CharClass::Newline;
  }
  if (byte == ' ' || byte == '\t' || byte == '\v' || byte == '\f') {
    return CharClass::Space;
  }
  return CharClass::Other;
}

CharClass class_at(const std::string_view text, const std::size_t pos) {
  return classify(static_cast<unsigned char>(text[pos]));
}

std::size_t run_end(const std::string_view text, std::size_t pos, const CharClass cls) {
  while (pos < text.size() && class_at(text, pos) == cls) {
    ++pos;
  }
  return pos;
}

// Length of the next pre-token starting at `pos`.
std::size_t next_piece_length(const std::string_view text, const std::size_t pos) {
  const CharClass cls = class_at(text, pos);
  const bool next_is_letter = pos + 1 < text.size() && class_at(text, pos + 1) == CharClass::Letter;

  switch (cls) {
  case CharClass::Letter:
    return run_end(text, pos, CharClass::Letter) - pos;
  case CharClass::Digit: {
    const std::size_t end = run_end(text, pos, CharClass::Digit);
    return std::min<std::size_t>(end - pos, 3);
  }
  case CharClass::Newline:
    return run_end(text, pos, CharClass::Newline) - pos;
  case CharClass::Space: {
    if (text[pos] == ' ' && next_is_letter) {
      return run_end(text, pos + 1, CharClass::Letter) - pos;
    }
    const std::size_t end = run_end(text, pos, CharClass::Space);
    // Leave a final space to lead the following word.
    if (end - pos > 1 && end < text.size() && text[end - 1] == ' ' &&
        class_at(text, end) == CharClass::Letter) {
      return end - pos - 1;
    }
    return end - pos;
  }
  case CharClass::Other:
    return run_end(text, pos, CharClass::Other) - pos;
  }
  return 1;
}

} // namespace

std::vector<std::string_view> PieceTokenizer::split(const std::string_view text) {
  std::vector<std::string_view> pieces;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t length = next_piece_length(text, pos);
    std::string_view piece = text.substr(pos, length);
    while (piece.size() > MAX_PIECE_BYTES) {
      std::size_t cut = common::utf8::boundary_at_or_before(piece, MAX_PIECE_BYTES);
      if (cut == 0) {
        cut = MAX_PIECE_BYTES;
      }
      pieces.push_back(piece.substr(0, cut));
      piece.remove_prefix(cut);
    }
    if (!piece.empty()) {
      pieces.push_back(piece);
    }
    pos += length;
  }
  return pieces;
}

TokenId PieceTokenizer::piece_id(const std::string_view piece) {
  TokenId id = static_cast<TokenId>(piece.size()) << LENGTH_SHIFT;
  for (std::size_t i = 0; i < piece.size(); ++i) {
    id |= static_cast<TokenId>(static_cast<unsigned char>(piece[i])) << (8 * i);
  }
  return id;
}

void PieceTokenizer::append_piece(const TokenId id, std::string &out) {
  const auto length = static_cast<std::size_t>(id >> LENGTH_SHIFT);
  if (length == 0 || length > MAX_PIECE_BYTES) {
    return;
  }
  for (std::size_t i = 0; i < length; ++i) {
    out.push_back(static_cast<char>((id >> (8 * i)) & 0xFFU));
  }
}

std::vector<TokenId> PieceTokenizer::encode(const std::string_view text) {
  const auto pieces = split(text);
  std::vector<TokenId> ids;
  ids.reserve(pieces.size());
  for (const auto piece : pieces) {
    ids.push_back(piece_id(piece));
  }
  return ids;
}

std::string PieceTokenizer::decode(const std::span<const TokenId> tokens) {
  std::string out;
  for (const TokenId id : tokens) {
    append_piece(id, out);
  }
  return out;
}

std::size_t PieceTokenizer::count(const std::string_view text) { return split(text).size(); }

} // namespace docgate::tokenizer
