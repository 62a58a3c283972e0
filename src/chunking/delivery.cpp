#include "docgate/chunking/delivery.hpp"

#include "docgate/common/json_util.hpp"

#include <sstream>

namespace docgate::chunking {

namespace {

void write_value(std::ostringstream &out, const FieldValue &value) {
  if (const auto *text = std::get_if<std::string>(&value)) {
    out << '"' << common::json_escape(*text) << '"';
  } else if (const auto *number = std::get_if<std::int64_t>(&value)) {
    out << *number;
  } else {
    out << (std::get<bool>(value) ? "true" : "false");
  }
}

void write_key(std::ostringstream &out, bool &first, const std::string &key) {
  if (!first) {
    out << ',';
  }
  first = false;
  out << '"' << common::json_escape(key) << "\":";
}

std::string chunking_to_json(const ChunkingInfo &info) {
  std::ostringstream out;
  bool first = true;
  write_key(out, first, "is_chunked");
  out << (info.is_chunked ? "true" : "false");
  if (info.chunk_number.has_value()) {
    write_key(out, first, "chunk_number");
    out << *info.chunk_number;
  }
  if (info.has_more.has_value()) {
    write_key(out, first, "has_more");
    out << (*info.has_more ? "true" : "false");
  }
  if (info.continuation_token.has_value()) {
    write_key(out, first, "continuation_token");
    out << '"' << common::json_escape(*info.continuation_token) << '"';
  }
  if (info.tokens_in_chunk.has_value()) {
    write_key(out, first, "tokens_in_chunk");
    out << *info.tokens_in_chunk;
  }
  if (info.remaining_tokens.has_value()) {
    write_key(out, first, "remaining_tokens");
    out << *info.remaining_tokens;
  }
  return "{" + out.str() + "}";
}

} // namespace

std::string to_json(const ChunkResponse &response) {
  std::ostringstream out;
  out << "{\"content\":\"" << common::json_escape(response.content) << "\"";
  out << ",\"chunk_number\":" << response.chunk_number;
  out << ",\"has_more\":" << (response.has_more ? "true" : "false");
  out << ",\"continuation_token\":";
  if (response.continuation_token.has_value()) {
    out << '"' << common::json_escape(*response.continuation_token) << '"';
  } else {
    out << "null";
  }
  out << ",\"tokens_in_chunk\":" << response.tokens_in_chunk;
  out << ",\"remaining_tokens\":" << response.remaining_tokens << '}';
  return out.str();
}

const FieldValue *DeliveryPayload::find(const std::string_view key) const {
  for (const auto &[name, value] : fields) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

void DeliveryPayload::set(std::string key, FieldValue value) {
  for (auto &[name, existing] : fields) {
    if (name == key) {
      existing = std::move(value);
      return;
    }
  }
  fields.emplace_back(std::move(key), std::move(value));
}

std::string DeliveryResult::to_json() const {
  std::ostringstream out;
  bool first = true;
  for (const auto &[name, value] : payload.fields) {
    if (name == "chunking") {
      continue;
    }
    write_key(out, first, name);
    write_value(out, value);
  }
  write_key(out, first, "chunking");
  out << chunking_to_json(chunking);
  return "{" + out.str() + "}";
}

} // namespace docgate::chunking
