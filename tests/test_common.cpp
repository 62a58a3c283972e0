#include "test_framework.hpp"

#include "docgate/common/fs.hpp"
#include "docgate/common/json_util.hpp"
#include "docgate/common/toml.hpp"
#include "docgate/common/utf8.hpp"

#include <cstdlib>
#include <map>

void register_common_tests(std::vector<docgate::tests::TestCase> &tests) {
  using docgate::tests::require;
  namespace common = docgate::common;
  namespace utf8 = docgate::common::utf8;

  tests.push_back({"fs_trim_and_lower", [] {
                     require(common::trim("  hi \n") == "hi", "trim mismatch");
                     require(common::trim("   ").empty(), "blank should trim to empty");
                     require(common::to_lower("Getting STARTED") == "getting started",
                             "lowercase mismatch");
                     require(common::starts_with("https://x", "https://"), "prefix expected");
                     require(!common::starts_with("http", "https://"), "short value has no prefix");
                   }});

  tests.push_back({"fs_expand_path_env_var", [] {
                     setenv("DOCGATE_TEST_DIR", "/tmp/docgate-x", 1);
                     require(common::expand_path("$DOCGATE_TEST_DIR/db") == "/tmp/docgate-x/db",
                             "plain var expansion failed");
                     require(common::expand_path("${DOCGATE_TEST_DIR}/db") == "/tmp/docgate-x/db",
                             "braced var expansion failed");
                     unsetenv("DOCGATE_TEST_DIR");
                   }});

  tests.push_back({"utf8_boundary_steps_back_mid_codepoint", [] {
                     const std::string text = "ab\xC3\xA9z"; // "abéz"
                     require(utf8::boundary_at_or_before(text, 3) == 2,
                             "limit inside é should step back to 2");
                     require(utf8::boundary_at_or_before(text, 4) == 4, "end of é is a boundary");
                     require(utf8::boundary_at_or_before(text, 99) == text.size(),
                             "limit past end clamps");
                     require(utf8::safe_prefix("\xE2\x82\xAC", 2).empty(),
                             "partial euro sign should be dropped");
                   }});

  tests.push_back({"utf8_four_byte_sequences", [] {
                     const std::string emoji = "x\xF0\x9F\x98\x80y";
                     for (std::size_t limit = 2; limit <= 4; ++limit) {
                       require(utf8::safe_prefix(emoji, limit) == "x",
                               "cut inside emoji should keep only x");
                     }
                     require(utf8::safe_prefix(emoji, 5) == "x\xF0\x9F\x98\x80",
                             "whole emoji should survive");
                   }});

  tests.push_back({"utf8_validity", [] {
                     require(utf8::is_valid("plain ascii"), "ascii is valid");
                     require(utf8::is_valid("caf\xC3\xA9"), "café is valid");
                     require(!utf8::is_valid("caf\xC3"), "truncated sequence is invalid");
                     require(!utf8::is_valid("\x80"), "lone continuation is invalid");
                     require(utf8::sequence_length(0xE2) == 3, "E2 leads 3 bytes");
                     require(utf8::sequence_length(0xA9) == 0, "continuation byte");
                   }});

  tests.push_back({"json_escape_control_characters", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n",
                             "escape mismatch");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control byte should be \\u escaped");
                     require(common::json_unescape("line\\nnext\\u0041") == "line\nnextA",
                             "unescape mismatch");
                   }});

  tests.push_back({"json_flat_map_roundtrip", [] {
                     const std::map<std::string, std::string> values{
                         {"chunk_number", "3"}, {"note", "say \"hi\"\n"}};
                     const auto dumped = common::json_dump_flat(values);
                     const auto parsed = common::json_parse_flat(dumped);
                     require(parsed.size() == 2, "two keys expected");
                     require(parsed.at("chunk_number") == "3", "chunk_number mismatch");
                     require(parsed.at("note") == "say \"hi\"\n", "escaped value mismatch");
                   }});

  tests.push_back({"json_parse_flat_keeps_raw_scalars", [] {
                     const auto parsed =
                         common::json_parse_flat(R"({"n": 42, "ok": true, "nested": {"a": 1}})");
                     require(parsed.at("n") == "42", "number should stay raw");
                     require(parsed.at("ok") == "true", "bool should stay raw");
                     require(parsed.at("nested") == R"({"a": 1})", "object should stay raw");
                     require(common::json_parse_flat("not json").empty(),
                             "garbage should parse to empty map");
                   }});

  tests.push_back({"toml_sections_and_numbers", [] {
                     const auto parsed = common::parse_toml(R"(
# comment
[chunking]
chunk_tokens = 1_500
backend = "memory" # trailing comment
db_path = '~/x.db'

[observability]
backend = "log"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_u64("chunking.chunk_tokens", 0) == 1500,
                             "digit separators should be accepted");
                     require(doc.get_string("chunking.backend") == "memory", "string mismatch");
                     require(doc.get_string("chunking.db_path") == "~/x.db",
                             "literal string mismatch");
                     require(doc.get_string("observability.backend") == "log", "section key");
                     require(!doc.has("backend"), "keys are section-qualified");
                     require(doc.get_u64("chunking.missing", 7) == 7, "fallback expected");
                   }});

  tests.push_back({"toml_rejects_bare_line", [] {
                     const auto parsed = common::parse_toml("[chunking]\nnot a pair\n");
                     require(!parsed.ok(), "line without '=' should fail");
                     require(parsed.error().find("line 2") != std::string::npos,
                             "error should name the line");
                   }});
}
