#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "docgate/common/utf8.hpp"
#include "docgate/tokenizer/piece_tokenizer.hpp"

#include <atomic>
#include <thread>

void register_tokenizer_tests(std::vector<docgate::tests::TestCase> &tests) {
  using docgate::tests::require;
  using docgate::tokenizer::PieceTokenizer;

  tests.push_back({"piece_split_words_and_spaces", [] {
                     const auto pieces = PieceTokenizer::split("Hello world  again");
                     const std::vector<std::string_view> expected{"Hello", " world", " ", " again"};
                     require(pieces == expected, "word pieces mismatch");
                   }});

  tests.push_back({"piece_split_digits_and_punctuation", [] {
                     const auto pieces = PieceTokenizer::split("v12345!!\n\nx");
                     const std::vector<std::string_view> expected{"v", "123", "45", "!!", "\n\n", "x"};
                     require(pieces == expected, "digit grouping mismatch");
                   }});

  tests.push_back({"piece_split_caps_long_runs_on_codepoints", [] {
                     const std::string word = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"; // 10 bytes
                     const auto pieces = PieceTokenizer::split(word);
                     require(pieces.size() == 2, "10-byte word should split in two");
                     require(pieces[0].size() == 6 && pieces[1].size() == 4,
                             "cut at the last boundary within 7 bytes");
                     for (const auto piece : pieces) {
                       require(docgate::common::utf8::is_valid(piece), "piece splits a codepoint");
                     }

                     const std::string cjk = "\xE4\xB8\xAD\xE6\x96\x87\xE4\xB8\xAD"; // 9 bytes
                     const auto cjk_pieces = PieceTokenizer::split(cjk);
                     require(cjk_pieces.size() == 2 && cjk_pieces[0].size() == 6 &&
                                 cjk_pieces[1].size() == 3,
                             "three-byte chars should not straddle the cap");
                   }});

  tests.push_back({"piece_roundtrip_and_slices", [] {
                     PieceTokenizer tokenizer;
                     const std::string text =
                         "# Title\n\nSome text, with 2024 numbers and caf\xC3\xA9 \xF0\x9F\x98\x80.\n";
                     const auto ids = tokenizer.encode(text);
                     require(tokenizer.decode(ids) == text, "decode(encode(t)) must equal t");
                     require(tokenizer.count(text) == ids.size(), "count matches encode");

                     const std::span<const docgate::tokenizer::TokenId> all(ids);
                     for (std::size_t cut = 0; cut <= ids.size(); ++cut) {
                       const auto head = tokenizer.decode(all.first(cut));
                       const auto tail = tokenizer.decode(all.subspan(cut));
                       require(head + tail == text, "slices must concatenate to the source");
                       require(docgate::common::utf8::is_valid(head), "slice splits a codepoint");
                     }
                   }});

  tests.push_back({"piece_word_run_token_count", [] {
                     PieceTokenizer tokenizer;
                     require(tokenizer.count(docgate::testing::word_run(5000)) == 5000,
                             "word_run(n) should be n tokens");
                     require(tokenizer.count("") == 0, "empty text has no tokens");
                   }});

  tests.push_back({"piece_ids_need_no_vocabulary", [] {
                     PieceTokenizer writer;
                     PieceTokenizer reader;
                     std::string text;
                     for (int i = 0; i < 20000; ++i) {
                       text += ' ';
                       text += std::to_string(i * 7919);
                       text += "w";
                       text += static_cast<char>('a' + i % 26);
                       text += static_cast<char>('a' + (i / 26) % 26);
                     }
                     const auto ids = writer.encode(text);
                     require(reader.decode(ids) == text, "any instance decodes any id");
                     require(PieceTokenizer::piece_id("a") !=
                                 PieceTokenizer::piece_id(std::string_view("a\0", 2)),
                             "length is part of the id");
                     require(reader.decode(std::vector<docgate::tokenizer::TokenId>{0}).empty(),
                             "an empty id decodes to nothing");
                   }});

  tests.push_back({"piece_encode_is_safe_across_threads", [] {
                     PieceTokenizer tokenizer;
                     const std::string text = "alpha beta gamma delta";
                     const auto expected = tokenizer.encode(text);
                     std::atomic<int> mismatches{0};

                     std::vector<std::thread> workers;
                     for (int i = 0; i < 4; ++i) {
                       workers.emplace_back([&] {
                         for (int round = 0; round < 50; ++round) {
                           if (tokenizer.encode(text) != expected ||
                               tokenizer.decode(expected) != text) {
                             ++mismatches;
                           }
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(mismatches == 0, "concurrent encode and decode agree");
                   }});
}
