#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "docgate/chunking/continuation.hpp"
#include "docgate/chunking/memory_store.hpp"
#include "docgate/chunking/sqlite_store.hpp"

#include <atomic>
#include <regex>
#include <set>
#include <thread>

namespace {

namespace chunking = docgate::chunking;
using docgate::tests::require;

using StoreTest = std::function<void(chunking::IContinuationStore &)>;

const chunking::TimePoint BASE_TIME{std::chrono::milliseconds(1'700'000'000'123)};

chunking::ContinuationRecord make_record(std::string token, std::string content,
                                         const chunking::TimePoint created_at = BASE_TIME) {
  chunking::ContinuationRecord record;
  record.token = std::move(token);
  record.remaining_content = std::move(content);
  record.metadata = {{"chunk_number", "1"}, {"total_tokens", "5000"}};
  record.created_at = created_at;
  return record;
}

// Runs `body` against a fresh store of each backend.
void for_each_backend(const StoreTest &body) {
  {
    chunking::MemoryContinuationStore store;
    body(store);
  }
  {
    docgate::testing::TempWorkspace workspace;
    chunking::SqliteContinuationStore store(workspace.path() / "continuations.db");
    require(store.open_status().ok(), store.open_status().error());
    body(store);
  }
}

} // namespace

void register_continuation_store_tests(std::vector<docgate::tests::TestCase> &tests) {
  tests.push_back({"generate_token_is_uuid_v4", [] {
                     static const std::regex uuid_pattern(
                         "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
                     std::set<std::string> seen;
                     for (int i = 0; i < 200; ++i) {
                       const auto token = chunking::generate_token();
                       require(token.ok(), token.error());
                       require(std::regex_match(token.value(), uuid_pattern),
                               "not a v4 uuid: " + token.value());
                       seen.insert(token.value());
                     }
                     require(seen.size() == 200, "tokens must not repeat");
                   }});

  tests.push_back({"chunk_number_defaults_to_one", [] {
                     require(chunking::chunk_number_of({}) == 1, "missing key");
                     require(chunking::chunk_number_of({{"chunk_number", "4"}}) == 4, "parsed");
                     require(chunking::chunk_number_of({{"chunk_number", "x"}}) == 1, "garbage");
                     require(chunking::chunk_number_of({{"chunk_number", "0"}}) == 1, "zero");
                   }});

  tests.push_back({"is_expired_is_strict", [] {
                     const auto record = make_record("t", "x");
                     const std::chrono::seconds ttl{600};
                     require(!chunking::is_expired(record, ttl, BASE_TIME + ttl),
                             "exactly ttl old is still live");
                     require(chunking::is_expired(record, ttl,
                                                  BASE_TIME + ttl + std::chrono::milliseconds(1)),
                             "older than ttl is expired");
                   }});

  tests.push_back({"store_put_get_roundtrip", [] {
                     for_each_backend([](chunking::IContinuationStore &store) {
                       const std::string content = "line \"one\"\n\tcaf\xC3\xA9 \xF0\x9F\x98\x80 {}";
                       require(store.put(make_record("tok-1", content)).ok(), "put failed");

                       const auto loaded = store.get("tok-1");
                       require(loaded.ok(), loaded.error());
                       require(loaded.value().has_value(), "record should exist");
                       const auto &record = *loaded.value();
                       require(record.remaining_content == content, "content mismatch");
                       require(record.metadata.at("chunk_number") == "1", "metadata mismatch");
                       require(record.metadata.at("total_tokens") == "5000", "metadata mismatch");
                       require(record.created_at == BASE_TIME, "timestamp mismatch");

                       const auto missing = store.get("nope");
                       require(missing.ok() && !missing.value().has_value(), "miss expected");
                       require(store.health_check(), std::string(store.name()) + " unhealthy");
                     });
                   }});

  tests.push_back({"store_rejects_duplicate_token", [] {
                     for_each_backend([](chunking::IContinuationStore &store) {
                       require(store.put(make_record("dup", "a")).ok(), "first put");
                       require(!store.put(make_record("dup", "b")).ok(),
                               std::string(store.name()) + " accepted a duplicate");
                       require(store.get("dup").value()->remaining_content == "a",
                               "original must survive");
                     });
                   }});

  tests.push_back({"store_remove_consumes_once", [] {
                     for_each_backend([](chunking::IContinuationStore &store) {
                       require(store.put(make_record("gone", "x")).ok(), "put");
                       const auto first = store.remove("gone");
                       require(first.ok() && first.value(), "first remove should succeed");
                       const auto second = store.remove("gone");
                       require(second.ok() && !second.value(), "second remove finds nothing");
                     });
                   }});

  tests.push_back({"store_replace_swaps_records", [] {
                     for_each_backend([](chunking::IContinuationStore &store) {
                       require(store.put(make_record("old", "abc")).ok(), "put");
                       const auto replaced = store.replace("old", make_record("new", "bc"));
                       require(replaced.ok() && replaced.value(), "replace should succeed");
                       require(!store.get("old").value().has_value(), "old token must be gone");
                       require(store.get("new").value()->remaining_content == "bc", "successor");

                       const auto again = store.replace("old", make_record("newer", "c"));
                       require(again.ok() && !again.value(), "consumed token cannot be replaced");
                       require(!store.get("newer").value().has_value(),
                               "failed replace must not insert");
                       require(store.count().value() == 1, "exactly one record");
                     });
                   }});

  tests.push_back({"store_sweep_removes_only_expired", [] {
                     for_each_backend([](chunking::IContinuationStore &store) {
                       const std::chrono::seconds ttl{600};
                       require(store.put(make_record("stale", "x", BASE_TIME - std::chrono::seconds(700)))
                                   .ok(),
                               "put stale");
                       require(store.put(make_record("fresh", "y", BASE_TIME - std::chrono::seconds(10)))
                                   .ok(),
                               "put fresh");
                       const auto removed = store.sweep_expired(ttl, BASE_TIME);
                       require(removed.ok(), removed.error());
                       require(removed.value() == 1, std::string(store.name()) + " sweep count");
                       require(store.get("fresh").value().has_value(), "fresh survives");
                       require(!store.get("stale").value().has_value(), "stale removed");

                       const auto stats = store.stats();
                       require(stats.entry_count == 1, "stats entry count");
                       require(!stats.location.empty(), "stats location");
                     });
                   }});

  tests.push_back({"store_sweep_with_huge_ttl_keeps_everything", [] {
                     for_each_backend([](chunking::IContinuationStore &store) {
                       require(store.put(make_record("old", "x", chunking::TimePoint{})).ok(),
                               "put old");
                       const auto removed =
                           store.sweep_expired(std::chrono::seconds(10'000'000'000LL), BASE_TIME);
                       require(removed.ok(), removed.error());
                       require(removed.value() == 0, std::string(store.name()) + " kept record");
                       require(store.count().value() == 1, "record survives");
                     });
                   }});

  tests.push_back({"store_concurrent_replace_single_winner", [] {
                     for_each_backend([](chunking::IContinuationStore &store) {
                       require(store.put(make_record("contested", "payload")).ok(), "put");

                       std::atomic<int> winners{0};
                       std::atomic<int> errors{0};
                       std::vector<std::thread> workers;
                       for (int i = 0; i < 8; ++i) {
                         workers.emplace_back([&store, &winners, &errors, i] {
                           const auto result = store.replace(
                               "contested", make_record("successor-" + std::to_string(i), "rest"));
                           if (!result.ok()) {
                             ++errors;
                           } else if (result.value()) {
                             ++winners;
                           }
                         });
                       }
                       for (auto &worker : workers) {
                         worker.join();
                       }
                       require(errors == 0, "replace should not error");
                       require(winners == 1, "exactly one replace may win");
                       require(store.count().value() == 1, "one successor only");
                     });
                   }});

  tests.push_back({"sqlite_store_persists_across_reopen", [] {
                     docgate::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "nested" / "chunks.db";
                     {
                       chunking::SqliteContinuationStore store(path);
                       require(store.open_status().ok(), store.open_status().error());
                       require(store.put(make_record("keep", "remainder")).ok(), "put");
                     }
                     chunking::SqliteContinuationStore reopened(path);
                     require(reopened.open_status().ok(), reopened.open_status().error());
                     const auto loaded = reopened.get("keep");
                     require(loaded.ok() && loaded.value().has_value(), "record should persist");
                     require(loaded.value()->remaining_content == "remainder", "content persisted");
                     require(reopened.stats().size_bytes > 0, "database file has size");
                     require(reopened.stats().location == path.string(), "location is the path");
                   }});

  tests.push_back({"sqlite_store_reports_open_failure", [] {
                     docgate::testing::TempWorkspace workspace;
                     workspace.create_file("blocker", "not a directory");
                     chunking::SqliteContinuationStore store(workspace.path() / "blocker" / "x.db");
                     require(!store.open_status().ok(), "open under a file should fail");
                     require(!store.health_check(), "broken store is unhealthy");
                     require(!store.put(make_record("t", "x")).ok(), "writes fail");
                     require(!store.get("t").ok(), "reads fail");
                   }});

  tests.push_back({"create_store_from_config", [] {
                     docgate::testing::TempWorkspace workspace;
                     auto config = docgate::testing::temp_config(workspace);
                     auto sqlite = chunking::create_continuation_store(config);
                     require(sqlite.ok(), sqlite.error());
                     require(sqlite.value()->name() == "sqlite", "sqlite backend");
                     require(std::filesystem::exists(workspace.path() / "chunking.db"),
                             "database file created");

                     config.chunking.backend = "Memory";
                     auto memory = chunking::create_continuation_store(config);
                     require(memory.ok() && memory.value()->name() == "memory", "memory backend");

                     config.chunking.backend = "redis";
                     require(!chunking::create_continuation_store(config).ok(),
                             "unknown backend fails");
                   }});
}
