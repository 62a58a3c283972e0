#pragma once

#include "docgate/chunking/continuation.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace docgate::chunking {

class SqliteContinuationStore final : public IContinuationStore {
public:
  explicit SqliteContinuationStore(std::filesystem::path db_path);
  ~SqliteContinuationStore() override;

  SqliteContinuationStore(const SqliteContinuationStore &) = delete;
  SqliteContinuationStore &operator=(const SqliteContinuationStore &) = delete;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Status put(const ContinuationRecord &record) override;
  [[nodiscard]] common::Result<std::optional<ContinuationRecord>>
  get(const std::string &token) override;
  [[nodiscard]] common::Result<bool> remove(const std::string &token) override;
  [[nodiscard]] common::Result<bool> replace(const std::string &token,
                                             const ContinuationRecord &successor) override;
  [[nodiscard]] common::Result<std::size_t> sweep_expired(std::chrono::seconds ttl,
                                                          TimePoint now) override;
  [[nodiscard]] common::Result<std::size_t> count() override;
  [[nodiscard]] StoreStats stats() override;
  [[nodiscard]] bool health_check() override;

  /// Outcome of opening the database and creating the schema.
  [[nodiscard]] const common::Status &open_status() const { return open_status_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status insert_locked(const ContinuationRecord &record);
  [[nodiscard]] common::Result<bool> delete_locked(const std::string &token);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  common::Status open_status_ = common::Status::success();
};

} // namespace docgate::chunking
