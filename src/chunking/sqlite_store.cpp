#include "docgate/chunking/sqlite_store.hpp"

#include "docgate/common/json_util.hpp"

#include <system_error>

namespace docgate::chunking {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::int64_t to_millis(const TimePoint point) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

TimePoint from_millis(const std::int64_t millis) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::milliseconds(millis)));
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

Metadata decode_metadata(const std::string &json) {
  Metadata metadata;
  for (auto &[key, value] : common::json_parse_flat(json)) {
    metadata.emplace(key, value);
  }
  return metadata;
}

} // namespace

SqliteContinuationStore::SqliteContinuationStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_status_ = common::Status::error(
        "failed to open continuation database " + db_path_.string() + ": " +
        (db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory"));
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }

  sqlite3_busy_timeout(db_, 5000);
  open_status_ = init_schema();
  if (!open_status_.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteContinuationStore::~SqliteContinuationStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view SqliteContinuationStore::name() const { return "sqlite"; }

common::Status SqliteContinuationStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }

  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS continuations (
  token TEXT PRIMARY KEY,
  remaining_content TEXT NOT NULL,
  metadata TEXT NOT NULL DEFAULT '{}',
  created_at_ms INTEGER NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_continuations_created "
                       "ON continuations(created_at_ms);");
}

common::Status SqliteContinuationStore::insert_locked(const ContinuationRecord &record) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT INTO continuations(token, remaining_content, metadata, created_at_ms) "
                    "VALUES(?1, ?2, ?3, ?4)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  const std::string metadata = common::json_dump_flat(record.metadata);
  sqlite3_bind_text(stmt, 1, record.token.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, record.remaining_content.data(),
                    static_cast<int>(record.remaining_content.size()), SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, metadata.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, to_millis(record.created_at));

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Result<bool> SqliteContinuationStore::delete_locked(const std::string &token) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "DELETE FROM continuations WHERE token = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Status SqliteContinuationStore::put(const ContinuationRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error("database is not initialized");
  }
  return insert_locked(record);
}

common::Result<std::optional<ContinuationRecord>>
SqliteContinuationStore::get(const std::string &token) {
  using GetResult = common::Result<std::optional<ContinuationRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return GetResult::failure("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT token, remaining_content, metadata, created_at_ms "
                    "FROM continuations WHERE token = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return GetResult::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, token.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    ContinuationRecord record;
    record.token = column_text(stmt, 0);
    record.remaining_content = column_text(stmt, 1);
    record.metadata = decode_metadata(column_text(stmt, 2));
    record.created_at = from_millis(sqlite3_column_int64(stmt, 3));
    sqlite3_finalize(stmt);
    return GetResult::success(std::move(record));
  }

  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return GetResult::failure(sqlite3_errmsg(db_));
  }
  return GetResult::success(std::nullopt);
}

common::Result<bool> SqliteContinuationStore::remove(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure("database is not initialized");
  }
  return delete_locked(token);
}

common::Result<bool> SqliteContinuationStore::replace(const std::string &token,
                                                      const ContinuationRecord &successor) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<bool>::failure("database is not initialized");
  }

  // IMMEDIATE takes the write lock up front so other processes sharing the
  // file cannot consume the same token between the delete and the insert.
  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return common::Result<bool>::failure(status.error());
  }

  auto deleted = delete_locked(token);
  if (!deleted.ok() || !deleted.value()) {
    (void)exec_sql(db_, "ROLLBACK;");
    return deleted;
  }

  status = insert_locked(successor);
  if (!status.ok()) {
    (void)exec_sql(db_, "ROLLBACK;");
    return common::Result<bool>::failure(status.error());
  }

  status = exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    (void)exec_sql(db_, "ROLLBACK;");
    return common::Result<bool>::failure(status.error());
  }
  return common::Result<bool>::success(true);
}

common::Result<std::size_t> SqliteContinuationStore::sweep_expired(const std::chrono::seconds ttl,
                                                                   const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure("database is not initialized");
  }
  if (ttl > MAX_TTL) {
    return common::Result<std::size_t>::success(0);
  }

  const std::int64_t cutoff =
      to_millis(now) - std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "DELETE FROM continuations WHERE created_at_ms < ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_int64(stmt, 1, cutoff);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

common::Result<std::size_t> SqliteContinuationStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure("database is not initialized");
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM continuations", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }

  std::size_t total = 0;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<std::size_t>::success(total);
}

StoreStats SqliteContinuationStore::stats() {
  StoreStats stats;
  stats.entry_count = count().value_or(0);
  stats.location = db_path_.string();

  std::error_code ec;
  const auto size = std::filesystem::file_size(db_path_, ec);
  if (!ec) {
    stats.size_bytes = size;
  }
  return stats;
}

bool SqliteContinuationStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr && exec_sql(db_, "SELECT 1;").ok();
}

} // namespace docgate::chunking
