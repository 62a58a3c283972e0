#include "docgate/chunking/memory_store.hpp"

namespace docgate::chunking {

common::Status MemoryContinuationStore::put(const ContinuationRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto [it, inserted] = records_.emplace(record.token, record);
  if (!inserted) {
    return common::Status::error("continuation token already exists: " + record.token);
  }
  return common::Status::success();
}

common::Result<std::optional<ContinuationRecord>>
MemoryContinuationStore::get(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(token);
  if (it == records_.end()) {
    return common::Result<std::optional<ContinuationRecord>>::success(std::nullopt);
  }
  return common::Result<std::optional<ContinuationRecord>>::success(it->second);
}

common::Result<bool> MemoryContinuationStore::remove(const std::string &token) {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::Result<bool>::success(records_.erase(token) > 0);
}

common::Result<bool> MemoryContinuationStore::replace(const std::string &token,
                                                      const ContinuationRecord &successor) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (records_.contains(successor.token)) {
    return common::Result<bool>::failure("continuation token already exists: " + successor.token);
  }
  if (records_.erase(token) == 0) {
    return common::Result<bool>::success(false);
  }
  records_.emplace(successor.token, successor);
  return common::Result<bool>::success(true);
}

common::Result<std::size_t> MemoryContinuationStore::sweep_expired(const std::chrono::seconds ttl,
                                                                   const TimePoint now) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t removed = std::erase_if(
      records_, [&](const auto &entry) { return is_expired(entry.second, ttl, now); });
  return common::Result<std::size_t>::success(removed);
}

common::Result<std::size_t> MemoryContinuationStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::Result<std::size_t>::success(records_.size());
}

StoreStats MemoryContinuationStore::stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  StoreStats stats;
  stats.entry_count = records_.size();
  stats.location = ":memory:";
  for (const auto &[token, record] : records_) {
    stats.size_bytes += token.size() + record.remaining_content.size();
  }
  return stats;
}

} // namespace docgate::chunking
