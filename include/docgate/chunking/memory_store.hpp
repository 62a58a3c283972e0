#pragma once

#include "docgate/chunking/continuation.hpp"

#include <mutex>
#include <unordered_map>

namespace docgate::chunking {

/// Process-local store; records do not survive a restart.
class MemoryContinuationStore final : public IContinuationStore {
public:
  [[nodiscard]] std::string_view name() const override { return "memory"; }
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
  [[nodiscard]] bool health_check() override { return true; }

private:
  std::mutex mutex_;
  std::unordered_map<std::string, ContinuationRecord> records_;
};

} // namespace docgate::chunking
