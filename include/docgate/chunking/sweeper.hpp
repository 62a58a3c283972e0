#pragma once

#include "docgate/chunking/sequencer.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace docgate::chunking {

/// Background thread that periodically drops expired continuations.
class ContinuationSweeper {
public:
  ContinuationSweeper(ChunkSequencer &sequencer, std::chrono::seconds interval);
  ~ContinuationSweeper();

  ContinuationSweeper(const ContinuationSweeper &) = delete;
  ContinuationSweeper &operator=(const ContinuationSweeper &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint64_t passes() const { return passes_; }

private:
  void run_loop();

  ChunkSequencer &sequencer_;
  std::chrono::seconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> passes_{0};
};

} // namespace docgate::chunking
