#include "docgate/chunking/sweeper.hpp"

#include <algorithm>

namespace docgate::chunking {

ContinuationSweeper::ContinuationSweeper(ChunkSequencer &sequencer,
                                         const std::chrono::seconds interval)
    : sequencer_(sequencer), interval_(interval) {}

ContinuationSweeper::~ContinuationSweeper() { stop(); }

void ContinuationSweeper::start() {
  if (running_ || interval_.count() <= 0) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void ContinuationSweeper::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ContinuationSweeper::is_running() const { return running_; }

void ContinuationSweeper::run_loop() {
  while (running_) {
    (void)sequencer_.sweep_expired();
    ++passes_;

    const auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(interval_);
    const auto steps = std::max<long long>(1, wait_ms.count() / 100);
    for (long long i = 0; i < steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

} // namespace docgate::chunking
