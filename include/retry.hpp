#pragma once
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <thread>

// Exponential backoff: attempt n (1-based) waits base_delay * 2^(n-2) before
// running, capped at max_delay. The first attempt never waits.
struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{30000};

  std::chrono::milliseconds delay_before(int attempt) const;

  // Runs op until it succeeds, should_retry says no, or attempts run out.
  // The last exception is rethrown unchanged.
  template <typename Op>
  auto execute_with_retry(Op&& op,
                          const std::function<bool(const std::exception&)>& should_retry,
                          const std::function<void(std::chrono::milliseconds)>& sleep = {}) const
      -> decltype(op()) {
    for (int attempt = 1;; ++attempt) {
      if (attempt > 1) {
        auto d = delay_before(attempt);
        spdlog::debug("retry attempt {}/{} after {} ms", attempt, max_attempts, d.count());
        if (sleep) sleep(d);
        else std::this_thread::sleep_for(d);
      }
      try {
        return op();
      } catch (const std::exception& e) {
        if (attempt >= max_attempts || !should_retry(e)) throw;
        spdlog::warn("attempt {}/{} failed: {}", attempt, max_attempts, e.what());
      }
    }
  }
};
