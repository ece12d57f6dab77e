#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "nb/common.hpp"

namespace nb::util {

// Source of "now" for components that measure elapsed time
class Clock {
 public:
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual time_point now() const = 0;
};

class SystemClock : public Clock {
 public:
  time_point now() const override { return std::chrono::steady_clock::now(); }
};

struct RateLimiterOptions {
  std::chrono::milliseconds window{60000};
  int max_requests = 30;
};

/**
 * @brief Fixed-window request limiter keyed by operation name
 *
 * Each operation owns a window that opens on its first request and lasts
 * `window`. Within a window at most `max_requests` requests pass; the window
 * resets on the first request after it expires. Safe to share between threads.
 */
class RateLimiter {
 public:
  explicit RateLimiter(std::shared_ptr<const Clock> clock,
                       RateLimiterOptions options = RateLimiterOptions{});

  // Counts one request for `operation`; kRateLimited when the window is full
  Result<void> check(const std::string& operation);

  // Requests still allowed for `operation` in its current window
  int remaining(const std::string& operation) const;

  void reset();

  const RateLimiterOptions& options() const { return options_; }

 private:
  struct Window {
    int count = 0;
    Clock::time_point reset_time;
  };

  std::shared_ptr<const Clock> clock_;
  RateLimiterOptions options_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Window> windows_;
};

}  // namespace nb::util
