#include "nb/util/rate_limiter.hpp"

#include <spdlog/spdlog.h>

namespace nb::util {

RateLimiter::RateLimiter(std::shared_ptr<const Clock> clock, RateLimiterOptions options)
    : clock_(std::move(clock)), options_(options) {
  if (!clock_) {
    clock_ = std::make_shared<SystemClock>();
  }
}

Result<void> RateLimiter::check(const std::string& operation) {
  auto now = clock_->now();
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = windows_.find(operation);
  if (it == windows_.end() || now > it->second.reset_time) {
    windows_[operation] = Window{1, now + options_.window};
    return {};
  }

  if (it->second.count >= options_.max_requests) {
    spdlog::warn("Rate limit reached for {} ({} requests per {} ms)", operation,
                 options_.max_requests, options_.window.count());
    return std::unexpected(makeError(ErrorCode::kRateLimited,
                                     "Rate limit exceeded. Please try again later."));
  }

  ++it->second.count;
  return {};
}

int RateLimiter::remaining(const std::string& operation) const {
  auto now = clock_->now();
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = windows_.find(operation);
  if (it == windows_.end() || now > it->second.reset_time) {
    return options_.max_requests;
  }
  return options_.max_requests > it->second.count ? options_.max_requests - it->second.count : 0;
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  windows_.clear();
}

}  // namespace nb::util
