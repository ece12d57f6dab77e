#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "nb/util/rate_limiter.hpp"
#include "test_helpers.hpp"

using namespace nb::util;
using nb::ErrorCode;

namespace {

class ManualClock : public Clock {
 public:
  time_point now() const override { return now_; }
  void advance(std::chrono::milliseconds by) { now_ += by; }

 private:
  time_point now_{};
};

}  // namespace

class RateLimiterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<ManualClock>();
    RateLimiterOptions options;
    options.window = std::chrono::milliseconds(1000);
    options.max_requests = 3;
    limiter_ = std::make_unique<RateLimiter>(clock_, options);
  }

  std::shared_ptr<ManualClock> clock_;
  std::unique_ptr<RateLimiter> limiter_;
};

TEST_F(RateLimiterTest, DefaultsMatchOneMinuteWindow) {
  RateLimiter limiter(std::make_shared<SystemClock>());
  EXPECT_EQ(limiter.options().window, std::chrono::milliseconds(60000));
  EXPECT_EQ(limiter.options().max_requests, 30);
}

TEST_F(RateLimiterTest, AllowsUpToMaxRequestsPerWindow) {
  EXPECT_OK(limiter_->check("create-note"));
  EXPECT_OK(limiter_->check("create-note"));
  EXPECT_OK(limiter_->check("create-note"));
  EXPECT_EQ(limiter_->remaining("create-note"), 0);

  auto denied = limiter_->check("create-note");
  EXPECT_ERROR(denied, ErrorCode::kRateLimited);
  ASSERT_FALSE(denied.has_value());
  EXPECT_EQ(denied.error().message(), "Rate limit exceeded. Please try again later.");
}

TEST_F(RateLimiterTest, OperationsHaveSeparateWindows) {
  for (int i = 0; i < 3; ++i) {
    EXPECT_OK(limiter_->check("search-notes"));
  }
  EXPECT_OK(limiter_->check("delete-note"));
  EXPECT_EQ(limiter_->remaining("delete-note"), 2);
}

TEST_F(RateLimiterTest, WindowResetsAfterExpiry) {
  for (int i = 0; i < 3; ++i) {
    EXPECT_OK(limiter_->check("edit-note"));
  }
  EXPECT_ERROR(limiter_->check("edit-note"), ErrorCode::kRateLimited);

  // Still inside the window at exactly reset time
  clock_->advance(std::chrono::milliseconds(1000));
  EXPECT_ERROR(limiter_->check("edit-note"), ErrorCode::kRateLimited);

  clock_->advance(std::chrono::milliseconds(1));
  EXPECT_OK(limiter_->check("edit-note"));
  EXPECT_EQ(limiter_->remaining("edit-note"), 2);
}

TEST_F(RateLimiterTest, ResetClearsAllWindows) {
  for (int i = 0; i < 3; ++i) {
    EXPECT_OK(limiter_->check("move-note"));
  }
  limiter_->reset();
  EXPECT_OK(limiter_->check("move-note"));
}

TEST_F(RateLimiterTest, ConcurrentChecksNeverExceedLimit) {
  RateLimiterOptions options;
  options.window = std::chrono::milliseconds(1000);
  options.max_requests = 50;
  RateLimiter limiter(clock_, options);

  std::atomic<int> allowed{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 20; ++i) {
        if (limiter.check("list-folders").has_value()) {
          ++allowed;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(allowed.load(), 50);
}
