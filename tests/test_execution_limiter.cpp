#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include "ffmpeg_mcp/execution_limiter.hpp"

using namespace ffmpeg_mcp;
using namespace std::chrono_literals;

TEST(ExecutionLimiter, TryAcquireStopsAtCapacity) {
  ExecutionLimiter limiter(2);
  auto a = limiter.try_acquire();
  auto b = limiter.try_acquire();
  auto c = limiter.try_acquire();
  EXPECT_TRUE(a.held());
  EXPECT_TRUE(b.held());
  EXPECT_FALSE(c.held());
  EXPECT_EQ(limiter.in_flight(), 2);

  a.release();
  EXPECT_EQ(limiter.in_flight(), 1);
  EXPECT_TRUE(limiter.try_acquire().held());
}

TEST(ExecutionLimiter, PermitReleasesOnScopeExit) {
  ExecutionLimiter limiter(1);
  {
    auto permit = limiter.acquire();
    EXPECT_EQ(limiter.in_flight(), 1);
  }
  EXPECT_EQ(limiter.in_flight(), 0);
}

TEST(ExecutionLimiter, ReleaseTwiceIsHarmless) {
  ExecutionLimiter limiter(1);
  auto permit = limiter.acquire();
  permit.release();
  permit.release();
  EXPECT_FALSE(permit.held());
  EXPECT_EQ(limiter.in_flight(), 0);
}

TEST(ExecutionLimiter, MoveTransfersOwnership) {
  ExecutionLimiter limiter(1);
  auto first = limiter.acquire();
  auto second = std::move(first);
  EXPECT_FALSE(first.held());
  EXPECT_TRUE(second.held());
  EXPECT_EQ(limiter.in_flight(), 1);

  ExecutionLimiter::Permit third;
  third = std::move(second);
  EXPECT_EQ(limiter.in_flight(), 1);
  third.release();
  EXPECT_EQ(limiter.in_flight(), 0);
}

TEST(ExecutionLimiter, ZeroAndNegativeMeanUnlimited) {
  for (int capacity : {0, -5}) {
    ExecutionLimiter limiter(capacity);
    EXPECT_TRUE(limiter.unlimited());
    std::vector<ExecutionLimiter::Permit> permits;
    for (int i = 0; i < 100; ++i)
      permits.push_back(limiter.try_acquire());
    for (const auto &p : permits)
      EXPECT_TRUE(p.held());
    EXPECT_EQ(limiter.in_flight(), 100);
  }
}

TEST(ExecutionLimiter, AcquireBlocksUntilSlotFrees) {
  ExecutionLimiter limiter(1);
  auto held = limiter.acquire();

  std::atomic<bool> acquired{false};
  std::thread waiter([&]() {
    auto permit = limiter.acquire();
    acquired = true;
  });

  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(acquired.load());

  held.release();
  waiter.join();
  EXPECT_TRUE(acquired.load());
  EXPECT_EQ(limiter.in_flight(), 0);
}

TEST(ExecutionLimiter, NeverExceedsCapacityUnderContention) {
  ExecutionLimiter limiter(3);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  std::vector<std::thread> workers;
  for (int i = 0; i < 12; ++i) {
    workers.emplace_back([&]() {
      auto permit = limiter.acquire();
      int now = ++running;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(10ms);
      --running;
    });
  }
  for (auto &t : workers)
    t.join();

  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
  EXPECT_EQ(limiter.in_flight(), 0);
}
