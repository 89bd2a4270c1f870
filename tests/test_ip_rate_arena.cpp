#include "analysis/ip_rate_arena.hpp"

#include <gtest/gtest.h>

TEST(IpRateArenaTest, KeepsSamplesOldestFirst) {
  IpRateArena arena(4, 8);
  arena.record("10.0.0.1", {100, 1, 2});
  arena.record("10.0.0.1", {200, 3, 4});
  auto view = arena.record("10.0.0.1", {300, 5, 6});

  ASSERT_EQ(view.size(), 3u);
  EXPECT_EQ(view.at(0).timestamp_ms, 100u);
  EXPECT_EQ(view.at(2).timestamp_ms, 300u);
  EXPECT_EQ(view.latest().request_bytes, 5u);
  EXPECT_EQ(view.count_since(200), 2u);
}

TEST(IpRateArenaTest, RingOverwritesOldestSample) {
  IpRateArena arena(2, 3);
  IpHistoryView view;
  for (uint64_t t = 1; t <= 5; ++t)
    view = arena.record("10.0.0.1", {t * 10, 0, 0});

  ASSERT_EQ(view.size(), 3u);
  EXPECT_EQ(view.at(0).timestamp_ms, 30u);
  EXPECT_EQ(view.at(1).timestamp_ms, 40u);
  EXPECT_EQ(view.latest().timestamp_ms, 50u);
}

TEST(IpRateArenaTest, EvictsLeastRecentlyUsedIp) {
  IpRateArena arena(2, 4);
  arena.record("10.0.0.1", {1, 0, 0});
  arena.record("10.0.0.2", {2, 0, 0});
  // Touch .1 so .2 becomes the eviction candidate
  arena.record("10.0.0.1", {3, 0, 0});
  arena.record("10.0.0.3", {4, 0, 0});

  EXPECT_EQ(arena.tracked_ips(), 2u);
  EXPECT_EQ(arena.evictions(), 1u);
  EXPECT_TRUE(arena.find("10.0.0.2").empty());
  EXPECT_EQ(arena.find("10.0.0.1").size(), 2u);
  EXPECT_EQ(arena.find("10.0.0.3").size(), 1u);
}

TEST(IpRateArenaTest, ReusedSlotStartsEmpty) {
  IpRateArena arena(1, 4);
  arena.record("10.0.0.1", {1, 0, 0});
  arena.record("10.0.0.1", {2, 0, 0});
  auto view = arena.record("10.0.0.9", {3, 0, 0});
  EXPECT_EQ(view.size(), 1u);
  EXPECT_EQ(view.latest().timestamp_ms, 3u);
}

TEST(IpRateArenaTest, UnknownIpHasEmptyHistory) {
  IpRateArena arena(4, 4);
  auto view = arena.find("192.0.2.1");
  EXPECT_TRUE(view.empty());
  EXPECT_EQ(view.count_since(0), 0u);
}
