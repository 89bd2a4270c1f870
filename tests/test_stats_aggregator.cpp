#include "analysis/stats_aggregator.hpp"
#include "core/config.hpp"
#include "core/event_bus.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <numeric>
#include <string>
#include <thread>

class StatsAggregatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    stats_config_.window_seconds = 60;
    stats_config_.max_window_entries = 1000;
    stats_config_.top_ips_limit = 2;
    bus_ = std::make_unique<EventBus>(bus_config_);
  }

  std::unique_ptr<StatsAggregator> make_aggregator() {
    return std::make_unique<StatsAggregator>(stats_config_, *bus_,
                                             [this] { return now_ms_; });
  }

  void publish_log(const std::string &id, const std::string &ip, int status,
                   uint64_t response_time_ms, bool detected = false,
                   bool denied = false) {
    auto entry = std::make_shared<LogEntry>();
    entry->id = id;
    entry->source_ip = ip;
    entry->response_status = status;
    entry->response_time_ms = response_time_ms;

    LogEvent event;
    event.entry = entry;
    if (denied) {
      BlockRule rule;
      rule.id = "rule-1";
      event.decision = BlockDecision::deny(rule);
    }
    if (detected)
      event.detection = std::make_shared<TunnelDetection>();
    bus_->publish(event);
  }

  Config::EventBusConfig bus_config_;
  Config::StatsConfig stats_config_;
  std::unique_ptr<EventBus> bus_;
  uint64_t now_ms_ = 1000000;
};

TEST_F(StatsAggregatorTest, CountsStatusesDetectionsAndDenials) {
  auto stats = make_aggregator();
  publish_log("a", "10.0.0.1", 200, 10);
  publish_log("b", "10.0.0.1", 200, 20);
  publish_log("c", "10.0.0.2", 404, 30, true);
  publish_log("d", "10.0.0.3", 403, 40, false, true);

  EXPECT_EQ(stats->process_pending(), 4u);
  auto snap = stats->snapshot();

  EXPECT_EQ(snap.total_requests, 4u);
  EXPECT_EQ(snap.tunnel_detections, 1u);
  EXPECT_EQ(snap.denied_requests, 1u);
  EXPECT_DOUBLE_EQ(snap.average_response_time_ms, 25.0);
  EXPECT_EQ(snap.status_counts[200], 2u);
  EXPECT_EQ(snap.status_counts[404], 1u);
  EXPECT_EQ(snap.status_counts[403], 1u);
}

TEST_F(StatsAggregatorTest, StatusCountsSumToTotal) {
  auto stats = make_aggregator();
  const int statuses[] = {200, 201, 301, 404, 500, 200, 502, 200};
  int n = 0;
  for (int status : statuses)
    publish_log("r" + std::to_string(n++), "10.0.0.9", status, 5);
  stats->process_pending();

  auto snap = stats->snapshot();
  uint64_t sum = 0;
  for (const auto &[status, count] : snap.status_counts)
    sum += count;
  EXPECT_EQ(sum, snap.total_requests);
  EXPECT_EQ(snap.total_requests, 8u);
}

TEST_F(StatsAggregatorTest, DuplicateEntryIdsCountOnce) {
  auto stats = make_aggregator();
  publish_log("same", "10.0.0.1", 200, 10);
  publish_log("same", "10.0.0.1", 200, 10);

  EXPECT_EQ(stats->process_pending(), 1u);
  EXPECT_EQ(stats->snapshot().total_requests, 1u);
}

TEST_F(StatsAggregatorTest, TopIpsSortedAndLimited) {
  auto stats = make_aggregator();
  int n = 0;
  for (int i = 0; i < 3; ++i)
    publish_log("x" + std::to_string(n++), "10.0.0.3", 200, 1);
  for (int i = 0; i < 3; ++i)
    publish_log("x" + std::to_string(n++), "10.0.0.2", 200, 1);
  publish_log("x" + std::to_string(n++), "10.0.0.1", 200, 1);
  stats->process_pending();

  auto snap = stats->snapshot();
  ASSERT_EQ(snap.top_ips.size(), 2u);
  // Equal counts fall back to address order
  EXPECT_EQ(snap.top_ips[0].ip, "10.0.0.2");
  EXPECT_EQ(snap.top_ips[1].ip, "10.0.0.3");
  EXPECT_EQ(snap.top_ips[0].count, 3u);
}

TEST_F(StatsAggregatorTest, OldEntriesLeaveTheWindow) {
  auto stats = make_aggregator();
  publish_log("old", "10.0.0.1", 200, 10);
  stats->process_pending();

  now_ms_ += 61000;
  publish_log("new", "10.0.0.2", 500, 10);
  stats->process_pending();

  auto snap = stats->snapshot();
  EXPECT_EQ(snap.total_requests, 1u);
  EXPECT_EQ(snap.status_counts.count(200), 0u);

  // Once evicted the id may be counted again
  publish_log("old", "10.0.0.1", 200, 10);
  EXPECT_EQ(stats->process_pending(), 1u);
}

TEST_F(StatsAggregatorTest, CountBoundEvictsOldest) {
  stats_config_.max_window_entries = 3;
  auto stats = make_aggregator();
  for (int i = 0; i < 5; ++i)
    publish_log("c" + std::to_string(i), "10.0.0.1", 200, 1);
  stats->process_pending();
  EXPECT_EQ(stats->window_size(), 3u);
}

TEST_F(StatsAggregatorTest, IgnoresNonLogEvents) {
  auto stats = make_aggregator();
  bus_->publish(StatsUpdateEvent{});
  BlockRule rule;
  bus_->publish(BlockAddedEvent{rule});
  EXPECT_EQ(stats->process_pending(), 0u);
  EXPECT_EQ(stats->snapshot().total_requests, 0u);
}

TEST_F(StatsAggregatorTest, PublisherThreadEmitsStatsUpdates) {
  stats_config_.publish_interval_ms = 100;
  auto stats = make_aggregator();
  auto listener = bus_->subscribe();

  stats->start();
  publish_log("p1", "10.0.0.1", 200, 10);

  bool saw_update = false;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!saw_update && std::chrono::steady_clock::now() < deadline) {
    auto event = listener->receive(std::chrono::milliseconds(200));
    if (event && std::holds_alternative<StatsUpdateEvent>(**event))
      saw_update = true;
  }
  stats->stop();
  EXPECT_TRUE(saw_update);
}
