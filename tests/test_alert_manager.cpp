#include "core/alert_manager.hpp"
#include "core/event_bus.hpp"
#include "io/alert_dispatch/base_dispatcher.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

class RecordingDispatcher : public IAlertDispatcher {
public:
  explicit RecordingDispatcher(std::shared_ptr<std::vector<std::string>> seen,
                               std::shared_ptr<std::mutex> mutex)
      : seen_(std::move(seen)), mutex_(std::move(mutex)) {}

  bool dispatch(const TunnelDetection &detection) override {
    std::lock_guard<std::mutex> lock(*mutex_);
    seen_->push_back(detection.detection_id);
    return true;
  }
  const char *get_name() const override { return "RecordingDispatcher"; }
  std::string get_dispatcher_type() const override { return "recording"; }

private:
  std::shared_ptr<std::vector<std::string>> seen_;
  std::shared_ptr<std::mutex> mutex_;
};

} // namespace

class AlertManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.stdout_enabled = false;
    config_.throttle_seconds = 300;
    config_.throttle_max_intervening = 10;
  }

  TunnelDetectionPtr make_detection(const std::string &ip, TunnelType type,
                                    uint64_t timestamp_ms) {
    auto detection = std::make_shared<TunnelDetection>();
    detection->detection_id = "det-" + std::to_string(++sequence_);
    detection->entry_id = "log-" + std::to_string(sequence_);
    detection->source_ip = ip;
    detection->timestamp_ms = timestamp_ms;
    detection->tunnel_type = type;
    detection->confidence = Confidence::HIGH;
    detection->risk_score = 75.0;
    return detection;
  }

  Config::AlertingConfig config_;
  Config::EventBusConfig bus_config_;
  int sequence_ = 0;
};

TEST_F(AlertManagerTest, RepeatsForSameIpAndTypeAreThrottled) {
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);

  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.1", TunnelType::HTTP_TUNNEL, 1000)));
  EXPECT_FALSE(manager.record_alert(
      make_detection("10.0.0.1", TunnelType::HTTP_TUNNEL, 2000)));
  EXPECT_EQ(manager.alerts_throttled(), 1u);

  // Another type or another address is a different key
  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.1", TunnelType::BEACONING, 2000)));
  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.2", TunnelType::HTTP_TUNNEL, 2000)));
}

TEST_F(AlertManagerTest, ThrottleWindowExpires) {
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);

  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.1", TunnelType::DNS_TUNNEL, 1000)));
  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.1", TunnelType::DNS_TUNNEL, 1000 + 300 * 1000)));
}

TEST_F(AlertManagerTest, InterveningAlertsLiftTheThrottle) {
  config_.throttle_max_intervening = 2;
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);

  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.1", TunnelType::HTTP_TUNNEL, 1000)));
  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.2", TunnelType::HTTP_TUNNEL, 1100)));
  EXPECT_FALSE(manager.record_alert(
      make_detection("10.0.0.1", TunnelType::HTTP_TUNNEL, 1150)));
  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.3", TunnelType::HTTP_TUNNEL, 1200)));
  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.0.1", TunnelType::HTTP_TUNNEL, 1300)));
}

TEST_F(AlertManagerTest, ExpiredThrottleKeysArePruned) {
  config_.throttle_seconds = 60;
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);

  for (int i = 0; i < 100; ++i)
    manager.record_alert(make_detection("10.0.1." + std::to_string(i),
                                        TunnelType::HTTP_TUNNEL, 1000 + i));
  EXPECT_EQ(manager.throttle_keys(), 100u);

  // One window later only the newest key is still live
  EXPECT_TRUE(manager.record_alert(
      make_detection("10.0.2.1", TunnelType::HTTP_TUNNEL, 1000 + 60 * 1000 + 100)));
  EXPECT_EQ(manager.throttle_keys(), 1u);

  // Throttling of a live key is unaffected
  EXPECT_FALSE(manager.record_alert(
      make_detection("10.0.2.1", TunnelType::HTTP_TUNNEL, 1000 + 60 * 1000 + 200)));
}

TEST_F(AlertManagerTest, QueueDropsOldestWhenDispatchersFallBehind) {
  config_.throttle_seconds = 0;
  config_.max_queued_alerts = 3;
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);

  auto seen = std::make_shared<std::vector<std::string>>();
  auto mutex = std::make_shared<std::mutex>();
  manager.add_dispatcher(std::make_unique<RecordingDispatcher>(seen, mutex));

  // Not started: nothing consumes the queue yet
  for (int i = 0; i < 5; ++i)
    EXPECT_TRUE(manager.record_alert(
        make_detection("10.0.0.1", TunnelType::HTTP_TUNNEL, 1000 + i)));
  EXPECT_EQ(manager.alerts_dropped(), 2u);

  manager.start();
  manager.stop();

  std::lock_guard<std::mutex> lock(*mutex);
  ASSERT_EQ(seen->size(), 3u);
  EXPECT_EQ(seen->front(), "det-3");
  EXPECT_EQ(seen->back(), "det-5");
}

TEST_F(AlertManagerTest, RecentAlertsAreCappedAndNewestFirst) {
  config_.throttle_seconds = 0;
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);

  for (int i = 0; i < 60; ++i)
    manager.record_alert(
        make_detection("10.0.0.1", TunnelType::HTTP_TUNNEL, 1000 + i));

  auto recent = manager.get_recent_alerts(100);
  ASSERT_EQ(recent.size(), 50u);
  EXPECT_EQ(recent.front()->detection_id, "det-60");
  EXPECT_EQ(recent.back()->detection_id, "det-11");
  EXPECT_EQ(manager.get_recent_alerts(5).size(), 5u);
}

TEST_F(AlertManagerTest, NullDetectionIsIgnored) {
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);
  EXPECT_FALSE(manager.record_alert(nullptr));
  EXPECT_TRUE(manager.get_recent_alerts(10).empty());
}

TEST_F(AlertManagerTest, NoDispatchersConfiguredByDefault) {
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);
  manager.configure_dispatchers();
  EXPECT_EQ(manager.dispatcher_count(), 0u);
}

TEST_F(AlertManagerTest, TunnelAlertEventsReachDispatchers) {
  bus_config_.receive_timeout_ms = 50;
  EventBus bus(bus_config_);
  AlertManager manager(config_, bus);

  auto seen = std::make_shared<std::vector<std::string>>();
  auto mutex = std::make_shared<std::mutex>();
  manager.add_dispatcher(std::make_unique<RecordingDispatcher>(seen, mutex));
  manager.start();

  bus.publish(TunnelAlertEvent{
      make_detection("10.0.0.9", TunnelType::WEBSOCKET_COVERT, 5000)});

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    {
      std::lock_guard<std::mutex> lock(*mutex);
      if (!seen->empty())
        break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  manager.stop();

  std::lock_guard<std::mutex> lock(*mutex);
  ASSERT_EQ(seen->size(), 1u);
  EXPECT_EQ(seen->front(), "det-1");
}
