#include "core/errors.hpp"
#include "io/stream/connection_manager.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

// Scripted stream shared between the test and the transport it hands over
struct FakeStream {
  std::mutex mutex;
  std::deque<bool> connect_results; // empty means succeed
  bool fail_all_connects = false;
  std::deque<std::string> lines;
  bool end_when_drained = false;
  std::vector<std::string> sent;
  int connects = 0;
  int closes = 0;
};

class FakeTransport : public IStreamTransport {
public:
  explicit FakeTransport(std::shared_ptr<FakeStream> stream)
      : stream_(std::move(stream)) {}

  void connect() override {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    bool ok = !stream_->fail_all_connects;
    if (!stream_->connect_results.empty()) {
      ok = stream_->connect_results.front();
      stream_->connect_results.pop_front();
    }
    if (!ok)
      throw TransientTransportError("connection refused");
    stream_->connects++;
  }

  std::optional<std::string>
  read_line(std::chrono::milliseconds timeout) override {
    {
      std::lock_guard<std::mutex> lock(stream_->mutex);
      if (!stream_->lines.empty()) {
        std::string line = stream_->lines.front();
        stream_->lines.pop_front();
        return line;
      }
      if (stream_->end_when_drained) {
        stream_->end_when_drained = false;
        throw TransientTransportError("stream ended");
      }
    }
    std::this_thread::sleep_for(
        std::min(timeout, std::chrono::milliseconds(5)));
    return std::nullopt;
  }

  void send(const std::string &message) override {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    stream_->sent.push_back(message);
  }

  void close() override {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    stream_->closes++;
  }

private:
  std::shared_ptr<FakeStream> stream_;
};

bool wait_until(const std::function<bool()> &condition) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return condition();
}

} // namespace

class ConnectionManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.initial_backoff_ms = 1;
    config_.backoff_multiplier = 2.0;
    config_.max_backoff_ms = 4;
    config_.ping_interval_ms = 0;
    config_.idle_timeout_ms = 0;
    stream_ = std::make_shared<FakeStream>();
  }

  std::unique_ptr<ConnectionManager> make_manager() {
    return std::make_unique<ConnectionManager>(
        config_, std::make_unique<FakeTransport>(stream_));
  }

  Config::StreamClientConfig config_;
  std::shared_ptr<FakeStream> stream_;
};

TEST_F(ConnectionManagerTest, BackoffGrowsUntilCapAndResets) {
  config_.initial_backoff_ms = 1000;
  config_.max_backoff_ms = 30000;
  auto manager = make_manager();

  std::vector<long> delays;
  for (int i = 0; i < 7; ++i)
    delays.push_back(static_cast<long>(manager->next_backoff().count()));
  EXPECT_EQ(delays,
            (std::vector<long>{1000, 2000, 4000, 8000, 16000, 30000, 30000}));

  manager->reset_backoff();
  EXPECT_EQ(manager->next_backoff().count(), 1000);
}

TEST_F(ConnectionManagerTest, DecodeAcceptsEnvelopesOnly) {
  auto message = ConnectionManager::decode(
      R"({"type":"tunnel_alert","data":{"source_ip":"10.0.0.1"}})");
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(message->type, "tunnel_alert");
  EXPECT_EQ(message->data["source_ip"], "10.0.0.1");

  auto bare = ConnectionManager::decode(R"({"type":"pong"})");
  ASSERT_TRUE(bare.has_value());
  EXPECT_TRUE(bare->data.is_null());

  EXPECT_FALSE(ConnectionManager::decode("not json").has_value());
  EXPECT_FALSE(ConnectionManager::decode(R"({"data":{}})").has_value());
  EXPECT_FALSE(ConnectionManager::decode(R"({"type":7})").has_value());
  EXPECT_FALSE(ConnectionManager::decode(R"(["log"])").has_value());
}

TEST_F(ConnectionManagerTest, MessagesReachEveryHandler) {
  stream_->lines = {R"({"type":"connected","data":{"subscriber_id":1}})",
                    "garbage",
                    R"({"type":"log","data":{"id":"req-1"}})"};
  auto manager = make_manager();

  std::mutex seen_mutex;
  std::vector<std::string> first, second;
  manager->subscribe([&](const StreamMessage &m) {
    std::lock_guard<std::mutex> lock(seen_mutex);
    first.push_back(m.type);
  });
  manager->subscribe([&](const StreamMessage &m) {
    std::lock_guard<std::mutex> lock(seen_mutex);
    second.push_back(m.type);
  });

  manager->start();
  EXPECT_TRUE(wait_until([&] { return manager->messages_received() == 2; }));
  EXPECT_EQ(manager->state(), ConnectionState::CONNECTED);
  manager->stop();

  std::lock_guard<std::mutex> lock(seen_mutex);
  EXPECT_EQ(first, (std::vector<std::string>{"connected", "log"}));
  EXPECT_EQ(second, first);
  EXPECT_EQ(manager->state(), ConnectionState::DISCONNECTED);
}

TEST_F(ConnectionManagerTest, UnsubscribedHandlerIsNotCalled) {
  auto manager = make_manager();
  std::atomic<int> calls{0};
  auto token = manager->subscribe([&](const StreamMessage &) { calls++; });
  EXPECT_TRUE(manager->unsubscribe(token));
  EXPECT_FALSE(manager->unsubscribe(token));

  stream_->lines = {R"({"type":"log"})"};
  manager->start();
  EXPECT_TRUE(wait_until([&] { return manager->messages_received() == 1; }));
  manager->stop();
  EXPECT_EQ(calls.load(), 0);
}

TEST_F(ConnectionManagerTest, ReconnectsAfterStreamEnds) {
  stream_->lines = {R"({"type":"connected"})"};
  stream_->end_when_drained = true;
  auto manager = make_manager();

  std::mutex states_mutex;
  std::vector<ConnectionState> states;
  manager->set_state_listener([&](ConnectionState state) {
    std::lock_guard<std::mutex> lock(states_mutex);
    states.push_back(state);
  });

  manager->start();
  EXPECT_TRUE(wait_until([&] {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    return stream_->connects >= 2;
  }));
  manager->stop();

  EXPECT_GE(manager->reconnect_attempts(), 1u);
  std::lock_guard<std::mutex> lock(states_mutex);
  ASSERT_GE(states.size(), 4u);
  EXPECT_EQ(states[0], ConnectionState::CONNECTING);
  EXPECT_EQ(states[1], ConnectionState::CONNECTED);
  EXPECT_EQ(states[2], ConnectionState::DISCONNECTED);
}

TEST_F(ConnectionManagerTest, RetriesFailedConnectsThenRecovers) {
  stream_->connect_results = {false, false, true};
  auto manager = make_manager();
  manager->start();
  EXPECT_TRUE(wait_until(
      [&] { return manager->state() == ConnectionState::CONNECTED; }));
  EXPECT_EQ(manager->reconnect_attempts(), 2u);
  EXPECT_FALSE(manager->gave_up());
  manager->stop();
}

TEST_F(ConnectionManagerTest, GivesUpAfterMaxAttempts) {
  config_.max_reconnect_attempts = 3;
  stream_->fail_all_connects = true;
  auto manager = make_manager();
  manager->start();
  EXPECT_TRUE(wait_until([&] { return manager->gave_up(); }));
  manager->stop();

  EXPECT_EQ(manager->reconnect_attempts(), 2u);
  EXPECT_EQ(manager->state(), ConnectionState::DISCONNECTED);
}

TEST_F(ConnectionManagerTest, SendsPingsWhileConnected) {
  config_.ping_interval_ms = 10;
  auto manager = make_manager();
  manager->start();
  EXPECT_TRUE(wait_until([&] {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    return !stream_->sent.empty();
  }));
  manager->stop();

  std::lock_guard<std::mutex> lock(stream_->mutex);
  EXPECT_EQ(stream_->sent.front(), R"({"type":"ping"})");
}

TEST_F(ConnectionManagerTest, IdleConnectionIsRecycled) {
  config_.idle_timeout_ms = 20;
  auto manager = make_manager();
  manager->start();
  EXPECT_TRUE(wait_until([&] {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    return stream_->connects >= 2;
  }));
  manager->stop();
}

TEST_F(ConnectionManagerTest, RestartsAfterGivingUp) {
  config_.max_reconnect_attempts = 2;
  stream_->fail_all_connects = true;
  auto manager = make_manager();
  manager->start();
  ASSERT_TRUE(wait_until([&] { return manager->gave_up(); }));

  {
    std::lock_guard<std::mutex> lock(stream_->mutex);
    stream_->fail_all_connects = false;
  }
  manager->start();
  EXPECT_TRUE(wait_until(
      [&] { return manager->state() == ConnectionState::CONNECTED; }));
  EXPECT_FALSE(manager->gave_up());
  manager->stop();
}

TEST_F(ConnectionManagerTest, ThrowingHandlerDoesNotStopDelivery) {
  stream_->lines = {R"({"type":"log","data":{"entry":{"id":42}}})",
                    R"({"type":"log","data":{"entry":{"id":"req-2"}}})"};
  auto manager = make_manager();

  std::mutex ids_mutex;
  std::vector<std::string> ids;
  manager->subscribe([&](const StreamMessage &m) {
    auto id = m.data["entry"]["id"].get<std::string>(); // throws on a number
    std::lock_guard<std::mutex> lock(ids_mutex);
    ids.push_back(id);
  });
  std::atomic<int> other_calls{0};
  manager->subscribe([&](const StreamMessage &) { other_calls++; });

  manager->start();
  EXPECT_TRUE(wait_until([&] { return manager->messages_received() == 2; }));
  EXPECT_EQ(manager->state(), ConnectionState::CONNECTED);
  manager->stop();

  EXPECT_EQ(manager->handler_failures(), 1u);
  EXPECT_EQ(other_calls.load(), 2);
  std::lock_guard<std::mutex> lock(ids_mutex);
  EXPECT_EQ(ids, (std::vector<std::string>{"req-2"}));
}
