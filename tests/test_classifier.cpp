#include "analysis/ip_rate_arena.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log_entry.hpp"
#include "detection/indicators.hpp"
#include "detection/tunnel_classifier.hpp"
#include "utils/aho_corasick.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>

class TunnelClassifierTest : public ::testing::Test {
protected:
  void SetUp() override { arena_ = std::make_unique<IpRateArena>(16, 64); }

  LogEntry benign_entry() {
    LogEntry entry;
    entry.id = "req-1";
    entry.timestamp_ms = 1700000000000;
    entry.source_ip = "198.51.100.20";
    entry.method = "GET";
    entry.path = "/index.html";
    entry.request_headers = {{"Host", "shop.example.com"},
                             {"User-Agent", "Mozilla/5.0"},
                             {"Accept", "text/html"}};
    entry.response_status = 200;
    entry.response_headers = {{"Content-Type", "text/html; charset=utf-8"}};
    entry.response_body.data = "<html></html>";
    entry.response_body.size = 13;
    entry.response_time_ms = 42;
    return entry;
  }

  IpHistoryView record(const LogEntry &entry) {
    return arena_->record(entry.source_ip,
                          {entry.timestamp_ms, entry.request_body.size,
                           entry.response_body.size});
  }

  Config::ClassifierConfig config_;
  std::unique_ptr<IpRateArena> arena_;
};

TEST_F(TunnelClassifierTest, BenignTrafficProducesNoDetection) {
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  EXPECT_FALSE(classifier.classify(entry, record(entry)).has_value());
}

TEST_F(TunnelClassifierTest, StackedIndicatorsReachConfirmed) {
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  entry.path = "/proxy/shell.php";
  entry.query = "cmd=id";
  entry.request_headers.emplace_back("X-Tunnel", "1");

  auto detection = classifier.classify(entry, record(entry));
  ASSERT_TRUE(detection.has_value());
  EXPECT_TRUE(detection->detected);
  EXPECT_EQ(detection->confidence, Confidence::CONFIRMED);
  EXPECT_GE(detection->risk_score, 90.0);
  EXPECT_LE(detection->risk_score, 100.0);
  EXPECT_EQ(detection->tunnel_type, TunnelType::HTTP_TUNNEL);
  EXPECT_EQ(detection->entry_id, "req-1");
  EXPECT_EQ(detection->source_ip, "198.51.100.20");
  EXPECT_GE(detection->indicators.size(), 3u);
}

TEST_F(TunnelClassifierTest, HeaviestTypedIndicatorSelectsType) {
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  entry.method = "POST";
  entry.path = "/dns-query";
  entry.request_headers.emplace_back("Content-Type",
                                     "application/octet-stream");

  auto detection = classifier.classify(entry, record(entry));
  ASSERT_TRUE(detection.has_value());
  // dns_over_http (35) + opaque_content (20, untyped)
  EXPECT_EQ(detection->tunnel_type, TunnelType::DNS_TUNNEL);
  EXPECT_DOUBLE_EQ(detection->risk_score, 55.0);
  EXPECT_EQ(detection->confidence, Confidence::MEDIUM);
}

TEST_F(TunnelClassifierTest, WeightTieGoesToEarlierIndicator) {
  config_.weight_long_poll = 35.0;
  config_.weight_dns_over_http = 35.0;
  TunnelClassifier classifier(config_);

  auto entry = benign_entry();
  entry.path = "/dns-query";
  entry.response_time_ms = 45000;

  auto detection = classifier.classify(entry, record(entry));
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->tunnel_type, TunnelType::LONG_POLLING);
}

TEST_F(TunnelClassifierTest, UntypedEvidenceIsUnknown) {
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  entry.method = "POST";
  entry.request_body.size = 50000;
  entry.response_body.size = 2;

  auto detection = classifier.classify(entry, record(entry));
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->tunnel_type, TunnelType::UNKNOWN);
  EXPECT_EQ(detection->confidence, Confidence::LOW);
}

TEST_F(TunnelClassifierTest, MinIndicatorsSuppressesSingleHits) {
  config_.min_indicators = 2;
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  entry.path = "/dns-query";
  EXPECT_FALSE(classifier.classify(entry, record(entry)).has_value());
}

TEST_F(TunnelClassifierTest, ReportFloorDropsWeakDetections) {
  config_.min_report_confidence = "high";
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  entry.path = "/dns-query";
  EXPECT_FALSE(classifier.classify(entry, record(entry)).has_value());
}

TEST_F(TunnelClassifierTest, DisabledClassifierNeverDetects) {
  config_.enabled = false;
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  entry.request_headers.emplace_back("X-Tunnel", "1");
  EXPECT_FALSE(classifier.classify(entry, record(entry)).has_value());
}

TEST_F(TunnelClassifierTest, InconsistentBandsAreRejected) {
  config_.band_medium = 80.0;
  config_.band_high = 70.0;
  EXPECT_THROW(TunnelClassifier classifier(config_), ValidationError);

  Config::ClassifierConfig low_confirmed;
  low_confirmed.band_confirmed = 85.0;
  EXPECT_THROW(TunnelClassifier classifier(low_confirmed), ValidationError);
}

TEST_F(TunnelClassifierTest, DetectionIdsAreUnique) {
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  entry.path = "/dns-query";
  auto first = classifier.classify(entry, record(entry));
  auto second = classifier.classify(entry, record(entry));
  ASSERT_TRUE(first && second);
  EXPECT_NE(first->detection_id, second->detection_id);
}

TEST_F(TunnelClassifierTest, RegularIntervalsAreBeaconing) {
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  IpHistoryView history;
  for (int i = 0; i < 12; ++i) {
    entry.timestamp_ms = 1700000000000 + static_cast<uint64_t>(i) * 5000;
    history = record(entry);
  }

  auto detection = classifier.classify(entry, history);
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->tunnel_type, TunnelType::BEACONING);
}

TEST_F(TunnelClassifierTest, RegistersEveryIndicator) {
  TunnelClassifier classifier(config_);
  auto names = classifier.indicator_names();
  ASSERT_EQ(names.size(), 14u);
  EXPECT_EQ(names.front(), "tunnel_headers");
  EXPECT_EQ(names.back(), "websocket_abuse");
}

// --- Individual indicators ---

class IndicatorsTest : public TunnelClassifierTest {};

TEST_F(IndicatorsTest, HighEntropyBodyFires) {
  auto entry = benign_entry();
  for (int i = 0; i < 256; ++i)
    entry.request_body.data.push_back(static_cast<char>(i));
  entry.request_body.size = entry.request_body.data.size();
  EXPECT_TRUE(Indicators::high_body_entropy(entry, 0.9, 100).has_value());

  entry.request_body.data = std::string(300, 'a');
  EXPECT_FALSE(Indicators::high_body_entropy(entry, 0.9, 100).has_value());
}

TEST_F(IndicatorsTest, HighEntropyCustomHeaderFires) {
  auto entry = benign_entry();
  entry.request_headers.emplace_back(
      "X-Session-Blob",
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/");
  auto evidence = Indicators::high_header_entropy(entry, 0.85, 64);
  ASSERT_TRUE(evidence.has_value());
  EXPECT_NE(evidence->find("x-session-blob"), std::string::npos);

  // Standard headers never count
  auto standard = benign_entry();
  standard.request_headers.emplace_back(
      "Cookie",
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/");
  EXPECT_FALSE(Indicators::high_header_entropy(standard, 0.85, 64).has_value());
}

TEST_F(IndicatorsTest, ChunkedWithBufferingDisabled) {
  auto entry = benign_entry();
  entry.response_headers = {{"Transfer-Encoding", "chunked"}};
  EXPECT_FALSE(Indicators::chunked_unbuffered(entry).has_value());

  entry.response_headers.emplace_back("X-Accel-Buffering", "no");
  EXPECT_TRUE(Indicators::chunked_unbuffered(entry).has_value());
}

TEST_F(IndicatorsTest, TunnaShapes) {
  auto entry = benign_entry();
  entry.path = "/conn";
  entry.query = "5f3a9c";
  EXPECT_TRUE(Indicators::tunna_pattern(entry).has_value());

  auto header = benign_entry();
  header.request_headers.emplace_back("X-CMD", "READ");
  EXPECT_TRUE(Indicators::tunna_pattern(header).has_value());

  EXPECT_FALSE(Indicators::tunna_pattern(benign_entry()).has_value());
}

TEST_F(IndicatorsTest, TunnaBodyParameters) {
  auto entry = benign_entry();
  entry.request_body.data = "session=1&cmd=connect&data=AAAA";
  auto evidence = Indicators::tunna_pattern(entry);
  ASSERT_TRUE(evidence.has_value());
  EXPECT_EQ(*evidence, "tunna cmd/data parameters");

  entry.request_body.data = "ACTION=Write&len=10";
  evidence = Indicators::tunna_pattern(entry);
  ASSERT_TRUE(evidence.has_value());
  EXPECT_EQ(*evidence, "tunna socket action parameter");

  entry.request_body.data = "cmd=&data=x action=delete";
  EXPECT_FALSE(Indicators::tunna_pattern(entry).has_value());
}

TEST_F(TunnelClassifierTest, MaximumSizeBodyIsClassified) {
  TunnelClassifier classifier(config_);
  auto entry = benign_entry();
  entry.method = "POST";
  entry.request_body.data =
      "cmd=" + std::string(Config::MAX_BODY_BYTES_LIMIT - 10, 'a') + "&data=";
  entry.request_body.size = entry.request_body.data.size();

  std::optional<TunnelDetection> detection;
  ASSERT_NO_THROW(detection = classifier.classify(entry, record(entry)));
  ASSERT_TRUE(detection.has_value());
  bool tunna_fired = false;
  for (const auto &indicator : detection->indicators)
    tunna_fired |= indicator.find("tunna cmd/data") != std::string::npos;
  EXPECT_TRUE(tunna_fired);

  // Without the closing parameter nothing matches, still in linear time
  entry.request_body.data = "cmd=" + std::string(Config::MAX_BODY_BYTES_LIMIT - 4, 'a');
  EXPECT_FALSE(Indicators::tunna_pattern(entry).has_value());
}

TEST_F(IndicatorsTest, WebSocketWithoutOrigin) {
  Utils::AhoCorasick paths({"/tunnel"});
  auto entry = benign_entry();
  entry.request_headers.emplace_back("Upgrade", "websocket");
  EXPECT_TRUE(Indicators::websocket_abuse(entry, paths, 0.9, 100).has_value());

  entry.request_headers.emplace_back("Origin", "https://shop.example.com");
  EXPECT_FALSE(Indicators::websocket_abuse(entry, paths, 0.9, 100).has_value());

  entry.path = "/tunnel/ws";
  EXPECT_TRUE(Indicators::websocket_abuse(entry, paths, 0.9, 100).has_value());
}

TEST_F(IndicatorsTest, SmallRequestBurstCountsWindowOnly) {
  IpRateArena arena(4, 128);
  IpHistoryView history;
  // 10 stale requests, then 60 inside one minute
  for (uint64_t i = 0; i < 10; ++i)
    history = arena.record("10.0.0.1", {i * 1000, 10, 10});
  for (uint64_t i = 0; i < 60; ++i)
    history = arena.record("10.0.0.1", {200000 + i * 500, 10, 10});

  EXPECT_TRUE(Indicators::small_request_burst(history, 60000, 50, 50).has_value());
  EXPECT_FALSE(Indicators::small_request_burst(history, 60000, 60, 50).has_value());
}

TEST_F(IndicatorsTest, IrregularIntervalsAreNotBeaconing) {
  IpRateArena arena(4, 64);
  IpHistoryView history;
  const uint64_t offsets[] = {0, 100, 9000, 9100, 30000, 30050,
                              61000, 61500, 90000, 140000, 140010, 200000};
  for (uint64_t offset : offsets)
    history = arena.record("10.0.0.2", {offset, 0, 0});
  EXPECT_FALSE(Indicators::beaconing(history, 10, 0.3, 300000).has_value());
}
