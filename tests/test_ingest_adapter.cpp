#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/bus_event.hpp"
#include "io/ingest/ingest_adapter.hpp"
#include "utils/json_formatter.hpp"

#include <gtest/gtest.h>
#include <string>

class IngestAdapterTest : public ::testing::Test {
protected:
  Config::IngestConfig config_;

  RawObservation make_observation() {
    RawObservation raw;
    raw.peer_address = "203.0.113.7";
    raw.method = "post";
    raw.path = "/upload?id=42";
    raw.request_headers = {{"Host", "example.com"},
                           {"Authorization", "Bearer secret"}};
    raw.request_body = "hello";
    raw.response_status = 201;
    raw.response_time_ms = 35;
    raw.timestamp_ms = 1700000000000;
    return raw;
  }
};

TEST_F(IngestAdapterTest, NormalisesMethodPathAndQuery) {
  IngestAdapter adapter(config_);
  auto entry = adapter.normalize(make_observation());

  EXPECT_EQ(entry->method, "POST");
  EXPECT_EQ(entry->path, "/upload");
  EXPECT_EQ(entry->query, "id=42");
  EXPECT_EQ(entry->source_ip, "203.0.113.7");
  EXPECT_EQ(entry->response_status, 201);
  EXPECT_EQ(entry->response_time_ms, 35u);
  EXPECT_EQ(entry->timestamp_ms, 1700000000000u);
  EXPECT_FALSE(entry->id.empty());
}

TEST_F(IngestAdapterTest, AssignsDistinctIdsInSequence) {
  IngestAdapter adapter(config_);
  auto first = adapter.normalize(make_observation());
  auto second = adapter.normalize(make_observation());
  EXPECT_NE(first->id, second->id);
  EXPECT_LT(first->sequence, second->sequence);
}

TEST_F(IngestAdapterTest, TruncatesBodiesButKeepsOriginalSize) {
  config_.max_body_bytes = 8;
  IngestAdapter adapter(config_);

  auto raw = make_observation();
  raw.request_body = std::string(20, 'a');
  raw.response_body = "ok";
  raw.response_body_size = 5000; // edge already cut it
  auto entry = adapter.normalize(std::move(raw));

  EXPECT_EQ(entry->request_body.data.size(), 8u);
  EXPECT_EQ(entry->request_body.size, 20u);
  EXPECT_TRUE(entry->request_body.truncated);

  EXPECT_EQ(entry->response_body.data, "ok");
  EXPECT_EQ(entry->response_body.size, 5000u);
  EXPECT_TRUE(entry->response_body.truncated);
}

TEST_F(IngestAdapterTest, TruncationKeepsMultibyteCharactersWhole) {
  IngestAdapter adapter(config_);

  auto raw = make_observation();
  raw.request_body = "a";
  for (int i = 0; i < 6000; ++i)
    raw.request_body += "\xC3\xA9"; // U+00E9
  auto entry = adapter.normalize(std::move(raw));

  ASSERT_TRUE(entry->request_body.truncated);
  EXPECT_EQ(entry->request_body.size, 12001u);
  EXPECT_EQ(entry->request_body.data.size(), 10239u);

  ProcessedRecord record{entry, BlockDecision{}, nullptr};
  std::string line;
  ASSERT_NO_THROW(line = JsonFormatter::dump(JsonFormatter::record_to_json(record)));
  EXPECT_NE(line.find("\xC3\xA9\""), std::string::npos);
}

TEST_F(IngestAdapterTest, BinaryBodiesStillSerialise) {
  IngestAdapter adapter(config_);

  auto raw = make_observation();
  raw.request_body = std::string("\x00\xFF\xFE\x80payload", 11);
  auto entry = adapter.normalize(std::move(raw));

  BusEvent event = LogEvent{entry, BlockDecision{}, nullptr};
  std::string line;
  ASSERT_NO_THROW(line = JsonFormatter::dump(JsonFormatter::event_to_envelope(event)));
  EXPECT_NE(line.find("payload"), std::string::npos);
}

TEST_F(IngestAdapterTest, SmallBodiesAreNotMarkedTruncated) {
  IngestAdapter adapter(config_);
  auto entry = adapter.normalize(make_observation());
  EXPECT_EQ(entry->request_body.data, "hello");
  EXPECT_EQ(entry->request_body.size, 5u);
  EXPECT_FALSE(entry->request_body.truncated);
}

TEST_F(IngestAdapterTest, ForwardedForWinsWhenTrusted) {
  IngestAdapter adapter(config_);
  auto raw = make_observation();
  raw.request_headers.emplace_back("X-Forwarded-For", " 198.51.100.4, 10.0.0.1");
  EXPECT_EQ(adapter.resolve_client_ip(raw), "198.51.100.4");

  config_.trust_forwarded_headers = false;
  IngestAdapter untrusting(config_);
  EXPECT_EQ(untrusting.resolve_client_ip(raw), "203.0.113.7");
}

TEST_F(IngestAdapterTest, RealIpIsUsedWithoutForwardedFor) {
  IngestAdapter adapter(config_);
  auto raw = make_observation();
  raw.request_headers.emplace_back("X-Real-IP", "198.51.100.9");
  EXPECT_EQ(adapter.resolve_client_ip(raw), "198.51.100.9");
}

TEST_F(IngestAdapterTest, SensitiveHeadersAreRedacted) {
  IngestAdapter adapter(config_);
  auto entry = adapter.normalize(make_observation());

  auto authorization = entry->find_request_header("authorization");
  ASSERT_TRUE(authorization.has_value());
  EXPECT_EQ(*authorization, "[REDACTED]");
  EXPECT_EQ(*entry->find_request_header("host"), "example.com");
}

TEST_F(IngestAdapterTest, ParsesObservationJson) {
  auto j = nlohmann::json::parse(R"({
    "client_ip": "192.0.2.1",
    "method": "GET",
    "path": "/dns-query",
    "query": "dns=AAABAAAB",
    "request_headers": {"Accept": "application/dns-message"},
    "response_headers": [["Content-Type", "application/dns-message"]],
    "status": 200,
    "response_time_ms": 12,
    "timestamp_ms": 1700000000500
  })");

  auto raw = IngestAdapter::observation_from_json(j);
  EXPECT_EQ(raw.peer_address, "192.0.2.1");
  EXPECT_EQ(raw.path, "/dns-query");
  ASSERT_TRUE(raw.query.has_value());
  EXPECT_EQ(*raw.query, "dns=AAABAAAB");
  ASSERT_EQ(raw.request_headers.size(), 1u);
  EXPECT_EQ(raw.request_headers[0].first, "Accept");
  ASSERT_EQ(raw.response_headers.size(), 1u);
  EXPECT_EQ(raw.response_status, 200);
  EXPECT_EQ(raw.response_time_ms, 12);
  ASSERT_TRUE(raw.timestamp_ms.has_value());
}

TEST_F(IngestAdapterTest, RejectsMalformedObservations) {
  EXPECT_THROW(IngestAdapter::observation_from_json(nlohmann::json::array()),
               ValidationError);
  EXPECT_THROW(
      IngestAdapter::observation_from_json(nlohmann::json{{"method", "GET"}}),
      ValidationError);
  EXPECT_THROW(IngestAdapter::observation_from_json(
                   nlohmann::json{{"path", "/"}, {"status", "ok"}}),
               ValidationError);
  EXPECT_THROW(IngestAdapter::observation_from_json(
                   nlohmann::json{{"path", "/"}, {"request_headers", 5}}),
               ValidationError);
}
