#include "core/errors.hpp"
#include "timeline/capture_store.hpp"
#include "timeline/har_parser.hpp"
#include "timeline/timeline_reconstructor.hpp"

#include <gtest/gtest.h>
#include <string>

class TimelineTest : public ::testing::Test {
protected:
  static nlohmann::json har_entry(const std::string &url, double wait,
                                  double receive, const std::string &mime,
                                  int64_t body_size) {
    return {{"request", {{"method", "GET"}, {"url", url}}},
            {"response",
             {{"status", 200},
              {"bodySize", body_size},
              {"content", {{"size", body_size}, {"mimeType", mime}}}}},
            {"timings",
             {{"blocked", -1},
              {"dns", -1},
              {"connect", -1},
              {"send", 0},
              {"wait", wait},
              {"receive", receive}}}};
  }

  static nlohmann::json har(const nlohmann::json &entries) {
    return {{"log", {{"version", "1.2"}, {"entries", entries}}}};
  }
};

TEST_F(TimelineTest, SequentialOffsetsForTwoRequests) {
  auto capture = HarParser::parse(
      har({har_entry("https://a.example.com/index.html", 100, 20,
                     "text/html", 5120),
           har_entry("https://cdn.example.net/app.js", 60, 20,
                     "application/javascript", 20480)}));
  auto waterfall = Timeline::reconstruct(capture);

  ASSERT_EQ(waterfall.entries.size(), 2u);
  EXPECT_DOUBLE_EQ(waterfall.entries[0].duration_ms, 120.0);
  EXPECT_DOUBLE_EQ(waterfall.entries[0].start_offset_ms, 0.0);
  EXPECT_DOUBLE_EQ(waterfall.entries[0].end_offset_ms, 120.0);
  EXPECT_DOUBLE_EQ(waterfall.entries[1].start_offset_ms, 120.0);
  EXPECT_DOUBLE_EQ(waterfall.entries[1].end_offset_ms, 200.0);
  EXPECT_DOUBLE_EQ(waterfall.total_duration_ms, 200.0);

  EXPECT_EQ(waterfall.entries[0].domain, "a.example.com");
  EXPECT_EQ(waterfall.entries[1].mime_category, "application");
  EXPECT_EQ(waterfall.entries[1].size_bytes, 20480u);
}

TEST_F(TimelineTest, OffsetsNeverDecreaseAndTotalIsSumOfDurations) {
  nlohmann::json entries = nlohmann::json::array();
  for (int i = 0; i < 10; ++i)
    entries.push_back(har_entry("https://example.com/r" + std::to_string(i),
                                i * 7.5, 3, "image/png", i * 100));
  auto waterfall = Timeline::reconstruct(HarParser::parse(har(entries)));

  ASSERT_EQ(waterfall.entries.size(), 10u);
  double sum = 0.0;
  double previous_start = 0.0;
  for (const auto &timing : waterfall.entries) {
    EXPECT_GE(timing.start_offset_ms, previous_start);
    EXPECT_DOUBLE_EQ(timing.end_offset_ms,
                     timing.start_offset_ms + timing.duration_ms);
    previous_start = timing.start_offset_ms;
    sum += timing.duration_ms;
  }
  EXPECT_DOUBLE_EQ(waterfall.total_duration_ms, sum);
}

TEST_F(TimelineTest, EmptyCaptureGivesEmptyWaterfall) {
  auto waterfall =
      Timeline::reconstruct(HarParser::parse(har(nlohmann::json::array())));
  EXPECT_TRUE(waterfall.entries.empty());
  EXPECT_TRUE(waterfall.warnings.empty());
  EXPECT_DOUBLE_EQ(waterfall.total_duration_ms, 0.0);
}

TEST_F(TimelineTest, EntryWithoutUrlIsSkippedWithWarning) {
  auto broken = har_entry("https://example.com/x", 10, 10, "text/css", 10);
  broken["request"].erase("url");

  auto capture = HarParser::parse(
      har({har_entry("https://example.com/a", 10, 0, "text/css", 10), broken,
           har_entry("https://example.com/b", 5, 5, "text/css", 10)}));
  ASSERT_EQ(capture.exchanges.size(), 2u);
  ASSERT_EQ(capture.warnings.size(), 1u);
  EXPECT_NE(capture.warnings[0].find("entry 1"), std::string::npos);

  auto waterfall = Timeline::reconstruct(capture);
  ASSERT_EQ(waterfall.entries.size(), 2u);
  EXPECT_EQ(waterfall.warnings.size(), 1u);
  EXPECT_DOUBLE_EQ(waterfall.entries[1].start_offset_ms, 10.0);
}

TEST_F(TimelineTest, BareEntriesArrayIsAccepted) {
  nlohmann::json document = {
      {"entries", {har_entry("http://x.test/", 1, 1, "text/plain", 1)}}};
  EXPECT_EQ(HarParser::parse(document).exchanges.size(), 1u);
}

TEST_F(TimelineTest, DocumentWithoutEntriesIsRejected) {
  EXPECT_THROW(HarParser::parse(nlohmann::json{{"log", {{"version", "1.2"}}}}),
               ValidationError);
  EXPECT_THROW(HarParser::parse(std::string("{not json")), ValidationError);
}

TEST_F(TimelineTest, MissingSizesAndMimeFallBack) {
  nlohmann::json entry = {{"request", {{"url", "https://example.com/"}}},
                          {"timings", {{"wait", 12}}}};
  auto waterfall = Timeline::reconstruct(HarParser::parse(har({entry})));
  ASSERT_EQ(waterfall.entries.size(), 1u);
  EXPECT_EQ(waterfall.entries[0].method, "GET");
  EXPECT_EQ(waterfall.entries[0].size_bytes, 0u);
  EXPECT_EQ(waterfall.entries[0].mime_category, "other");
  EXPECT_DOUBLE_EQ(waterfall.entries[0].duration_ms, 12.0);
}

TEST_F(TimelineTest, FilterAndSortDoNotTouchOffsets) {
  auto waterfall = Timeline::reconstruct(HarParser::parse(
      har({har_entry("https://b.example.com/1", 10, 0, "text/html", 300),
           har_entry("https://a.example.com/2", 50, 0, "image/png", 100),
           har_entry("https://c.example.com/3", 30, 0, "image/gif", 200)})));

  auto images = Timeline::filter_by_mime(waterfall, "image");
  ASSERT_EQ(images.entries.size(), 2u);
  EXPECT_DOUBLE_EQ(images.entries[0].start_offset_ms, 10.0);

  auto by_duration = Timeline::sort_by(waterfall, Timeline::SortKey::DURATION);
  EXPECT_EQ(by_duration.entries[0].index, 1u);
  EXPECT_EQ(by_duration.entries[2].index, 0u);
  EXPECT_DOUBLE_EQ(by_duration.entries[0].start_offset_ms, 10.0);

  auto by_size = Timeline::sort_by(waterfall, Timeline::SortKey::SIZE);
  EXPECT_EQ(by_size.entries[0].size_bytes, 300u);

  auto by_domain = Timeline::sort_by(waterfall, Timeline::SortKey::DOMAIN);
  EXPECT_EQ(by_domain.entries[0].domain, "a.example.com");
  EXPECT_EQ(by_domain.entries[2].domain, "c.example.com");
}

TEST_F(TimelineTest, SortKeyNames) {
  EXPECT_EQ(Timeline::sort_key_from_string("time"), Timeline::SortKey::DURATION);
  EXPECT_EQ(Timeline::sort_key_from_string("SIZE"), Timeline::SortKey::SIZE);
  EXPECT_EQ(Timeline::sort_key_from_string("domain"), Timeline::SortKey::DOMAIN);
  EXPECT_FALSE(Timeline::sort_key_from_string("color").has_value());
}

TEST_F(TimelineTest, CaptureStoreEvictsOldest) {
  CaptureStore store(2);
  auto first = store.add(Waterfall{});
  auto second = store.add(Waterfall{});
  auto third = store.add(Waterfall{});

  EXPECT_NE(first, second);
  EXPECT_EQ(store.size(), 2u);
  EXPECT_FALSE(store.find(first).has_value());
  EXPECT_TRUE(store.find(third).has_value());
  EXPECT_THROW(store.get(first), NotFoundError);
  EXPECT_NO_THROW(store.get(second));
}
