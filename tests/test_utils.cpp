#include "utils/aho_corasick.hpp"
#include "utils/utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

// --- Tests for ip_string_to_uint32 ---
TEST(UtilsTest, IPStringToUint32) {
  EXPECT_EQ(Utils::ip_string_to_uint32("192.168.1.1"), 3232235777);
  EXPECT_EQ(Utils::ip_string_to_uint32("0.0.0.0"), 0);
  EXPECT_EQ(Utils::ip_string_to_uint32("255.255.255.255"), 4294967295);
  EXPECT_EQ(Utils::ip_string_to_uint32("127.0.0.1"), 2130706433);
  // Invalid inputs
  EXPECT_EQ(Utils::ip_string_to_uint32("not.an.ip"), 0);
  EXPECT_EQ(Utils::ip_string_to_uint32("192.168.1"), 0);
  EXPECT_EQ(Utils::ip_string_to_uint32("192.168.1.256"), 0);
  EXPECT_EQ(Utils::ip_string_to_uint32(""), 0);
}

// --- Tests for parse_cidr ---
TEST(UtilsTest, ParseCIDR) {
  auto cidr1 = Utils::parse_cidr("192.168.1.100/24");
  ASSERT_TRUE(cidr1.has_value());
  EXPECT_EQ(cidr1->network_address, 3232235776); // 192.168.1.0
  EXPECT_EQ(cidr1->netmask, 4294967040);         // 255.255.255.0

  auto cidr2 = Utils::parse_cidr("10.0.0.1/32");
  ASSERT_TRUE(cidr2.has_value());
  EXPECT_TRUE(cidr2->contains(Utils::ip_string_to_uint32("10.0.0.1")));
  EXPECT_FALSE(cidr2->contains(Utils::ip_string_to_uint32("10.0.0.2")));

  auto cidr3 = Utils::parse_cidr("8.8.8.8"); // No mask should default to /32
  ASSERT_TRUE(cidr3.has_value());
  EXPECT_EQ(cidr3->netmask, 4294967295);

  // Invalid CIDRs
  EXPECT_FALSE(Utils::parse_cidr("192.168.1.1/33").has_value());
  EXPECT_FALSE(Utils::parse_cidr("not.an.ip/24").has_value());
  EXPECT_FALSE(Utils::parse_cidr("192.168.1.1/foo").has_value());
}

// --- Tests for glob_match ---
TEST(UtilsTest, GlobMatch) {
  EXPECT_TRUE(Utils::glob_match("/api/v1/admin/*", "/api/v1/admin/users"));
  EXPECT_TRUE(Utils::glob_match("curl/*", "CURL/8.1.2"));
  EXPECT_TRUE(Utils::glob_match("*.php", "/upload/shell.php"));
  EXPECT_TRUE(Utils::glob_match("/v?/items", "/v2/items"));
  EXPECT_TRUE(Utils::glob_match("*", ""));
  // The whole subject has to match
  EXPECT_FALSE(Utils::glob_match("/admin", "/admin/x"));
  EXPECT_FALSE(Utils::glob_match("*.php", "/shell.php.txt"));
  EXPECT_FALSE(Utils::glob_match("/v?/items", "/v10/items"));
}

TEST(UtilsTest, CaseInsensitiveComparisons) {
  EXPECT_TRUE(Utils::contains_ci("Mozilla/5.0 SQLMap", "sqlmap"));
  EXPECT_FALSE(Utils::contains_ci("short", "longer needle"));
  EXPECT_TRUE(Utils::contains_ci("anything", ""));
  EXPECT_TRUE(Utils::iequals("Content-Type", "content-type"));
  EXPECT_FALSE(Utils::iequals("Content-Type", "content-typ"));
}

// --- Tests for entropy helpers ---
TEST(UtilsTest, ShannonEntropy) {
  EXPECT_DOUBLE_EQ(Utils::normalized_shannon_entropy(""), 0.0);
  EXPECT_DOUBLE_EQ(Utils::normalized_shannon_entropy("aaaaaaaa"), 0.0);
  // Two equally likely symbols carry one bit per byte
  EXPECT_DOUBLE_EQ(Utils::normalized_shannon_entropy("abababab"), 1.0 / 8.0);

  std::string all_bytes;
  for (int i = 0; i < 256; ++i)
    all_bytes.push_back(static_cast<char>(i));
  EXPECT_DOUBLE_EQ(Utils::normalized_shannon_entropy(all_bytes), 1.0);

  // Sixteen distinct characters are as random as sixteen bytes can be
  EXPECT_DOUBLE_EQ(Utils::relative_shannon_entropy("0123456789abcdef"), 1.0);
  EXPECT_DOUBLE_EQ(Utils::relative_shannon_entropy("x"), 0.0);
  EXPECT_LT(Utils::relative_shannon_entropy("aaaaaaab"), 0.5);
}

// --- Tests for url_host ---
TEST(UtilsTest, UrlHost) {
  EXPECT_EQ(Utils::url_host("https://CDN.Example.com/app.js"), "cdn.example.com");
  EXPECT_EQ(Utils::url_host("http://user:pw@host.test:8080/x?y=1"), "host.test");
  EXPECT_EQ(Utils::url_host("http://[::1]:9090/stream"), "[::1]");
  EXPECT_EQ(Utils::url_host("/relative/path"), "");
  EXPECT_EQ(Utils::url_host(""), "");
}

// --- Tests for AhoCorasick ---
TEST(UtilsTest, AhoCorasickFindsPathSegments) {
  std::vector<std::string> segments = {"/proxy", "/tunnel", "/conn"};
  Utils::AhoCorasick matcher(segments);
  EXPECT_FALSE(matcher.empty());

  auto hit = matcher.find_first("/api/PROXY/open");
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, "/proxy");
  EXPECT_FALSE(matcher.find_first("/static/app.js").has_value());
  EXPECT_EQ(matcher.find_all("/tunnel/conn/1").size(), 2u);

  Utils::AhoCorasick none(std::vector<std::string>{});
  EXPECT_TRUE(none.empty());
  EXPECT_FALSE(none.find_first("/proxy").has_value());
}

// --- Tests for string_to_number ---
TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("42"), 42);
  EXPECT_EQ(Utils::string_to_number<size_t>("-"), 0u);
  EXPECT_FALSE(Utils::string_to_number<size_t>("-1").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("12abc").has_value());
}

// --- Tests for url_decode ---
TEST(UtilsTest, URLDecode) {
  EXPECT_EQ(Utils::url_decode("hello+world"), "hello world");
  EXPECT_EQ(Utils::url_decode("foo%20bar"), "foo bar");
  EXPECT_EQ(Utils::url_decode("%2Fetc%2Fpasswd"), "/etc/passwd");
  EXPECT_EQ(Utils::url_decode("invalid%2g"),
            "invalid%2g"); // Handles invalid hex
  EXPECT_EQ(Utils::url_decode(""), "");
}
// --- Tests for timestamp formatting and parsing ---
TEST(UtilsTest, FormatIso8601) {
  EXPECT_EQ(Utils::format_iso8601_ms(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(Utils::format_iso8601_ms(1748000000123ULL),
            "2025-05-23T11:33:20.123Z");
}

TEST(UtilsTest, ParseTimestamp) {
  EXPECT_EQ(Utils::parse_timestamp_ms("1748000000123"), 1748000000123ULL);
  EXPECT_EQ(Utils::parse_timestamp_ms("2025-05-23T11:33:20.123Z"),
            1748000000123ULL);
  EXPECT_EQ(Utils::parse_timestamp_ms("2025-05-23T17:03:20+05:30"),
            1748000000000ULL);
  EXPECT_EQ(Utils::parse_timestamp_ms("2025-05-23"), 1747958400000ULL);
  EXPECT_EQ(Utils::parse_timestamp_ms("2025-05-23T11:33:20.5Z"),
            1748000000500ULL);

  EXPECT_FALSE(Utils::parse_timestamp_ms("").has_value());
  EXPECT_FALSE(Utils::parse_timestamp_ms("yesterday").has_value());
  EXPECT_FALSE(Utils::parse_timestamp_ms("2025-13-01").has_value());
  EXPECT_FALSE(Utils::parse_timestamp_ms("2025-05-23T11:33").has_value());
  EXPECT_FALSE(Utils::parse_timestamp_ms("2025-05-23T11:33:20Zjunk").has_value());
}

// --- Tests for utf8_prefix_length ---
TEST(UtilsTest, Utf8PrefixLength) {
  EXPECT_EQ(Utils::utf8_prefix_length("abc", 10), 3u);
  EXPECT_EQ(Utils::utf8_prefix_length("abcdef", 4), 4u);
  // "a" then U+00E9 (2 bytes): a cut after 2 bytes would split it
  EXPECT_EQ(Utils::utf8_prefix_length("a\xC3\xA9z", 2), 1u);
  EXPECT_EQ(Utils::utf8_prefix_length("a\xC3\xA9z", 3), 3u);
  // U+1F600 (4 bytes)
  EXPECT_EQ(Utils::utf8_prefix_length("\xF0\x9F\x98\x80!", 3), 0u);
  // Runs of continuation bytes are not text; the cap is kept
  EXPECT_EQ(Utils::utf8_prefix_length("\x80\x80\x80\x80\x80\x80", 5), 5u);
}
