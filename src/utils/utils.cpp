#include "utils.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace Utils {
std::string url_decode(std::string_view encoded_string) {
  std::string decoded;
  decoded.reserve(encoded_string.size());

  for (size_t i = 0; i < encoded_string.length(); i++) {
    if (encoded_string[i] == '%' && i + 2 < encoded_string.length()) {
      unsigned int byte = 0;
      auto hex = encoded_string.substr(i + 1, 2);
      auto [ptr, ec] =
          std::from_chars(hex.data(), hex.data() + hex.size(), byte, 16);
      if (ec == std::errc() && ptr == hex.data() + hex.size()) {
        decoded.push_back(static_cast<char>(byte));
        i += 2;
      } else
        decoded.push_back('%');
    } else if (encoded_string[i] == '+')
      decoded.push_back(' ');
    else
      decoded.push_back(encoded_string[i]);
  }
  return decoded;
}

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter))
    tokens.push_back(current_token);
  return tokens;
}

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

std::string format_iso8601_ms(uint64_t epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm t{};
#if defined(_WIN32)
  gmtime_s(&t, &seconds);
#else
  gmtime_r(&seconds, &t);
#endif
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                t.tm_year + 1900, t.tm_mon + 1, t.tm_mday, t.tm_hour, t.tm_min,
                t.tm_sec, static_cast<unsigned>(epoch_ms % 1000));
  return buffer;
}

std::optional<uint64_t> parse_timestamp_ms(std::string_view text) {
  std::string value = trim_copy(text);
  if (value.empty())
    return std::nullopt;
  if (std::all_of(value.begin(), value.end(),
                  [](unsigned char c) { return std::isdigit(c); }))
    return string_to_number<uint64_t>(value);

  std::tm t{};
  int consumed = 0;
  if (std::sscanf(value.c_str(), "%4d-%2d-%2d%n", &t.tm_year, &t.tm_mon,
                  &t.tm_mday, &consumed) != 3 ||
      consumed != 10)
    return std::nullopt;
  const char *p = value.c_str() + consumed;

  uint64_t millis = 0;
  long offset_seconds = 0;
  if (*p == 'T' || *p == ' ') {
    int read = 0;
    if (std::sscanf(p + 1, "%2d:%2d:%2d%n", &t.tm_hour, &t.tm_min, &t.tm_sec,
                    &read) != 3 ||
        read != 8)
      return std::nullopt;
    p += 1 + read;

    // Fraction, kept to millisecond precision
    if (*p == '.') {
      ++p;
      int digits = 0;
      while (std::isdigit(static_cast<unsigned char>(*p))) {
        if (digits < 3)
          millis = millis * 10 + static_cast<uint64_t>(*p - '0');
        ++digits;
        ++p;
      }
      if (digits == 0)
        return std::nullopt;
      for (; digits < 3; ++digits)
        millis *= 10;
    }

    if (*p == 'Z') {
      ++p;
    } else if (*p == '+' || *p == '-') {
      char sign = *p;
      int tz_hour = 0, tz_min = 0, read_tz = 0;
      if (std::sscanf(p + 1, "%2d:%2d%n", &tz_hour, &tz_min, &read_tz) != 2 ||
          read_tz != 5)
        return std::nullopt;
      offset_seconds = tz_hour * 3600L + tz_min * 60L;
      if (sign == '-')
        offset_seconds = -offset_seconds;
      p += 1 + read_tz;
    }
  }
  if (*p != '\0')
    return std::nullopt;

  if (t.tm_mon < 1 || t.tm_mon > 12 || t.tm_mday < 1 || t.tm_mday > 31 ||
      t.tm_hour > 23 || t.tm_min > 59 || t.tm_sec > 60)
    return std::nullopt;
  t.tm_year -= 1900;
  t.tm_mon -= 1;

#if defined(_WIN32)
  std::time_t epoch_seconds = _mkgmtime(&t);
#else
  std::time_t epoch_seconds = timegm(&t);
#endif
  epoch_seconds -= offset_seconds;
  if (epoch_seconds < 0)
    return std::nullopt;
  return static_cast<uint64_t>(epoch_seconds) * 1000 + millis;
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

uint32_t ip_string_to_uint32(std::string_view ip_str) {
  auto segments = split_string_view(ip_str, '.');
  if (segments.size() != 4)
    return 0;

  uint32_t ip_uint = 0;
  int shift = 24;
  for (auto segment : segments) {
    auto octet = string_to_number<unsigned int>(segment);
    if (segment.empty() || !octet || *octet > 255)
      return 0;
    ip_uint |= (*octet & 0xFF) << shift;
    shift -= 8;
  }
  return ip_uint;
}

std::optional<CIDRBlock> parse_cidr(std::string_view cidr_string) {
  size_t slash_pos = cidr_string.find('/');
  if (slash_pos == std::string_view::npos) {
    uint32_t ip = ip_string_to_uint32(cidr_string);
    if (ip == 0)
      return std::nullopt;
    return CIDRBlock{ip, 0xFFFFFFFF};
  }

  uint32_t ip = ip_string_to_uint32(cidr_string.substr(0, slash_pos));
  if (ip == 0)
    return std::nullopt;

  auto mask_part = cidr_string.substr(slash_pos + 1);
  auto mask_len = string_to_number<int>(mask_part);
  if (mask_part.empty() || !mask_len || *mask_len < 0 || *mask_len > 32)
    return std::nullopt;

  uint32_t netmask = (*mask_len == 0) ? 0 : (0xFFFFFFFF << (32 - *mask_len));

  return CIDRBlock{ip & netmask, netmask};
}

bool CIDRBlock::contains(uint32_t ip) const {
  return (ip & netmask) == network_address;
}

bool glob_match(std::string_view pattern, std::string_view subject) {
  // Iterative matcher with single-star backtracking
  size_t p = 0, s = 0;
  size_t star_p = std::string_view::npos, star_s = 0;

  auto same = [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  };

  while (s < subject.size()) {
    if (p < pattern.size() &&
        (pattern[p] == '?' || (pattern[p] != '*' && same(pattern[p], subject[s])))) {
      ++p;
      ++s;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star_p = p++;
      star_s = s;
    } else if (star_p != std::string_view::npos) {
      p = star_p + 1;
      s = ++star_s;
    } else
      return false;
  }

  while (p < pattern.size() && pattern[p] == '*')
    ++p;
  return p == pattern.size();
}

size_t utf8_prefix_length(std::string_view data, size_t max_bytes) {
  if (data.size() <= max_bytes)
    return data.size();

  // Step back over continuation bytes (10xxxxxx) to the lead byte of the
  // sequence that straddles the cut
  size_t cut = max_bytes;
  size_t steps = 0;
  while (cut > 0 && steps < 3 &&
         (static_cast<unsigned char>(data[cut]) & 0xC0) == 0x80) {
    --cut;
    ++steps;
  }
  if ((static_cast<unsigned char>(data[cut]) & 0xC0) == 0x80)
    return max_bytes; // not UTF-8 text; keep the byte cap
  return cut;
}

bool contains_ci(std::string_view haystack, std::string_view needle) {
  if (needle.empty())
    return true;
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                        });
  return it != haystack.end();
}

bool iequals(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

double normalized_shannon_entropy(std::string_view data) {
  if (data.empty())
    return 0.0;

  std::array<size_t, 256> counts{};
  for (unsigned char c : data)
    counts[c]++;

  double entropy = 0.0;
  const double total = static_cast<double>(data.size());
  for (size_t count : counts) {
    if (count == 0)
      continue;
    double p = static_cast<double>(count) / total;
    entropy -= p * std::log2(p);
  }
  return entropy / 8.0;
}

double relative_shannon_entropy(std::string_view data) {
  if (data.size() < 2)
    return 0.0;
  double max_bits =
      std::log2(static_cast<double>(std::min<size_t>(data.size(), 256)));
  return normalized_shannon_entropy(data) * 8.0 / max_bits;
}

std::string url_host(std::string_view url) {
  static const std::regex host_regex(R"(^[a-zA-Z][a-zA-Z0-9+.-]*://([^/?#]+))");
  std::string url_str{url};
  std::smatch match;
  if (!std::regex_search(url_str, match, host_regex))
    return "";

  std::string authority = match[1].str();
  // Drop userinfo and port
  size_t at_pos = authority.rfind('@');
  if (at_pos != std::string::npos)
    authority = authority.substr(at_pos + 1);
  if (!authority.empty() && authority[0] == '[') {
    size_t close = authority.find(']');
    return close == std::string::npos ? authority
                                      : authority.substr(0, close + 1);
  }
  size_t colon_pos = authority.find(':');
  if (colon_pos != std::string::npos)
    authority = authority.substr(0, colon_pos);
  return to_lower_copy(authority);
}
} // namespace Utils
