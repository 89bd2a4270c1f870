#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter);
uint64_t get_current_time_ms();

// "2025-05-23T00:00:35.120Z"
std::string format_iso8601_ms(uint64_t epoch_ms);
// Accepts epoch milliseconds or ISO-8601 ("2025-05-23",
// "2025-05-23T00:00:35", optional ".fff" and "Z" or "+HH:MM" offset)
std::optional<uint64_t> parse_timestamp_ms(std::string_view text);
std::string url_decode(std::string_view encoded_string);

// Creates the parent directory of `file_path` if it does not exist yet
bool create_directory_for_file(const std::string &file_path);

struct CIDRBlock {
  uint32_t network_address = 0;
  uint32_t netmask = 0;

  bool contains(uint32_t ip) const;
};

std::optional<CIDRBlock> parse_cidr(std::string_view cidr_string);
uint32_t ip_string_to_uint32(std::string_view ip_str);

// Case-insensitive glob: '*' matches any run, '?' matches one character.
// The whole subject has to match.
bool glob_match(std::string_view pattern, std::string_view subject);
bool contains_ci(std::string_view haystack, std::string_view needle);
bool iequals(std::string_view a, std::string_view b);

// Shannon entropy in bits per byte divided by 8, so the result is in [0, 1]
double normalized_shannon_entropy(std::string_view data);

// Entropy relative to the maximum reachable for this many bytes
// (log2(min(n, 256))). Meaningful for short values such as header fields.
double relative_shannon_entropy(std::string_view data);

// Largest length <= max_bytes that does not split a UTF-8 sequence
size_t utf8_prefix_length(std::string_view data, size_t max_bytes);

// Host part of an absolute URL ("https://a.b:8080/x" -> "a.b")
std::string url_host(std::string_view url);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty() || s == "-") {
    if constexpr (std::is_floating_point_v<T>)
      return static_cast<T>(0.0);
    if constexpr (std::is_integral_v<T>)
      return static_cast<T>(0);
    return std::nullopt;
  }

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}

inline std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return s;
}

inline std::string to_upper_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char ch) { return std::toupper(ch); });
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
