#include "log_entry.hpp"
#include "utils/utils.hpp"

std::optional<std::string_view> find_header(const HeaderList &headers,
                                            std::string_view name) {
  for (const auto &[key, value] : headers)
    if (Utils::iequals(key, name))
      return std::string_view(value);
  return std::nullopt;
}

std::optional<std::string_view>
LogEntry::find_request_header(std::string_view name) const {
  return find_header(request_headers, name);
}

std::optional<std::string_view>
LogEntry::find_response_header(std::string_view name) const {
  return find_header(response_headers, name);
}

std::string_view LogEntry::user_agent() const {
  return find_request_header("user-agent").value_or(std::string_view{});
}

std::string_view LogEntry::response_content_type() const {
  return find_response_header("content-type").value_or(std::string_view{});
}
