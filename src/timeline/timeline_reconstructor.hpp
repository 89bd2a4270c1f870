#ifndef TIMELINE_RECONSTRUCTOR_HPP
#define TIMELINE_RECONSTRUCTOR_HPP

#include "timeline/capture.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Timeline {

enum class SortKey { DURATION, SIZE, DOMAIN };

// "time" / "duration", "size", "domain"
std::optional<SortKey> sort_key_from_string(std::string_view name);

// Sequential model: each exchange starts where the previous one ended. The
// capture's warnings are carried over.
Waterfall reconstruct(const Capture &capture);

// Views over an existing waterfall. Offsets are never recomputed.
Waterfall filter_by_mime(const Waterfall &waterfall,
                         std::string_view category);
Waterfall sort_by(const Waterfall &waterfall, SortKey key);

// "text/html; charset=utf-8" -> "text", "" -> "other"
std::string mime_category(std::string_view mime_type);
uint64_t resolved_size(const CapturedExchange &exchange);
double phase_duration(const CapturedExchange &exchange);

} // namespace Timeline

#endif // TIMELINE_RECONSTRUCTOR_HPP
