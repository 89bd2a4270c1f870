#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include "analysis/ip_rate_arena.hpp"
#include "core/log_entry.hpp"
#include "utils/aho_corasick.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Individual covert-channel checks. Every function is pure: it only reads the
// entry and the per-IP history it is given, and returns a human readable
// piece of evidence when it fires.
namespace Indicators {

using Evidence = std::optional<std::string>;

Evidence tunnel_headers(const LogEntry &entry,
                        const std::vector<std::string> &header_names);

Evidence opaque_content_type(const LogEntry &entry,
                             const std::vector<std::string> &content_types);

// Chunked transfer combined with proxy buffering switched off
Evidence chunked_unbuffered(const LogEntry &entry);

Evidence suspicious_path(const LogEntry &entry,
                         const Utils::AhoCorasick &path_matcher);

// cmd/exec parameters handed straight to a server-side script
Evidence webshell_command(const LogEntry &entry);

// Request shapes used by Tunna-style socket-over-HTTP tools
Evidence tunna_pattern(const LogEntry &entry);

Evidence high_body_entropy(const LogEntry &entry, double threshold,
                           size_t min_bytes);

// Non-standard request headers carrying random-looking values
Evidence high_header_entropy(const LogEntry &entry, double threshold,
                             size_t min_bytes);

Evidence long_polling(const LogEntry &entry, uint64_t threshold_ms);

// Large upload answered with an almost empty response
Evidence large_upload_small_response(const LogEntry &entry,
                                     uint64_t min_request_bytes,
                                     uint64_t max_response_bytes);

// Many tiny exchanges from one IP inside the burst window
Evidence small_request_burst(const IpHistoryView &history, uint64_t window_ms,
                             size_t min_requests, uint64_t max_body_bytes);

// Regular inter-arrival times from one IP
Evidence beaconing(const IpHistoryView &history, size_t min_samples,
                   double max_coefficient_of_variation,
                   uint64_t max_mean_interval_ms);

Evidence dns_over_http(const LogEntry &entry);

// WebSocket upgrade that looks scripted or carries opaque payloads
Evidence websocket_abuse(const LogEntry &entry,
                         const Utils::AhoCorasick &path_matcher,
                         double body_entropy_threshold,
                         size_t body_entropy_min_bytes);

} // namespace Indicators

#endif // INDICATORS_HPP
