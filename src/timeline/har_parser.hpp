#ifndef HAR_PARSER_HPP
#define HAR_PARSER_HPP

#include "nlohmann/json.hpp"
#include "timeline/capture.hpp"

#include <string>

namespace HarParser {

// Accepts `{"log": {"entries": [...]}}` or `{"entries": [...]}`. Throws
// ValidationError when neither array is present. Individual malformed entries
// are skipped and reported in Capture::warnings.
Capture parse(const nlohmann::json &document);

// Same, from text. Throws ValidationError on invalid JSON.
Capture parse(const std::string &text);

// Throws ValidationError when the entry has no request URL
CapturedExchange parse_entry(const nlohmann::json &entry, size_t index);

} // namespace HarParser

#endif // HAR_PARSER_HPP
