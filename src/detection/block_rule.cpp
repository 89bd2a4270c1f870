#include "block_rule.hpp"
#include "utils/utils.hpp"

const char *block_rule_kind_to_string(BlockRuleKind kind) {
  switch (kind) {
  case BlockRuleKind::IP:
    return "ip";
  case BlockRuleKind::ENDPOINT:
    return "endpoint";
  case BlockRuleKind::PATTERN:
    return "pattern";
  }
  return "ip";
}

std::optional<BlockRuleKind> block_rule_kind_from_string(std::string_view name) {
  std::string lowered = Utils::to_lower_copy(name);
  if (lowered == "ip")
    return BlockRuleKind::IP;
  if (lowered == "endpoint")
    return BlockRuleKind::ENDPOINT;
  if (lowered == "pattern")
    return BlockRuleKind::PATTERN;
  return std::nullopt;
}

BlockRuleKind kind_of(const BlockRuleSpec &spec) {
  return static_cast<BlockRuleKind>(spec.index());
}

std::string rule_key(const BlockRuleSpec &spec) {
  if (const auto *ip = std::get_if<IpRule>(&spec))
    return Utils::to_lower_copy(Utils::trim_copy(ip->value));
  if (const auto *endpoint = std::get_if<EndpointRule>(&spec))
    return Utils::to_upper_copy(Utils::trim_copy(endpoint->method)) + " " +
           Utils::trim_copy(endpoint->pattern);
  const auto &pattern = std::get<PatternRule>(spec);
  return Utils::to_lower_copy(Utils::trim_copy(pattern.field)) + "=" +
         pattern.value;
}
