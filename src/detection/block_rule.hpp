#ifndef BLOCK_RULE_HPP
#define BLOCK_RULE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

enum class BlockRuleKind { IP = 0, ENDPOINT = 1, PATTERN = 2 };

constexpr size_t BLOCK_RULE_KIND_COUNT = 3;

const char *block_rule_kind_to_string(BlockRuleKind kind);
std::optional<BlockRuleKind> block_rule_kind_from_string(std::string_view name);

// Single address ("10.0.0.5", "::1") or IPv4 CIDR block ("10.0.0.0/8")
struct IpRule {
  std::string value;
};

// `method` is upper-cased; "ALL" matches any method
struct EndpointRule {
  std::string method = "ALL";
  std::string pattern;
};

// `field` is one of user_agent, path, query, method, body, header or
// header:<name>
struct PatternRule {
  std::string field;
  std::string value;
};

using BlockRuleSpec = std::variant<IpRule, EndpointRule, PatternRule>;

BlockRuleKind kind_of(const BlockRuleSpec &spec);

// Discriminating key: two rules of one kind with equal keys are the same rule
std::string rule_key(const BlockRuleSpec &spec);

struct BlockRule {
  std::string id;
  BlockRuleSpec spec;
  std::string reason;
  uint64_t created_at_ms = 0;
  std::string created_by;

  BlockRuleKind kind() const { return kind_of(spec); }
  std::string key() const { return rule_key(spec); }
};

struct BlockDecision {
  bool denied = false;
  std::optional<BlockRule> matched_rule;

  static BlockDecision allow() { return {}; }
  static BlockDecision deny(const BlockRule &rule) { return {true, rule}; }
};

#endif // BLOCK_RULE_HPP
