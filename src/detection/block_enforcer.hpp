#ifndef BLOCK_ENFORCER_HPP
#define BLOCK_ENFORCER_HPP

#include "core/config.hpp"
#include "core/log_entry.hpp"
#include "detection/block_rule.hpp"
#include "utils/utils.hpp"

#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace prometheus {
class Counter;
class Gauge;
} // namespace prometheus

// Standing deny rules. Evaluation checks IP rules, then endpoint rules, then
// pattern rules; inside a kind the earliest inserted match wins. Reads take a
// shared lock, add/remove take it exclusively.
class BlockEnforcer {
public:
  using RuleAddedListener = std::function<void(const BlockRule &)>;

  explicit BlockEnforcer(const Config::BlockingConfig &config);

  // Returns the id of the new or refreshed rule. Throws ValidationError for a
  // malformed rule or when the per-kind limit is reached.
  std::string add_rule(BlockRuleSpec spec, std::string reason = {},
                       std::string created_by = {});

  // False when no such rule exists
  bool remove_rule(BlockRuleKind kind, const std::string &key);
  bool remove_rule(const BlockRuleSpec &spec);
  bool remove_rule_by_id(const std::string &rule_id);

  BlockDecision evaluate(const LogEntry &entry) const;

  std::vector<BlockRule> list_rules() const;
  std::vector<BlockRule> list_rules(BlockRuleKind kind) const;
  size_t rule_count() const;

  // Called after a successful add, outside the rule lock
  void set_rule_added_listener(RuleAddedListener listener);

  static BlockRuleSpec normalize(BlockRuleSpec spec);

private:
  struct StoredRule {
    BlockRule rule;
    std::string key;
    std::optional<Utils::CIDRBlock> cidr;
  };

  bool matches(const StoredRule &stored, const LogEntry &entry,
               uint32_t entry_ipv4) const;
  static bool endpoint_matches(const EndpointRule &rule,
                               const LogEntry &entry);
  static bool pattern_matches(const PatternRule &rule, const LogEntry &entry);
  static void validate(const BlockRuleSpec &spec);

  // Requires the exclusive lock
  bool erase_locked(BlockRuleKind kind, const std::string &key);
  void update_rule_gauge_locked();

  Config::BlockingConfig config_;
  mutable std::shared_mutex rules_mutex_;
  std::array<std::vector<StoredRule>, BLOCK_RULE_KIND_COUNT> rules_;
  std::array<std::unordered_set<std::string>, BLOCK_RULE_KIND_COUNT> keys_;
  std::atomic<uint64_t> next_rule_id_{1};

  std::mutex listener_mutex_;
  RuleAddedListener rule_added_listener_;

  prometheus::Gauge &rules_gauge_;
  std::array<prometheus::Counter *, BLOCK_RULE_KIND_COUNT> denied_counters_;
};

#endif // BLOCK_ENFORCER_HPP
