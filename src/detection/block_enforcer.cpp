#include "block_enforcer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>

namespace {

bool has_wildcard(std::string_view pattern) {
  return pattern.find_first_of("*?") != std::string_view::npos;
}

bool starts_with_ci(std::string_view subject, std::string_view prefix) {
  return subject.size() >= prefix.size() &&
         Utils::iequals(subject.substr(0, prefix.size()), prefix);
}

bool value_matches(std::string_view rule_value, std::string_view subject) {
  if (has_wildcard(rule_value))
    return Utils::glob_match(rule_value, subject);
  return Utils::contains_ci(subject, rule_value);
}

bool is_valid_pattern_field(const std::string &field) {
  if (field == "user_agent" || field == "path" || field == "query" ||
      field == "method" || field == "body" || field == "header")
    return true;
  return field.rfind("header:", 0) == 0 && field.size() > 7;
}

bool looks_like_ipv6(std::string_view value) {
  if (value.find(':') == std::string_view::npos)
    return false;
  return std::all_of(value.begin(), value.end(), [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.';
  });
}

} // namespace

BlockEnforcer::BlockEnforcer(const Config::BlockingConfig &config)
    : config_(config),
      rules_gauge_(MetricsRegistry::instance().create_gauge(
          "tm_block_rules_active", "Block rules currently active")) {
  for (size_t i = 0; i < BLOCK_RULE_KIND_COUNT; ++i)
    denied_counters_[i] = &MetricsRegistry::instance().create_counter(
        "tm_denied_entries_total", "Entries denied by a block rule",
        {{"kind", block_rule_kind_to_string(static_cast<BlockRuleKind>(i))}});
}

BlockRuleSpec BlockEnforcer::normalize(BlockRuleSpec spec) {
  if (auto *ip = std::get_if<IpRule>(&spec)) {
    ip->value = Utils::to_lower_copy(Utils::trim_copy(ip->value));
  } else if (auto *endpoint = std::get_if<EndpointRule>(&spec)) {
    endpoint->method = Utils::to_upper_copy(Utils::trim_copy(endpoint->method));
    if (endpoint->method.empty())
      endpoint->method = "ALL";
    endpoint->pattern = Utils::trim_copy(endpoint->pattern);
  } else {
    auto &pattern = std::get<PatternRule>(spec);
    pattern.field = Utils::to_lower_copy(Utils::trim_copy(pattern.field));
  }
  return spec;
}

void BlockEnforcer::validate(const BlockRuleSpec &spec) {
  if (const auto *ip = std::get_if<IpRule>(&spec)) {
    if (ip->value.empty())
      throw ValidationError("ip rule requires a value");
    if (!Utils::parse_cidr(ip->value) && !looks_like_ipv6(ip->value))
      throw ValidationError("ip rule value is not an address or CIDR block: " +
                            ip->value);
  } else if (const auto *endpoint = std::get_if<EndpointRule>(&spec)) {
    if (endpoint->pattern.empty())
      throw ValidationError("endpoint rule requires a pattern");
    if (endpoint->pattern[0] != '/' && endpoint->pattern[0] != '*')
      throw ValidationError("endpoint pattern must start with '/' or '*'");
    if (!std::all_of(endpoint->method.begin(), endpoint->method.end(),
                     [](char c) { return std::isupper(static_cast<unsigned char>(c)); }))
      throw ValidationError("endpoint method must be an HTTP method or ALL");
  } else {
    const auto &pattern = std::get<PatternRule>(spec);
    if (!is_valid_pattern_field(pattern.field))
      throw ValidationError("pattern rule field is not supported: " +
                            pattern.field);
    if (pattern.value.empty())
      throw ValidationError("pattern rule requires a value");
  }
}

std::string BlockEnforcer::add_rule(BlockRuleSpec spec, std::string reason,
                                    std::string created_by) {
  spec = normalize(std::move(spec));
  validate(spec);

  const BlockRuleKind kind = kind_of(spec);
  const size_t slot = static_cast<size_t>(kind);
  const std::string key = rule_key(spec);
  const uint64_t now_ms = Utils::get_current_time_ms();

  BlockRule added;
  bool refreshed = false;
  {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    auto &bucket = rules_[slot];

    if (keys_[slot].count(key)) {
      auto it = std::find_if(bucket.begin(), bucket.end(),
                             [&](const StoredRule &s) { return s.key == key; });
      if (it == bucket.end())
        throw InvariantViolation("block rule key index out of sync for " + key);

      // Re-adding keeps the original position and id
      it->rule.reason = std::move(reason);
      it->rule.created_by = std::move(created_by);
      it->rule.created_at_ms = now_ms;
      added = it->rule;
      refreshed = true;
    } else {
      if (bucket.size() >= config_.max_rules_per_kind)
        throw ValidationError(std::string("rule limit reached for kind ") +
                              block_rule_kind_to_string(kind));

      StoredRule stored;
      stored.rule.id = "rule-" + std::to_string(next_rule_id_++);
      stored.rule.spec = std::move(spec);
      stored.rule.reason = std::move(reason);
      stored.rule.created_by = std::move(created_by);
      stored.rule.created_at_ms = now_ms;
      stored.key = key;
      if (kind == BlockRuleKind::IP)
        stored.cidr = Utils::parse_cidr(std::get<IpRule>(stored.rule.spec).value);

      added = stored.rule;
      bucket.push_back(std::move(stored));
      keys_[slot].insert(key);
      update_rule_gauge_locked();
    }
  }

  LOG(LogLevel::INFO, LogComponent::RULES_BLOCK,
      (refreshed ? "Refreshed " : "Added ")
          << block_rule_kind_to_string(kind) << " rule " << added.id << " ["
          << key << "]");

  RuleAddedListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = rule_added_listener_;
  }
  if (listener)
    listener(added);

  return added.id;
}

bool BlockEnforcer::erase_locked(BlockRuleKind kind, const std::string &key) {
  const size_t slot = static_cast<size_t>(kind);
  if (!keys_[slot].count(key))
    return false;

  auto &bucket = rules_[slot];
  auto it = std::find_if(bucket.begin(), bucket.end(),
                         [&](const StoredRule &s) { return s.key == key; });
  if (it == bucket.end())
    throw InvariantViolation("block rule key index out of sync for " + key);

  bucket.erase(it);
  keys_[slot].erase(key);
  update_rule_gauge_locked();
  return true;
}

bool BlockEnforcer::remove_rule(BlockRuleKind kind, const std::string &key) {
  bool removed;
  {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    removed = erase_locked(kind, key);
  }

  if (removed)
    LOG(LogLevel::INFO, LogComponent::RULES_BLOCK,
        "Removed " << block_rule_kind_to_string(kind) << " rule [" << key
                   << "]");
  else
    LOG(LogLevel::DEBUG, LogComponent::RULES_BLOCK,
        "No " << block_rule_kind_to_string(kind) << " rule [" << key
              << "] to remove");
  return removed;
}

bool BlockEnforcer::remove_rule(const BlockRuleSpec &spec) {
  BlockRuleSpec normalized = normalize(spec);
  return remove_rule(kind_of(normalized), rule_key(normalized));
}

bool BlockEnforcer::remove_rule_by_id(const std::string &rule_id) {
  std::optional<std::pair<BlockRuleKind, std::string>> target;
  {
    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    for (size_t slot = 0; slot < BLOCK_RULE_KIND_COUNT && !target; ++slot)
      for (const auto &stored : rules_[slot])
        if (stored.rule.id == rule_id) {
          target.emplace(static_cast<BlockRuleKind>(slot), stored.key);
          break;
        }
  }
  if (!target)
    return false;
  return remove_rule(target->first, target->second);
}

BlockDecision BlockEnforcer::evaluate(const LogEntry &entry) const {
  if (!config_.enabled)
    return BlockDecision::allow();

  const uint32_t entry_ipv4 = Utils::ip_string_to_uint32(entry.source_ip);

  std::shared_lock<std::shared_mutex> lock(rules_mutex_);
  // Kind order is the array order: IP, endpoint, pattern
  for (size_t slot = 0; slot < BLOCK_RULE_KIND_COUNT; ++slot)
    for (const auto &stored : rules_[slot])
      if (matches(stored, entry, entry_ipv4)) {
        denied_counters_[slot]->Increment();
        LOG(LogLevel::DEBUG, LogComponent::RULES_BLOCK,
            "Denied " << entry.id << " from " << entry.source_ip << " by rule "
                      << stored.rule.id);
        return BlockDecision::deny(stored.rule);
      }
  return BlockDecision::allow();
}

bool BlockEnforcer::matches(const StoredRule &stored, const LogEntry &entry,
                            uint32_t entry_ipv4) const {
  if (const auto *ip = std::get_if<IpRule>(&stored.rule.spec)) {
    if (stored.cidr)
      return entry_ipv4 != 0 && stored.cidr->contains(entry_ipv4);
    return Utils::iequals(ip->value, entry.source_ip);
  }
  if (const auto *endpoint = std::get_if<EndpointRule>(&stored.rule.spec))
    return endpoint_matches(*endpoint, entry);
  return pattern_matches(std::get<PatternRule>(stored.rule.spec), entry);
}

bool BlockEnforcer::endpoint_matches(const EndpointRule &rule,
                                     const LogEntry &entry) {
  if (rule.method != "ALL" && !Utils::iequals(rule.method, entry.method))
    return false;

  const std::string &pattern = rule.pattern;
  if (pattern.find_first_of("*?") == std::string::npos)
    return starts_with_ci(entry.path, pattern);

  // A wildcard pattern covers the paths it matches and everything below them
  if (Utils::glob_match(pattern, entry.path) ||
      Utils::glob_match(pattern + "*", entry.path))
    return true;

  // "/admin/*" also covers "/admin" itself
  if (pattern.size() > 2 && pattern.compare(pattern.size() - 2, 2, "/*") == 0)
    return Utils::glob_match(std::string_view(pattern).substr(0, pattern.size() - 2),
                             entry.path);
  return false;
}

bool BlockEnforcer::pattern_matches(const PatternRule &rule,
                                    const LogEntry &entry) {
  const std::string &field = rule.field;
  if (field == "user_agent")
    return value_matches(rule.value, entry.user_agent());
  if (field == "path")
    return value_matches(rule.value, entry.path);
  if (field == "query")
    return value_matches(rule.value, entry.query);
  if (field == "method")
    return value_matches(rule.value, entry.method);
  if (field == "body")
    return value_matches(rule.value, entry.request_body.data);
  if (field == "header") {
    for (const auto &header : entry.request_headers)
      if (value_matches(rule.value, header.second))
        return true;
    return false;
  }
  // header:<name>
  auto header_value = entry.find_request_header(field.substr(7));
  return header_value && value_matches(rule.value, *header_value);
}

std::vector<BlockRule> BlockEnforcer::list_rules() const {
  std::shared_lock<std::shared_mutex> lock(rules_mutex_);
  std::vector<BlockRule> rules;
  for (const auto &bucket : rules_)
    for (const auto &stored : bucket)
      rules.push_back(stored.rule);
  return rules;
}

std::vector<BlockRule> BlockEnforcer::list_rules(BlockRuleKind kind) const {
  std::shared_lock<std::shared_mutex> lock(rules_mutex_);
  std::vector<BlockRule> rules;
  for (const auto &stored : rules_[static_cast<size_t>(kind)])
    rules.push_back(stored.rule);
  return rules;
}

size_t BlockEnforcer::rule_count() const {
  std::shared_lock<std::shared_mutex> lock(rules_mutex_);
  size_t total = 0;
  for (const auto &bucket : rules_)
    total += bucket.size();
  return total;
}

void BlockEnforcer::set_rule_added_listener(RuleAddedListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  rule_added_listener_ = std::move(listener);
}

void BlockEnforcer::update_rule_gauge_locked() {
  size_t total = 0;
  for (const auto &bucket : rules_)
    total += bucket.size();
  rules_gauge_.Set(static_cast<double>(total));
}
