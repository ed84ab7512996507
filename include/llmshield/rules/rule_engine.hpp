#pragma once

#include "llmshield/common/result.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace llmshield::rules {

enum class RuleAction {
  Block,
  Flag,
  Redact,
  Allow,
};

[[nodiscard]] std::string rule_action_name(RuleAction action);
[[nodiscard]] std::optional<RuleAction> parse_rule_action(std::string_view name);

struct CustomRuleSpec {
  std::string name;
  // ECMAScript syntax, matched case-insensitively.
  std::string pattern;
  RuleAction action = RuleAction::Block;
  std::string message;
  int priority = 0;
  // Redact rules only; "[REDACTED]" when unset.
  std::optional<std::string> replacement;
};

struct TriggeredRule {
  std::string name;
  RuleAction action = RuleAction::Block;
  std::string message;
  int priority = 0;
};

// Outcome of the block/allow precedence over one evaluation.
struct RuleVerdict {
  bool blocked = false;
  std::optional<std::string> allowed_by;
  // Messages of triggered block rules, highest priority first.
  std::vector<std::string> block_messages;
  std::vector<std::string> flags;
  bool redact = false;
};

// Highest triggered block/allow priority decides; equal priority resolves to block.
[[nodiscard]] RuleVerdict resolve_precedence(const std::vector<TriggeredRule> &triggered);

class RuleEngine {
public:
  RuleEngine() = default;

  // Empty or duplicate name is a Configuration error, a bad pattern RuleCompilation.
  // The rule list is unchanged on failure.
  [[nodiscard]] common::Status add_rule(CustomRuleSpec spec);
  bool remove_rule(const std::string &name);
  [[nodiscard]] bool contains(const std::string &name) const;

  // Ordered by descending priority, ties in insertion order.
  [[nodiscard]] common::Result<std::vector<TriggeredRule>> evaluate(const std::string &text) const;
  [[nodiscard]] common::Result<std::string> redact(const std::string &text) const;

  [[nodiscard]] std::vector<CustomRuleSpec> rules() const;
  [[nodiscard]] std::size_t size() const;
  void clear();

private:
  struct CompiledRule {
    CustomRuleSpec spec;
    std::shared_ptr<const std::regex> regex;
  };

  [[nodiscard]] std::vector<CompiledRule> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<CompiledRule> rules_;
};

} // namespace llmshield::rules
