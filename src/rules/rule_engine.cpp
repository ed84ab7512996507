#include "llmshield/rules/rule_engine.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/common/regex_scan.hpp"

#include <algorithm>

namespace llmshield::rules {

namespace {

constexpr const char *kDefaultReplacement = "[REDACTED]";

bool higher_priority(const int left, const int right) { return left > right; }

} // namespace

std::string rule_action_name(const RuleAction action) {
  switch (action) {
  case RuleAction::Block:
    return "block";
  case RuleAction::Flag:
    return "flag";
  case RuleAction::Redact:
    return "redact";
  case RuleAction::Allow:
    return "allow";
  }
  return "block";
}

std::optional<RuleAction> parse_rule_action(const std::string_view name) {
  const std::string normalized = common::to_lower(common::trim(std::string(name)));
  if (normalized == "block") {
    return RuleAction::Block;
  }
  if (normalized == "flag") {
    return RuleAction::Flag;
  }
  if (normalized == "redact") {
    return RuleAction::Redact;
  }
  if (normalized == "allow") {
    return RuleAction::Allow;
  }
  return std::nullopt;
}

RuleVerdict resolve_precedence(const std::vector<TriggeredRule> &triggered) {
  RuleVerdict verdict;
  std::optional<int> top_block;
  std::optional<int> top_allow;
  std::string allow_name;

  for (const auto &rule : triggered) {
    switch (rule.action) {
    case RuleAction::Block:
      verdict.block_messages.push_back(rule.message);
      if (!top_block.has_value() || rule.priority > *top_block) {
        top_block = rule.priority;
      }
      break;
    case RuleAction::Allow:
      if (!top_allow.has_value() || rule.priority > *top_allow) {
        top_allow = rule.priority;
        allow_name = rule.name;
      }
      break;
    case RuleAction::Flag:
      verdict.flags.push_back(rule.message);
      break;
    case RuleAction::Redact:
      verdict.redact = true;
      break;
    }
  }

  if (top_allow.has_value() && (!top_block.has_value() || *top_allow > *top_block)) {
    verdict.allowed_by = allow_name;
    verdict.block_messages.clear();
    return verdict;
  }
  verdict.blocked = top_block.has_value();
  return verdict;
}

common::Status RuleEngine::add_rule(CustomRuleSpec spec) {
  if (common::trim(spec.name).empty()) {
    return common::Status::error("rule name must not be empty");
  }

  std::shared_ptr<const std::regex> compiled;
  try {
    compiled = std::make_shared<const std::regex>(spec.pattern,
                                                  std::regex::ECMAScript | std::regex::icase);
  } catch (const std::regex_error &e) {
    return common::Status::error("invalid pattern for rule '" + spec.name + "': " + e.what(),
                                 common::ErrorCode::RuleCompilation);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const bool duplicate = std::any_of(rules_.begin(), rules_.end(), [&spec](const CompiledRule &r) {
    return r.spec.name == spec.name;
  });
  if (duplicate) {
    return common::Status::error("rule '" + spec.name + "' already exists");
  }
  rules_.push_back(CompiledRule{.spec = std::move(spec), .regex = std::move(compiled)});
  return common::Status::success();
}

bool RuleEngine::remove_rule(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::find_if(rules_.begin(), rules_.end(),
                               [&name](const CompiledRule &r) { return r.spec.name == name; });
  if (it == rules_.end()) {
    return false;
  }
  rules_.erase(it);
  return true;
}

bool RuleEngine::contains(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(rules_.begin(), rules_.end(),
                     [&name](const CompiledRule &r) { return r.spec.name == name; });
}

std::vector<RuleEngine::CompiledRule> RuleEngine::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rules_;
}

common::Result<std::vector<TriggeredRule>> RuleEngine::evaluate(const std::string &text) const {
  const auto current = snapshot();
  std::vector<TriggeredRule> triggered;
  for (const auto &rule : current) {
    try {
      if (!common::bounded_search(text, *rule.regex)) {
        continue;
      }
    } catch (const std::regex_error &e) {
      return common::Result<std::vector<TriggeredRule>>::failure(
          "rule '" + rule.spec.name + "' evaluation failed: " + e.what(),
          common::ErrorCode::Validator);
    }
    triggered.push_back(TriggeredRule{.name = rule.spec.name,
                                      .action = rule.spec.action,
                                      .message = rule.spec.message,
                                      .priority = rule.spec.priority});
  }

  std::stable_sort(triggered.begin(), triggered.end(),
                   [](const TriggeredRule &a, const TriggeredRule &b) {
                     return higher_priority(a.priority, b.priority);
                   });
  return common::Result<std::vector<TriggeredRule>>::success(std::move(triggered));
}

common::Result<std::string> RuleEngine::redact(const std::string &text) const {
  auto current = snapshot();
  std::stable_sort(current.begin(), current.end(),
                   [](const CompiledRule &a, const CompiledRule &b) {
                     return higher_priority(a.spec.priority, b.spec.priority);
                   });

  std::string output = text;
  for (const auto &rule : current) {
    if (rule.spec.action != RuleAction::Redact) {
      continue;
    }
    try {
      output = common::bounded_replace(output, *rule.regex,
                                       rule.spec.replacement.value_or(kDefaultReplacement));
    } catch (const std::regex_error &e) {
      return common::Result<std::string>::failure(
          "rule '" + rule.spec.name + "' redaction failed: " + e.what(),
          common::ErrorCode::Validator);
    }
  }
  return common::Result<std::string>::success(std::move(output));
}

std::vector<CustomRuleSpec> RuleEngine::rules() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<CustomRuleSpec> out;
  out.reserve(rules_.size());
  for (const auto &rule : rules_) {
    out.push_back(rule.spec);
  }
  return out;
}

std::size_t RuleEngine::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rules_.size();
}

void RuleEngine::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  rules_.clear();
}

} // namespace llmshield::rules
