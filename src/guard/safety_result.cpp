#include "llmshield/guard/safety_result.hpp"

#include "llmshield/common/json_util.hpp"

#include <sstream>

namespace llmshield::guard {

namespace {

void write_optional(std::ostringstream &out, const std::optional<std::string> &value) {
  if (value.has_value()) {
    out << common::json_quote(*value);
  } else {
    out << "null";
  }
}

void write_strings(std::ostringstream &out, const std::vector<std::string> &values) {
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << common::json_quote(values[i]);
  }
  out << "]";
}

} // namespace

std::string to_json(const SafetyResult &result) {
  std::ostringstream out;
  out << "{\"is_safe\":" << (result.is_safe ? "true" : "false") << ",\"reason\":";
  write_optional(out, result.reason);
  out << ",\"latency_ms\":" << validators::format_score(result.latency_ms);

  out << ",\"triggered_checks\":";
  write_strings(out, result.triggered_checks);

  out << ",\"triggered_rules\":[";
  for (std::size_t i = 0; i < result.triggered_rules.size(); ++i) {
    const auto &rule = result.triggered_rules[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"name\":" << common::json_quote(rule.name)
        << ",\"action\":" << common::json_quote(rules::rule_action_name(rule.action))
        << ",\"priority\":" << rule.priority << ",\"message\":" << common::json_quote(rule.message)
        << "}";
  }
  out << "]";

  out << ",\"flags\":";
  write_strings(out, result.flags);
  out << ",\"allowed_by\":";
  write_optional(out, result.allowed_by);
  out << ",\"redacted_text\":";
  write_optional(out, result.redacted_text);

  if (!result.scores.empty()) {
    out << ",\"scores\":{";
    bool first = true;
    for (const auto &[name, score] : result.scores) {
      if (!first) {
        out << ",";
      }
      first = false;
      out << common::json_quote(name) << ":" << validators::format_score(score);
    }
    out << "}";
  }

  if (!result.details.empty()) {
    out << ",\"details\":{";
    bool first_check = true;
    for (const auto &[name, detail] : result.details) {
      if (!first_check) {
        out << ",";
      }
      first_check = false;
      out << common::json_quote(name) << ":{";
      bool first_attr = true;
      for (const auto &[key, value] : detail.attributes) {
        if (!first_attr) {
          out << ",";
        }
        first_attr = false;
        out << common::json_quote(key) << ":"
            << (detail.json_attributes.contains(key) ? value : common::json_quote(value));
      }
      out << "}";
    }
    out << "}";
  }

  out << "}";
  return out.str();
}

} // namespace llmshield::guard
