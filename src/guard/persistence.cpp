#include "llmshield/guard/persistence.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/common/json_util.hpp"
#include "llmshield/validators/validator.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace llmshield::guard {

namespace {

using common::ErrorCode;

bool value_is_string(const std::string &object_json, const std::string &key) {
  const auto key_pos = common::json_find_key(object_json, key);
  if (key_pos == std::string::npos) {
    return false;
  }
  const auto colon = object_json.find(':', key_pos + key.size() + 2);
  if (colon == std::string::npos) {
    return false;
  }
  const auto pos = common::json_skip_ws(object_json, colon + 1);
  return pos < object_json.size() && object_json[pos] == '"';
}

common::Result<rules::CustomRuleSpec> parse_rule(const std::string &object_json,
                                                 const std::size_t index) {
  using ResultT = common::Result<rules::CustomRuleSpec>;
  const auto fields = common::json_parse_flat(object_json);
  const std::string where = "custom_rules[" + std::to_string(index) + "]";

  rules::CustomRuleSpec spec;
  const auto name_it = fields.find("name");
  const auto pattern_it = fields.find("pattern");
  if (name_it == fields.end() || pattern_it == fields.end()) {
    return ResultT::failure(where + " requires name and pattern", ErrorCode::Persistence);
  }
  spec.name = name_it->second;
  spec.pattern = pattern_it->second;

  if (const auto it = fields.find("action"); it != fields.end()) {
    const auto action = rules::parse_rule_action(it->second);
    if (!action.has_value()) {
      return ResultT::failure(where + " has unknown action '" + it->second + "'",
                              ErrorCode::Persistence);
    }
    spec.action = *action;
  }
  if (const auto it = fields.find("message"); it != fields.end()) {
    spec.message = it->second;
  }
  if (const auto it = fields.find("priority"); it != fields.end() && it->second != "null") {
    const std::string raw = common::trim(it->second);
    int priority = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), priority);
    if (ec != std::errc() || ptr != raw.data() + raw.size()) {
      return ResultT::failure(where + " has a non-integer priority", ErrorCode::Persistence);
    }
    spec.priority = priority;
  }
  if (const auto it = fields.find("replacement");
      it != fields.end() && value_is_string(object_json, "replacement")) {
    spec.replacement = it->second;
  }
  return ResultT::success(std::move(spec));
}

} // namespace

std::string serialize_record(const GuardRecord &record) {
  std::ostringstream out;
  out << "{\n  \"thresholds\": {";
  bool first = true;
  for (const auto &[key, value] : record.thresholds) {
    out << (first ? "\n" : ",\n") << "    " << common::json_quote(key) << ": "
        << validators::format_score(value);
    first = false;
  }
  out << (record.thresholds.empty() ? "}" : "\n  }");

  out << ",\n  \"validators\": [";
  for (std::size_t i = 0; i < record.validators.size(); ++i) {
    out << (i > 0 ? ", " : "") << common::json_quote(record.validators[i]);
  }
  out << "]";

  out << ",\n  \"custom_rules\": [";
  for (std::size_t i = 0; i < record.custom_rules.size(); ++i) {
    const auto &rule = record.custom_rules[i];
    out << (i > 0 ? ",\n" : "\n") << "    {\n";
    out << "      \"name\": " << common::json_quote(rule.name) << ",\n";
    out << "      \"pattern\": " << common::json_quote(rule.pattern) << ",\n";
    out << "      \"action\": " << common::json_quote(rules::rule_action_name(rule.action))
        << ",\n";
    out << "      \"message\": " << common::json_quote(rule.message) << ",\n";
    out << "      \"priority\": " << rule.priority << ",\n";
    out << "      \"replacement\": "
        << (rule.replacement.has_value() ? common::json_quote(*rule.replacement) : "null")
        << "\n    }";
  }
  out << (record.custom_rules.empty() ? "]" : "\n  ]");
  out << "\n}\n";
  return out.str();
}

common::Result<GuardRecord> parse_record(const std::string &json) {
  using ResultT = common::Result<GuardRecord>;
  if (!common::json_is_object(json)) {
    return ResultT::failure("rule record is not a JSON object", ErrorCode::Persistence);
  }

  GuardRecord record;
  const std::string thresholds_json = common::json_get_object(json, "thresholds");
  if (!thresholds_json.empty()) {
    for (const auto &[key, raw] : common::json_parse_flat(thresholds_json)) {
      const std::string value = common::trim(raw);
      char *end = nullptr;
      const double parsed = std::strtod(value.c_str(), &end);
      if (value.empty() || end != value.c_str() + value.size()) {
        return ResultT::failure("threshold '" + key + "' is not a number",
                                ErrorCode::Persistence);
      }
      record.thresholds[key] = parsed;
    }
  }

  record.validators = common::json_get_string_array(json, "validators");

  const std::string rules_json = common::json_get_array(json, "custom_rules");
  if (!rules_json.empty()) {
    const auto objects = common::json_split_top_level_objects(rules_json);
    for (std::size_t i = 0; i < objects.size(); ++i) {
      auto rule = parse_rule(objects[i], i);
      if (!rule.ok()) {
        return ResultT::failure_from(rule);
      }
      record.custom_rules.push_back(std::move(rule.value()));
    }
  }

  return ResultT::success(std::move(record));
}

common::Status save_record(const std::filesystem::path &path, const GuardRecord &record) {
  const auto status = common::write_file_atomic(path, serialize_record(record));
  if (!status.ok()) {
    return common::Status::error(status.error(), ErrorCode::Persistence);
  }
  return status;
}

common::Result<GuardRecord> load_record(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<GuardRecord>::failure(content.error(), ErrorCode::Persistence);
  }
  auto record = parse_record(content.value());
  if (!record.ok()) {
    return common::Result<GuardRecord>::failure(path.string() + ": " + record.error(),
                                                record.code());
  }
  return record;
}

} // namespace llmshield::guard
