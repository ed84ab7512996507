#pragma once

#include "llmshield/common/result.hpp"
#include "llmshield/guard/options.hpp"
#include "llmshield/rules/rule_engine.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace llmshield::guard {

// JSON document {thresholds, validators, custom_rules}. Rules carry their full schema;
// priority and replacement may be absent when reading.
struct GuardRecord {
  ThresholdTable thresholds;
  std::vector<std::string> validators;
  std::vector<rules::CustomRuleSpec> custom_rules;
};

[[nodiscard]] std::string serialize_record(const GuardRecord &record);
[[nodiscard]] common::Result<GuardRecord> parse_record(const std::string &json);

[[nodiscard]] common::Status save_record(const std::filesystem::path &path,
                                         const GuardRecord &record);
[[nodiscard]] common::Result<GuardRecord> load_record(const std::filesystem::path &path);

} // namespace llmshield::guard
