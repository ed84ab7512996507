#include "llmshield/validators/prompt_injection.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/common/json_util.hpp"
#include "llmshield/common/regex_scan.hpp"

#include <algorithm>
#include <sstream>

namespace llmshield::validators {

namespace {

constexpr double kKnownJailbreakScore = 0.95;
constexpr double kRoleMarkerScore = 0.7;
constexpr std::size_t kRoleMarkerMinimum = 3;

void note_technique(InjectionAnalysis &analysis, const std::string &technique) {
  if (std::find(analysis.techniques_detected.begin(), analysis.techniques_detected.end(),
                technique) == analysis.techniques_detected.end()) {
    analysis.techniques_detected.push_back(technique);
  }
}

std::string detections_to_json(const std::vector<InjectionDetection> &detections) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < detections.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "{\"technique\":" << common::json_quote(detections[i].technique)
        << ",\"evidence\":" << common::json_quote(detections[i].evidence)
        << ",\"risk_score\":" << format_score(detections[i].risk_score) << "}";
  }
  out << "]";
  return out.str();
}

std::string names_to_json(const std::vector<std::string> &names) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << common::json_quote(names[i]);
  }
  out << "]";
  return out.str();
}

} // namespace

PromptInjectionValidator::PromptInjectionValidator() {
  const auto compile = [](std::initializer_list<const char *> sources) {
    std::vector<std::pair<std::regex, std::string>> out;
    for (const char *source : sources) {
      out.emplace_back(std::regex(source), source);
    }
    return out;
  };

  // Patterns run against the lower-cased text.
  techniques_.push_back(Technique{
      .name = "instruction_override",
      .risk_score = 0.9,
      .description = "Attempting to override system instructions",
      .patterns = compile({
          R"(ignore\s+(previous|prior|all|above)\s+(instructions?|commands?|prompts?))",
          R"(disregard\s+(previous|prior|all|above)\s+(instructions?|commands?|prompts?))",
          R"(forget\s+(everything|all|what)\s+(i|you|we)?\s*(said|told))",
          R"(new\s+instructions?:)",
          R"(override\s+instructions?)",
      })});
  techniques_.push_back(Technique{
      .name = "role_play",
      .risk_score = 0.85,
      .description = "Attempting role-play manipulation",
      .patterns = compile({
          R"(you\s+are\s+now\s+(a|an|the|going))",
          R"(pretend\s+(you\s+are|you're|to\s+be))",
          R"(act\s+as\s+(if\s+you\s+are|a|an))",
          R"(from\s+now\s+on\s+you\s+(are|will|must))",
          R"(dan\s*(mode|prompt|jailbreak))",
          R"(do\s+anything\s+now)",
          R"(developer\s+mode)",
      })});
  techniques_.push_back(Technique{
      .name = "system_prompt_extraction",
      .risk_score = 0.75,
      .description = "Attempting to extract system information",
      .patterns = compile({
          R"((what|show|tell|display|reveal)\s+(me\s+)?(your|the)\s+system\s+prompt)",
          R"((what|show|tell|display|reveal)\s+(me\s+)?(your|the)\s+instructions?)",
          R"(repeat\s+(your|the)\s+(system\s+)?instructions?)",
          R"(show\s+me\s+your\s+source\s+code)",
          R"(reveal\s+your\s+true\s+purpose)",
          R"(tell\s+me\s+your\s+constraints)",
      })});

  known_jailbreaks_ = {"do anything now",  "dan mode",             "developer mode enabled",
                       "jailbreak prompt", "hypothetical response", "opposite mode"};
  role_markers_ = {"system:", "user:", "assistant:", "###", "```", "[inst]", "[/inst]"};

  dan_style_ = std::regex(R"((do\s+anything\s+now|dan\s+mode|developer\s+mode))");
  unrestricted_role_ =
      std::regex(R"((you\s+are\s+now|pretend\s+you\s+are).*(no\s+restrictions|unlimited))");
  override_all_ = std::regex(R"(ignore\s+all\s+previous.*instructions)");
}

common::Result<InjectionAnalysis> PromptInjectionValidator::analyze(const std::string &text) const {
  InjectionAnalysis analysis;
  const std::string lowered = common::to_lower(text);

  try {
    for (const auto &technique : techniques_) {
      for (const auto &[regex, source] : technique.patterns) {
        if (!common::bounded_search(lowered, regex)) {
          continue;
        }
        ++analysis.total_patterns_matched;
        note_technique(analysis, technique.name);
        analysis.detections.push_back(InjectionDetection{
            .technique = technique.name, .evidence = source, .risk_score = technique.risk_score});
        analysis.score = std::max(analysis.score, technique.risk_score);
      }
    }
  } catch (const std::regex_error &e) {
    return common::Result<InjectionAnalysis>::failure(
        std::string("prompt injection pattern evaluation failed: ") + e.what(),
        common::ErrorCode::Validator);
  }

  for (const auto &phrase : known_jailbreaks_) {
    if (lowered.find(phrase) == std::string::npos) {
      continue;
    }
    analysis.known_jailbreak = true;
    analysis.score = std::max(analysis.score, kKnownJailbreakScore);
    note_technique(analysis, "known_jailbreak");
    analysis.detections.push_back(InjectionDetection{
        .technique = "known_jailbreak", .evidence = phrase, .risk_score = kKnownJailbreakScore});
  }

  const auto marker_count = static_cast<std::size_t>(
      std::count_if(role_markers_.begin(), role_markers_.end(), [&lowered](const std::string &m) {
        return lowered.find(m) != std::string::npos;
      }));
  if (marker_count >= kRoleMarkerMinimum) {
    analysis.score = std::max(analysis.score, kRoleMarkerScore);
    note_technique(analysis, "suspicious_tokens");
    analysis.detections.push_back(InjectionDetection{.technique = "suspicious_tokens",
                                                     .evidence = std::to_string(marker_count),
                                                     .risk_score = kRoleMarkerScore});
  }

  if (analysis.score > 0.5) {
    if (analysis.known_jailbreak) {
      analysis.reason = "Known jailbreak attempt detected";
    } else {
      const Technique *top = nullptr;
      for (const auto &technique : techniques_) {
        const bool detected =
            std::find(analysis.techniques_detected.begin(), analysis.techniques_detected.end(),
                      technique.name) != analysis.techniques_detected.end();
        if (detected && (top == nullptr || technique.risk_score > top->risk_score)) {
          top = &technique;
        }
      }
      analysis.reason =
          top != nullptr ? top->description : std::string("Suspicious patterns detected");
    }
  }

  return common::Result<InjectionAnalysis>::success(std::move(analysis));
}

common::Result<ValidationResult> PromptInjectionValidator::validate(const std::string &text) const {
  auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<ValidationResult>::failure_from(analysis);
  }
  const auto &a = analysis.value();

  ValidationResult result;
  result.score = a.score;
  result.reason = a.reason;
  result.set_json_attribute("techniques_detected", names_to_json(a.techniques_detected));
  result.attributes["total_patterns_matched"] = std::to_string(a.total_patterns_matched);
  result.set_json_attribute("detections", detections_to_json(a.detections));
  if (a.reason.has_value()) {
    result.attributes["reason"] = *a.reason;
  }
  return common::Result<ValidationResult>::success(std::move(result));
}

common::Result<JailbreakVerdict>
PromptInjectionValidator::detect_jailbreak(const std::string &text, const double threshold) const {
  const auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<JailbreakVerdict>::failure_from(analysis);
  }

  JailbreakVerdict verdict;
  double jailbreak_score = 0.0;
  const std::string lowered = common::to_lower(text);
  try {
    if (common::bounded_search(lowered, dan_style_)) {
      jailbreak_score = 0.95;
      verdict.technique = "DAN-style";
    } else if (common::bounded_search(lowered, unrestricted_role_)) {
      jailbreak_score = 0.9;
      verdict.technique = "Role-play manipulation";
    } else if (common::bounded_search(lowered, override_all_)) {
      jailbreak_score = 0.9;
      verdict.technique = "Instruction override";
    }
  } catch (const std::regex_error &e) {
    return common::Result<JailbreakVerdict>::failure(
        std::string("jailbreak pattern evaluation failed: ") + e.what(),
        common::ErrorCode::Validator);
  }

  verdict.score = std::max(analysis.value().score, jailbreak_score);
  verdict.is_jailbreak = verdict.score > threshold;
  return common::Result<JailbreakVerdict>::success(std::move(verdict));
}

common::Result<std::string> PromptInjectionValidator::explain(const std::string &text) const {
  const auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<std::string>::failure_from(analysis);
  }
  const auto &a = analysis.value();
  if (a.score < 0.3) {
    return common::Result<std::string>::success(
        "No prompt injection detected. The text appears to be a normal query.");
  }
  if (a.score < 0.5) {
    return common::Result<std::string>::success(
        "Low risk of prompt injection. Some patterns detected but likely benign.");
  }
  if (a.score < 0.7) {
    return common::Result<std::string>::success(
        "Moderate risk of prompt injection. " + a.reason.value_or("Suspicious patterns detected") +
        ".");
  }
  return common::Result<std::string>::success(
      "High risk of prompt injection. " +
      a.reason.value_or("Multiple injection techniques detected") + ".");
}

common::Result<std::vector<std::string>>
PromptInjectionValidator::techniques(const std::string &text) const {
  auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<std::vector<std::string>>::failure_from(analysis);
  }
  return common::Result<std::vector<std::string>>::success(
      std::move(analysis.value().techniques_detected));
}

} // namespace llmshield::validators
