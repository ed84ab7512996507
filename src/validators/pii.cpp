#include "llmshield/validators/pii.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/common/json_util.hpp"
#include "llmshield/common/regex_scan.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <set>
#include <sstream>

namespace llmshield::validators {

namespace {

constexpr auto kIgnoreCase = std::regex::ECMAScript | std::regex::icase;
constexpr std::size_t kMaxFindings = 10;
constexpr std::size_t kReasonTypeLimit = 3;
constexpr double kNameRiskFloor = 0.6;
constexpr double kMultiTypeMultiplier = 1.2;
constexpr const char *kNamesType = "potential_names";

PiiPatternEntry make_entry(std::string type, const char *pattern, double risk, std::string label,
                           std::string description, std::vector<std::string> context = {},
                           bool ignore_case = false) {
  PiiPatternEntry entry;
  entry.type = std::move(type);
  entry.regex = ignore_case ? std::regex(pattern, kIgnoreCase) : std::regex(pattern);
  entry.risk_score = risk;
  entry.redact_label = std::move(label);
  entry.description = std::move(description);
  entry.context_required = std::move(context);
  return entry;
}

std::string format_fixed(double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

std::string findings_to_json(const std::vector<PiiFinding> &findings) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < findings.size(); ++i) {
    const auto &f = findings[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"type\":" << common::json_quote(f.type)
        << ",\"value\":" << common::json_quote(f.masked_value) << ",\"position\":[" << f.start
        << "," << f.end << "],\"risk_score\":" << format_score(f.risk_score)
        << ",\"description\":" << common::json_quote(f.description) << "}";
  }
  out << "]";
  return out.str();
}

std::string counts_to_json(const std::vector<std::pair<std::string, std::size_t>> &counts) {
  std::ostringstream out;
  out << "{";
  for (std::size_t i = 0; i < counts.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << common::json_quote(counts[i].first) << ":" << counts[i].second;
  }
  out << "}";
  return out.str();
}

} // namespace

PiiValidator::PiiValidator() {
  entries_.push_back(make_entry("ssn", R"(\b\d{3}-\d{2}-\d{4}\b|\b\d{9}\b)", 1.0, "[SSN]",
                                "Social Security Number"));
  auto card = make_entry("credit_card", R"(\b(?:\d{4}[\s-]?){3}\d{4}\b)", 1.0, "[CREDIT_CARD]",
                         "Credit Card Number");
  card.checksum = &PiiValidator::luhn_valid;
  entries_.push_back(std::move(card));
  entries_.push_back(make_entry("email", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)",
                                0.7, "[EMAIL]", "Email Address"));
  entries_.push_back(make_entry(
      "phone",
      R"((\+?1?\s?)?(\(\d{3}\)|\d{3})[\s.-]?\d{3}[\s.-]?\d{4}(?:\s?(?:ext|x|extension)\s?\d{1,5})?)",
      0.8, "[PHONE]", "Phone Number"));
  entries_.push_back(make_entry("ip_address",
                                R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3})"
                                R"((?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)",
                                0.6, "[IP_ADDRESS]", "IP Address"));
  entries_.push_back(make_entry("date_of_birth",
                                R"(\b(?:DOB|Date of Birth|Born|Birthday)[\s:]*)"
                                R"((?:\d{1,2}[-/]\d{1,2}[-/]\d{2,4}|\d{4}[-/]\d{1,2}[-/]\d{1,2}))",
                                0.9, "[DATE_OF_BIRTH]", "Date of Birth"));
  entries_.push_back(
      make_entry("passport", R"(\b[A-Z]{1,2}\d{6,9}\b)", 1.0, "[PASSPORT]", "Passport Number"));
  entries_.push_back(make_entry("driver_license", R"(\b[A-Z]{1,2}\d{5,8}\b)", 0.9,
                                "[DRIVER_LICENSE]", "Driver License", {"license", "dl", "driver"}));
  entries_.push_back(make_entry("bank_account", R"(\b\d{8,17}\b)", 0.9, "[BANK_ACCOUNT]",
                                "Bank Account Number", {"account", "bank", "routing"}));
  entries_.push_back(make_entry(
      "address",
      R"(\b\d{1,5}\s+[A-Za-z\s]{1,50}(?:Street|St|Avenue|Ave|Road|Rd|Lane|Ln|Drive|Dr|Court|Ct|Boulevard|Blvd)\b)",
      0.7, "[ADDRESS]", "Physical Address", {}, true));
  entries_.push_back(make_entry("zipcode", R"(\b\d{5}(?:-\d{4})?\b)", 0.4, "[ZIPCODE]", "ZIP Code",
                                {"zip", "postal", "code"}));
  entries_.push_back(make_entry("medical_record", R"(\bMRN[\s:]?\d{6,10}\b)", 1.0,
                                "[MEDICAL_RECORD]", "Medical Record Number", {}, true));
  entries_.push_back(make_entry("insurance_id",
                                R"(\b(?:Policy|Member|Insurance)[\s#:]+[A-Z0-9]{6,}\b)", 0.9,
                                "[INSURANCE_ID]", "Insurance ID", {}, true));
  entries_.push_back(make_entry("routing_number", R"(\b\d{9}\b)", 0.8, "[ROUTING_NUMBER]",
                                "Routing Number", {"routing", "aba", "rtn"}));
  entries_.push_back(make_entry("bitcoin_address", R"(\b[13][a-km-zA-HJ-NP-Z1-9]{25,34}\b)", 0.7,
                                "[CRYPTO_ADDRESS]", "Cryptocurrency Address"));

  name_indicators_ = {
      std::regex(R"(\b(?:Mr|Mrs|Ms|Miss|Dr|Prof)\.?\s+[A-Z][a-z]+\b)"),
      std::regex(R"(\b[A-Z][a-z]+\s+[A-Z][a-z]+\b)"),
  };
  name_context_words_ = {"name",  "called", "named", "refer",   "i am",   "i'm",
                         "my name", "contact", "reach", "ask for", "speak to"};
  name_intro_ = std::regex(R"(\b(?:i am|i'm|my name is|call me|this is)\s+[A-Z][a-z]+\b)",
                           kIgnoreCase);
}

bool PiiValidator::luhn_valid(const std::string &number) {
  std::vector<int> digits;
  digits.reserve(number.size());
  for (const char ch : number) {
    if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      digits.push_back(ch - '0');
    }
  }
  if (digits.size() < 13 || digits.size() > 19) {
    return false;
  }

  int sum = 0;
  bool double_it = false;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    int digit = *it;
    if (double_it) {
      digit *= 2;
      if (digit > 9) {
        digit -= 9;
      }
    }
    sum += digit;
    double_it = !double_it;
  }
  return sum % 10 == 0;
}

std::string PiiValidator::mask_value(const std::string &value) {
  if (value.size() <= 4) {
    return std::string(value.size(), '*');
  }
  if (value.size() <= 8) {
    return value.substr(0, 2) + std::string(value.size() - 2, '*');
  }
  return value.substr(0, 2) + std::string(value.size() - 4, '*') + value.substr(value.size() - 2);
}

bool PiiValidator::context_present(const PiiPatternEntry &entry, const std::string &lowered_text) {
  if (entry.context_required.empty()) {
    return true;
  }
  return std::any_of(entry.context_required.begin(), entry.context_required.end(),
                     [&lowered_text](const std::string &word) {
                       return lowered_text.find(common::to_lower(word)) != std::string::npos;
                     });
}

double PiiValidator::score_names(const std::string &text) const {
  double score = 0.0;
  for (const auto &indicator : name_indicators_) {
    if (common::bounded_search(text, indicator)) {
      score += 0.3;
    }
  }

  const std::string lowered = common::to_lower(text);
  for (const auto &word : name_context_words_) {
    if (lowered.find(word) != std::string::npos) {
      score += 0.2;
      break;
    }
  }

  if (common::bounded_search(text, name_intro_)) {
    score += 0.4;
  }
  return std::min(1.0, score);
}

common::Result<double> PiiValidator::name_likelihood(const std::string &text) const {
  try {
    return common::Result<double>::success(score_names(text));
  } catch (const std::regex_error &e) {
    return common::Result<double>::failure(std::string("name detection failed: ") + e.what(),
                                           common::ErrorCode::Validator);
  }
}

common::Result<PiiAnalysis> PiiValidator::analyze(const std::string &text) const {
  PiiAnalysis analysis;
  const std::string lowered = common::to_lower(text);

  try {
    for (const auto &entry : entries_) {
      if (!context_present(entry, lowered)) {
        continue;
      }
      std::size_t valid = 0;
      for (const auto &match : common::bounded_matches(text, entry.regex)) {
        if (entry.checksum && !entry.checksum(match.value)) {
          continue;
        }
        ++valid;
        if (analysis.findings.size() < kMaxFindings) {
          analysis.findings.push_back(PiiFinding{.type = entry.type,
                                                 .masked_value = mask_value(match.value),
                                                 .start = match.start,
                                                 .end = match.start + match.length,
                                                 .risk_score = entry.risk_score,
                                                 .description = entry.description});
        }
      }
      if (valid == 0) {
        continue;
      }
      analysis.counts.emplace_back(entry.type, valid);
      analysis.risk_score = std::max(analysis.risk_score, entry.risk_score);
    }

    analysis.name_score = score_names(text);
  } catch (const std::regex_error &e) {
    return common::Result<PiiAnalysis>::failure(
        std::string("pii pattern evaluation failed: ") + e.what(), common::ErrorCode::Validator);
  }

  if (analysis.name_score > 0.5) {
    analysis.risk_score = std::max(analysis.risk_score, kNameRiskFloor);
    analysis.counts.emplace_back(kNamesType, 1);
  }

  if (analysis.counts.size() > 1) {
    analysis.risk_score = std::min(1.0, analysis.risk_score * kMultiTypeMultiplier);
  }

  for (const auto &[type, count] : analysis.counts) {
    analysis.total_items += count;
  }

  if (analysis.risk_score > 0.5) {
    if (analysis.counts.size() == 1) {
      analysis.reason = common::title_case(analysis.counts.front().first) + " detected";
    } else {
      std::vector<std::string> types;
      for (std::size_t i = 0; i < analysis.counts.size() && i < kReasonTypeLimit; ++i) {
        types.push_back(analysis.counts[i].first);
      }
      analysis.reason = "Multiple PII types detected: " + common::join(types, ", ");
    }
  }

  return common::Result<PiiAnalysis>::success(std::move(analysis));
}

common::Result<ValidationResult> PiiValidator::validate(const std::string &text) const {
  auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<ValidationResult>::failure_from(analysis);
  }
  const auto &a = analysis.value();

  ValidationResult result;
  result.score = a.risk_score;
  result.reason = a.reason;
  result.attributes["risk_score"] = format_score(a.risk_score);
  result.set_json_attribute("findings", findings_to_json(a.findings));
  result.set_json_attribute("counts", counts_to_json(a.counts));
  result.attributes["total_items"] = std::to_string(a.total_items);
  result.attributes["name_score"] = format_score(a.name_score);
  if (a.reason.has_value()) {
    result.attributes["reason"] = *a.reason;
  }
  return common::Result<ValidationResult>::success(std::move(result));
}

common::Result<std::vector<MatchSpan>>
PiiValidator::find_spans(const std::string &text, const LabelOverrides &custom_labels) const {
  std::vector<MatchSpan> spans;
  const std::string lowered = common::to_lower(text);
  try {
    for (const auto &entry : entries_) {
      if (!context_present(entry, lowered)) {
        continue;
      }
      const auto label_it = custom_labels.find(entry.type);
      const std::string &label =
          label_it == custom_labels.end() ? entry.redact_label : label_it->second;
      for (const auto &match : common::bounded_matches(text, entry.regex)) {
        if (entry.checksum && !entry.checksum(match.value)) {
          continue;
        }
        spans.push_back(
            MatchSpan{.start = match.start, .end = match.start + match.length, .label = label});
      }
    }
  } catch (const std::regex_error &e) {
    return common::Result<std::vector<MatchSpan>>::failure(
        std::string("pii pattern evaluation failed: ") + e.what(), common::ErrorCode::Validator);
  }
  return common::Result<std::vector<MatchSpan>>::success(std::move(spans));
}

common::Result<std::string> PiiValidator::redact(const std::string &text,
                                                 const LabelOverrides &custom_labels) const {
  auto spans_result = find_spans(text, custom_labels);
  if (!spans_result.ok()) {
    return common::Result<std::string>::failure_from(spans_result);
  }
  auto &spans = spans_result.value();

  // Rightmost first, ties keep table order. Offsets refer to the original text, so an
  // overlapping span spliced later may cut into a label inserted before it.
  std::stable_sort(spans.begin(), spans.end(),
                   [](const MatchSpan &a, const MatchSpan &b) { return a.start > b.start; });

  std::string redacted = text;
  for (const auto &span : spans) {
    const std::size_t start = std::min(span.start, redacted.size());
    const std::size_t end = std::max(start, std::min(span.end, redacted.size()));
    redacted = redacted.substr(0, start) + span.label + redacted.substr(end);
  }

  try {
    if (score_names(text) > 0.5) {
      const auto label_it = custom_labels.find(kNamesType);
      const std::string label = label_it == custom_labels.end() ? "[NAME]" : label_it->second;
      for (const auto &indicator : name_indicators_) {
        redacted = common::bounded_replace(redacted, indicator, label);
      }
    }
  } catch (const std::regex_error &e) {
    return common::Result<std::string>::failure(std::string("name redaction failed: ") + e.what(),
                                                common::ErrorCode::Validator);
  }

  return common::Result<std::string>::success(std::move(redacted));
}

common::Result<std::string> PiiValidator::generate_report(const std::string &text) const {
  const auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<std::string>::failure_from(analysis);
  }
  const auto &a = analysis.value();
  if (a.risk_score == 0.0) {
    return common::Result<std::string>::success("No PII detected in the text.");
  }

  std::ostringstream report;
  report << "PII Risk Score: " << format_fixed(a.risk_score) << "/1.00\n";
  report << "Total PII items found: " << a.total_items << "\n";
  report << "\nPII Types Detected:";
  for (const auto &[type, count] : a.counts) {
    report << "\n  - " << common::title_case(type) << ": " << count << " instance(s)";
  }
  if (a.risk_score > 0.8) {
    report << "\n\nHIGH RISK: This text contains highly sensitive information";
  } else if (a.risk_score > 0.5) {
    report << "\n\nMODERATE RISK: This text contains sensitive information";
  }
  return common::Result<std::string>::success(report.str());
}

common::Result<std::vector<std::string>> PiiValidator::pii_types(const std::string &text) const {
  const auto analysis = analyze(text);
  if (!analysis.ok()) {
    return common::Result<std::vector<std::string>>::failure_from(analysis);
  }
  std::vector<std::string> types;
  for (const auto &[type, count] : analysis.value().counts) {
    types.push_back(type);
  }
  return common::Result<std::vector<std::string>>::success(std::move(types));
}

common::Result<bool> PiiValidator::has_high_risk_pii(const std::string &text) const {
  static const std::set<std::string> high_risk = {"ssn", "credit_card", "passport",
                                                  "medical_record"};
  const auto types = pii_types(text);
  if (!types.ok()) {
    return common::Result<bool>::failure_from(types);
  }
  const bool found = std::any_of(types.value().begin(), types.value().end(),
                                 [](const std::string &type) { return high_risk.contains(type); });
  return common::Result<bool>::success(found);
}

} // namespace llmshield::validators
