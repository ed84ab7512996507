#include "test_framework.hpp"

#include "llmshield/validators/pii.hpp"

#include <algorithm>

namespace {

bool has_type(const std::vector<std::string> &types, const std::string &type) {
  return std::find(types.begin(), types.end(), type) != types.end();
}

} // namespace

void register_pii_tests(std::vector<llmshield::tests::TestCase> &tests) {
  using llmshield::tests::require;
  using llmshield::validators::PiiValidator;

  tests.push_back({"pii_table_order_and_size", [] {
                     const PiiValidator validator;
                     const auto &entries = validator.entries();
                     require(entries.size() == 15, "fifteen pattern entries expected");
                     require(entries.front().type == "ssn", "ssn comes first");
                     require(entries[1].type == "credit_card", "credit card second");
                     require(static_cast<bool>(entries[1].checksum), "card entry has a checksum");
                     require(entries.back().redact_label == "[CRYPTO_ADDRESS]",
                             "bitcoin label mismatch");
                   }});

  tests.push_back({"pii_luhn_checksum", [] {
                     require(PiiValidator::luhn_valid("4532-1234-5678-9014"), "valid card");
                     require(PiiValidator::luhn_valid("4111 1111 1111 1111"), "visa test number");
                     require(!PiiValidator::luhn_valid("4532-1234-5678-9999"), "invalid card");
                     require(!PiiValidator::luhn_valid("0000 0000 0000"), "too few digits");
                     require(!PiiValidator::luhn_valid("12345678901234567890"), "too many digits");
                   }});

  tests.push_back({"pii_luhn_gates_credit_cards", [] {
                     const PiiValidator validator;
                     const auto invalid = validator.pii_types("Card: 4532-1234-5678-9999");
                     require(invalid.ok(), invalid.error());
                     require(!has_type(invalid.value(), "credit_card"),
                             "Luhn-invalid number must not be flagged");

                     const auto valid = validator.analyze("Card: 4532-1234-5678-9014");
                     require(valid.ok(), valid.error());
                     require(valid.value().counts.front().first == "credit_card",
                             "Luhn-valid number should be flagged");
                     require(valid.value().risk_score == 1.0, "card risk is 1.0");

                     const auto redacted = validator.redact("Card: 4532-1234-5678-9014");
                     require(redacted.ok() && redacted.value() == "Card: [CREDIT_CARD]",
                             "card should be redacted");
                     const auto untouched = validator.redact("Card: 4532-1234-5678-9999");
                     require(untouched.ok() && untouched.value() == "Card: 4532-1234-5678-9999",
                             "invalid card must stay");
                   }});

  tests.push_back({"pii_ssn_scored_and_redacted", [] {
                     const PiiValidator validator;
                     const auto result = validator.validate("My SSN is 123-45-6789");
                     require(result.ok(), result.error());
                     require(result.value().score == 1.0, "ssn risk 1.0");
                     require(result.value().reason.value_or("") == "Ssn detected", "ssn reason");
                     require(result.value().attributes.at("total_items") == "1", "one item");
                     require(result.value().attributes.at("findings").find("12*******89") !=
                                 std::string::npos,
                             "finding value should be masked");

                     const auto redacted = validator.redact("My SSN is 123-45-6789");
                     require(redacted.ok(), redacted.error());
                     require(redacted.value() == "My SSN is [SSN]", "ssn redaction mismatch");
                   }});

  tests.push_back({"pii_redaction_is_idempotent", [] {
                     const PiiValidator validator;
                     const std::string text =
                         "Email jane.doe@example.com or call 555-123-4567, SSN 123-45-6789";
                     const auto once = validator.redact(text);
                     require(once.ok(), once.error());
                     const auto twice = validator.redact(once.value());
                     require(twice.ok(), twice.error());
                     require(once.value() == twice.value(), "second redaction changed the text");
                     require(once.value().find("jane.doe") == std::string::npos, "email leaked");
                     require(once.value().find("[EMAIL]") != std::string::npos, "email label");
                     require(once.value().find("6789") == std::string::npos, "digits leaked");
                   }});

  tests.push_back({"pii_context_gates_entries", [] {
                     const PiiValidator validator;
                     const auto without = validator.pii_types("Reference 12345678 attached");
                     require(without.ok() && without.value().empty(),
                             "bare digits should need account context");
                     const auto with = validator.pii_types("Bank account 12345678 attached");
                     require(with.ok() && has_type(with.value(), "bank_account"),
                             "account context should enable the entry");

                     const auto license = validator.pii_types("DRIVER LICENSE: D12345");
                     require(license.ok() && has_type(license.value(), "driver_license"),
                             "context check should ignore case");
                     const auto no_license = validator.pii_types("Badge D12345");
                     require(no_license.ok() && !has_type(no_license.value(), "driver_license"),
                             "license entry requires context");
                   }});

  tests.push_back({"pii_multiple_types_raise_risk", [] {
                     const PiiValidator validator;
                     const auto analysis =
                         validator.analyze("Email john@example.com, SSN 123-45-6789");
                     require(analysis.ok(), analysis.error());
                     require(analysis.value().counts.size() == 2, "two types expected");
                     require(analysis.value().counts[0].first == "ssn", "table order kept");
                     require(analysis.value().risk_score == 1.0, "risk capped at 1.0");
                     require(analysis.value().reason.value_or("") ==
                                 "Multiple PII types detected: ssn, email",
                             "multi type reason mismatch");
                   }});

  tests.push_back({"pii_email_alone_is_moderate", [] {
                     const PiiValidator validator;
                     const auto result = validator.validate("Contact me at john.doe@example.com");
                     require(result.ok(), result.error());
                     require(result.value().score == 0.7, "email risk 0.7");
                     require(result.value().reason.value_or("") == "Email detected", "reason");
                   }});

  tests.push_back({"pii_name_heuristic_and_labels", [] {
                     const PiiValidator validator;
                     const auto likelihood = validator.name_likelihood("My name is John Smith");
                     require(likelihood.ok() && likelihood.value() > 0.5, "name should be likely");
                     const auto analysis = validator.analyze("My name is John Smith");
                     require(analysis.ok(), analysis.error());
                     require(analysis.value().risk_score == 0.6, "name floor risk 0.6");
                     require(analysis.value().reason.value_or("") == "Potential Names detected",
                             "name reason mismatch");

                     const auto redacted = validator.redact("My name is John Smith");
                     require(redacted.ok() && redacted.value() == "My name is [NAME]",
                             "default name label");
                     const auto custom =
                         validator.redact("My name is John Smith", {{"potential_names", "<PERSON>"}});
                     require(custom.ok() && custom.value() == "My name is <PERSON>",
                             "custom name label");
                   }});

  tests.push_back({"pii_custom_labels_override_defaults", [] {
                     const PiiValidator validator;
                     const auto redacted =
                         validator.redact("My SSN is 123-45-6789", {{"ssn", "***-**-****"}});
                     require(redacted.ok() && redacted.value() == "My SSN is ***-**-****",
                             "custom ssn label");
                     const auto spans = validator.find_spans("My SSN is 123-45-6789");
                     require(spans.ok() && spans.value().size() == 1, "one span expected");
                     require(spans.value()[0].start == 10 && spans.value()[0].end == 21,
                             "span offsets mismatch");
                   }});

  tests.push_back({"pii_mask_value_rules", [] {
                     require(PiiValidator::mask_value("abcd") == "****", "short values hidden");
                     require(PiiValidator::mask_value("abcdef") == "ab****", "medium values");
                     require(PiiValidator::mask_value("123-45-6789") == "12*******89",
                             "long values keep both ends");
                   }});

  tests.push_back({"pii_report_and_high_risk", [] {
                     const PiiValidator validator;
                     const auto none = validator.generate_report("Hello world");
                     require(none.ok() && none.value() == "No PII detected in the text.",
                             "clean report mismatch");

                     const auto report = validator.generate_report("My SSN is 123-45-6789");
                     require(report.ok(), report.error());
                     require(report.value().rfind("PII Risk Score: 1.00/1.00", 0) == 0,
                             "report header mismatch: " + report.value());
                     require(report.value().find("  - Ssn: 1 instance(s)") != std::string::npos,
                             "report type line missing");
                     require(report.value().find("HIGH RISK:") != std::string::npos,
                             "high risk banner missing");

                     const auto moderate = validator.generate_report("Contact me at john.doe@example.com");
                     require(moderate.ok() &&
                                 moderate.value().find("MODERATE RISK:") != std::string::npos,
                             "moderate banner expected");

                     const auto high = validator.has_high_risk_pii("My SSN is 123-45-6789");
                     require(high.ok() && high.value(), "ssn is high risk");
                     const auto low = validator.has_high_risk_pii("Contact me at john.doe@example.com");
                     require(low.ok() && !low.value(), "email is not high risk");
                   }});

  tests.push_back({"pii_overlapping_spans_splice_by_original_offsets", [] {
                     const PiiValidator validator;
                     const std::string text = "routing number 123456789 for account";
                     const auto spans = validator.find_spans(text);
                     require(spans.ok() && spans.value().size() == 3,
                             "ssn, bank account and routing number all match");
                     const auto redacted = validator.redact(text);
                     require(redacted.ok(), redacted.error());
                     // Later labels overwrite the same original offsets inside the earlier labels.
                     require(redacted.value() == "routing number [ROUTING_NUMBER]OUNT] account",
                             "overlap splice mismatch: " + redacted.value());
                   }});

  tests.push_back({"pii_long_unbroken_input", [] {
                     const PiiValidator validator;
                     const std::string blob(200000, 'a');
                     const auto clean = validator.analyze(blob);
                     require(clean.ok(), clean.error());
                     require(clean.value().risk_score == 0.0, "letter run holds no pii");
                     require(validator.redact(blob + "@example.com").ok(), "long email-like token");

                     const std::string text = std::string(60000, 'a') + " my ssn is 123-45-6789";
                     const auto types = validator.pii_types(text);
                     require(types.ok() && has_type(types.value(), "ssn"), "ssn past the first window");
                     const auto redacted = validator.redact(text);
                     require(redacted.ok(), redacted.error());
                     require(redacted.value() == std::string(60000, 'a') + " my ssn is [SSN]",
                             "tail redaction mismatch");
                   }});
}
