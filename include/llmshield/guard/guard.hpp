#pragma once

#include "llmshield/common/result.hpp"
#include "llmshield/common/worker_pool.hpp"
#include "llmshield/guard/metrics.hpp"
#include "llmshield/guard/options.hpp"
#include "llmshield/guard/persistence.hpp"
#include "llmshield/guard/result_cache.hpp"
#include "llmshield/guard/safety_result.hpp"
#include "llmshield/rules/rule_engine.hpp"
#include "llmshield/validators/pii.hpp"
#include "llmshield/validators/prompt_injection.hpp"
#include "llmshield/validators/registry.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace llmshield::guard {

using CheckList = std::optional<std::vector<std::string>>;

struct InjectionVerdict {
  bool is_injection = false;
  double score = 0.0;
};

class SafetyGuard {
public:
  static constexpr std::size_t kDefaultBatchWorkers = 10;

  // Fails with a Configuration error when a configured validator is not in the registry or a
  // threshold lies outside [0, 1].
  [[nodiscard]] static common::Result<std::unique_ptr<SafetyGuard>>
  create(GuardOptions options = {},
         validators::ValidatorRegistry registry = validators::ValidatorRegistry::create_default());

  ~SafetyGuard();
  SafetyGuard(const SafetyGuard &) = delete;
  SafetyGuard &operator=(const SafetyGuard &) = delete;

  [[nodiscard]] common::Result<SafetyResult> check(const std::string &text,
                                                   const CheckList &checks = std::nullopt,
                                                   bool return_details = false);
  [[nodiscard]] common::Result<bool> is_safe(const std::string &text,
                                             const CheckList &checks = std::nullopt);
  [[nodiscard]] common::Result<SafetyResult> analyze(const std::string &text);

  [[nodiscard]] common::Result<std::string> redact_pii(const std::string &text) const;
  // PII redaction followed by every redact rule.
  [[nodiscard]] common::Result<std::string> redact(const std::string &text) const;
  [[nodiscard]] common::Result<InjectionVerdict>
  detect_prompt_injection(const std::string &text) const;
  [[nodiscard]] common::Result<validators::JailbreakVerdict>
  detect_jailbreak(const std::string &text) const;

  // Results keep input order. Any failed element fails the batch.
  [[nodiscard]] common::Result<std::vector<SafetyResult>>
  batch_check(const std::vector<std::string> &texts, const CheckList &checks = std::nullopt,
              std::size_t max_workers = kDefaultBatchWorkers);
  // The chunk when safe, its PII-redacted form when redaction changes it, otherwise nullopt.
  [[nodiscard]] common::Result<std::optional<std::string>>
  filter_stream(const std::string &chunk, const std::string &context = "");

  [[nodiscard]] common::Status add_custom_rule(rules::CustomRuleSpec spec);
  bool remove_custom_rule(const std::string &name);
  [[nodiscard]] std::vector<rules::CustomRuleSpec> custom_rules() const;

  [[nodiscard]] common::Status set_threshold(const std::string &key, double value);
  [[nodiscard]] ThresholdTable thresholds() const;

  [[nodiscard]] MetricsSnapshot metrics() const;
  void reset_metrics();
  void clear_cache();
  [[nodiscard]] std::size_t cache_size() const;

  [[nodiscard]] std::vector<std::string> active_validators() const;
  [[nodiscard]] bool parallel() const { return pool_ != nullptr; }

  [[nodiscard]] GuardRecord export_record() const;
  // Validates every threshold and rule before applying any of them.
  [[nodiscard]] common::Status apply_record(const GuardRecord &record);
  [[nodiscard]] common::Status save_config(const std::filesystem::path &path) const;
  [[nodiscard]] common::Status load_config(const std::filesystem::path &path);

private:
  SafetyGuard(GuardOptions options, validators::ValidatorRegistry registry,
              std::vector<validators::IValidator *> active);

  [[nodiscard]] common::Result<std::vector<validators::IValidator *>>
  select_validators(const CheckList &checks) const;
  [[nodiscard]] std::vector<common::Result<validators::ValidationResult>>
  run_validators(const std::vector<validators::IValidator *> &selected, const std::string &text);
  [[nodiscard]] double threshold_for(const ThresholdTable &table, std::string_view key) const;
  [[nodiscard]] const validators::PiiValidator &pii_validator() const;
  [[nodiscard]] const validators::PromptInjectionValidator &injection_validator() const;
  void record_failure(const std::string &operation, common::ErrorCode code,
                      const std::string &message) const;
  // Called after every threshold or rule mutation has been applied.
  void config_changed();

  GuardOptions options_;
  validators::ValidatorRegistry registry_;
  std::vector<validators::IValidator *> active_;
  validators::PiiValidator fallback_pii_;
  validators::PromptInjectionValidator fallback_injection_;

  mutable std::mutex thresholds_mutex_;
  ThresholdTable thresholds_;

  rules::RuleEngine rules_;
  // Prefixes every cache key. Bumped after each threshold or rule change.
  std::atomic<std::uint64_t> config_generation_{0};
  std::unique_ptr<ResultCache> cache_;
  MetricsAccumulator metrics_;
  std::unique_ptr<common::WorkerPool> pool_;
};

[[nodiscard]] std::string fingerprint(const std::string &text, const CheckList &checks,
                                      bool return_details);

} // namespace llmshield::guard
