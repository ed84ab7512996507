#include "llmshield/guard/guard.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/common/hash.hpp"
#include "llmshield/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <set>

namespace llmshield::guard {

namespace {

constexpr std::size_t kFingerprintLogLength = 12;
constexpr const char *kComponent = "guard";

double elapsed_ms(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
      .count();
}

std::chrono::microseconds to_micros(const double ms) {
  return std::chrono::microseconds(static_cast<std::int64_t>(ms * 1000.0));
}

common::Status check_threshold_value(const std::string &key, const double value) {
  if (!(value >= 0.0 && value <= 1.0)) {
    return common::Status::error("threshold '" + key + "' must be between 0.0 and 1.0");
  }
  return common::Status::success();
}

} // namespace

std::string fingerprint(const std::string &text, const CheckList &checks,
                        const bool return_details) {
  std::string checks_part = "all";
  if (checks.has_value() && !checks->empty()) {
    const std::set<std::string> unique(checks->begin(), checks->end());
    checks_part = common::join(std::vector<std::string>(unique.begin(), unique.end()), ",");
  }
  // Length prefix keeps the text boundary unambiguous.
  return common::sha256_hex(std::to_string(text.size()) + ":" + text + "\n" + checks_part + "\n" +
                            (return_details ? "detailed" : "summary"));
}

common::Result<std::unique_ptr<SafetyGuard>>
SafetyGuard::create(GuardOptions options, validators::ValidatorRegistry registry) {
  using ResultT = common::Result<std::unique_ptr<SafetyGuard>>;

  std::vector<validators::IValidator *> active;
  std::set<std::string> seen;
  for (const auto &name : options.validators) {
    auto *validator = registry.get_validator(name);
    if (validator == nullptr) {
      return ResultT::failure("Unknown validator: " + name);
    }
    if (seen.insert(std::string(validator->name())).second) {
      active.push_back(validator);
    }
  }

  for (const auto &[key, value] : options.thresholds) {
    if (const auto status = check_threshold_value(key, value); !status.ok()) {
      return ResultT::failure_from(status);
    }
  }

  if (options.cache_enabled && options.cache_size == 0) {
    return ResultT::failure("cache_size must be positive when the cache is enabled");
  }

  auto guard = std::unique_ptr<SafetyGuard>(
      new SafetyGuard(std::move(options), std::move(registry), std::move(active)));
  observability::record_guard_start(guard->active_validators(), guard->parallel());
  return ResultT::success(std::move(guard));
}

SafetyGuard::SafetyGuard(GuardOptions options, validators::ValidatorRegistry registry,
                         std::vector<validators::IValidator *> active)
    : options_(std::move(options)), registry_(std::move(registry)), active_(std::move(active)),
      thresholds_(default_thresholds()) {
  for (const auto &[key, value] : options_.thresholds) {
    thresholds_[key] = value;
  }
  if (options_.cache_enabled) {
    cache_ = std::make_unique<ResultCache>(options_.cache_size);
  }
  if (options_.parallel_checks && active_.size() > 1) {
    pool_ = std::make_unique<common::WorkerPool>(active_.size());
  }
}

SafetyGuard::~SafetyGuard() {
  if (pool_ != nullptr) {
    pool_->shutdown();
  }
}

std::vector<std::string> SafetyGuard::active_validators() const {
  std::vector<std::string> names;
  names.reserve(active_.size());
  for (const auto *validator : active_) {
    names.emplace_back(validator->name());
  }
  return names;
}

void SafetyGuard::record_failure(const std::string &operation, const common::ErrorCode code,
                                 const std::string &message) const {
  observability::record_error(kComponent,
                              operation + ": " + common::error_code_name(code) + ": " + message);
}

common::Result<std::vector<validators::IValidator *>>
SafetyGuard::select_validators(const CheckList &checks) const {
  using ResultT = common::Result<std::vector<validators::IValidator *>>;
  if (!checks.has_value() || checks->empty()) {
    return ResultT::success(active_);
  }

  std::set<std::string> requested;
  for (const auto &name : *checks) {
    const std::string key = common::to_lower(common::trim(name));
    const bool configured =
        std::any_of(active_.begin(), active_.end(),
                    [&key](const validators::IValidator *v) { return v->name() == key; });
    if (!configured) {
      return ResultT::failure("Unknown or unconfigured check: " + name);
    }
    requested.insert(key);
  }

  std::vector<validators::IValidator *> selected;
  for (auto *validator : active_) {
    if (requested.contains(std::string(validator->name()))) {
      selected.push_back(validator);
    }
  }
  return ResultT::success(std::move(selected));
}

std::vector<common::Result<validators::ValidationResult>>
SafetyGuard::run_validators(const std::vector<validators::IValidator *> &selected,
                            const std::string &text) {
  using ValidationOutcome = common::Result<validators::ValidationResult>;
  std::vector<ValidationOutcome> outcomes;
  outcomes.reserve(selected.size());

  if (pool_ == nullptr || selected.size() < 2) {
    for (const auto *validator : selected) {
      outcomes.push_back(validator->validate(text));
    }
    return outcomes;
  }

  std::vector<std::future<ValidationOutcome>> futures;
  futures.reserve(selected.size());
  for (const auto *validator : selected) {
    futures.push_back(pool_->submit([validator, &text]() { return validator->validate(text); }));
  }
  // Every future is joined before returning, including after a failure.
  for (std::size_t i = 0; i < futures.size(); ++i) {
    try {
      outcomes.push_back(futures[i].get());
    } catch (const std::exception &e) {
      outcomes.push_back(ValidationOutcome::failure(
          std::string(selected[i]->name()) + " threw: " + e.what(), common::ErrorCode::Validator));
    }
  }
  return outcomes;
}

double SafetyGuard::threshold_for(const ThresholdTable &table, const std::string_view key) const {
  const auto it = table.find(std::string(key));
  return it == table.end() ? kFallbackThreshold : it->second;
}

common::Result<SafetyResult> SafetyGuard::check(const std::string &text, const CheckList &checks,
                                                const bool return_details) {
  const auto started = std::chrono::steady_clock::now();

  auto selection = select_validators(checks);
  if (!selection.ok()) {
    record_failure("check", selection.code(), selection.error());
    return common::Result<SafetyResult>::failure_from(selection);
  }
  const auto &selected = selection.value();
  std::vector<std::string> selected_names;
  for (const auto *validator : selected) {
    selected_names.emplace_back(validator->name());
  }

  const std::string digest = fingerprint(text, checks, return_details);
  const std::string log_id = digest.substr(0, kFingerprintLogLength);
  const std::string key = std::to_string(config_generation_.load()) + ":" + digest;

  if (cache_ != nullptr) {
    if (const auto hit = cache_->get(key); hit != nullptr) {
      const double lookup_ms = elapsed_ms(started);
      if (options_.metrics_enabled) {
        metrics_.record(selected_names, *hit, lookup_ms, true);
      }
      observability::record_check(log_id, hit->is_safe, true, to_micros(lookup_ms),
                                  hit->triggered_checks);
      return common::Result<SafetyResult>::success(*hit);
    }
  }

  const auto evaluation_started = std::chrono::steady_clock::now();
  const ThresholdTable table = thresholds();

  auto outcomes = run_validators(selected, text);

  SafetyResult result;
  std::vector<std::string> reasons;
  for (std::size_t i = 0; i < selected.size(); ++i) {
    auto &outcome = outcomes[i];
    if (!outcome.ok()) {
      record_failure("check", common::ErrorCode::Validator, outcome.error());
      return common::Result<SafetyResult>::failure(outcome.error(), common::ErrorCode::Validator);
    }
    const auto *validator = selected[i];
    const std::string name(validator->name());
    auto &validation = outcome.value();

    if (validation.score > threshold_for(table, validator->threshold_key())) {
      result.triggered_checks.push_back(name);
      reasons.push_back(name + ": " + validation.reason.value_or("Threshold exceeded"));
    }
    if (return_details) {
      result.scores[name] = validation.score;
      result.details[name] = std::move(validation);
    }
  }

  auto triggered = rules_.evaluate(text);
  if (!triggered.ok()) {
    record_failure("check", triggered.code(), triggered.error());
    return common::Result<SafetyResult>::failure_from(triggered);
  }
  const auto verdict = rules::resolve_precedence(triggered.value());
  result.triggered_rules = std::move(triggered.value());
  result.flags = verdict.flags;

  if (verdict.redact) {
    auto redacted = rules_.redact(text);
    if (!redacted.ok()) {
      record_failure("check", redacted.code(), redacted.error());
      return common::Result<SafetyResult>::failure_from(redacted);
    }
    result.redacted_text = std::move(redacted.value());
  }

  if (verdict.allowed_by.has_value()) {
    result.is_safe = true;
    result.allowed_by = verdict.allowed_by;
  } else {
    for (const auto &message : verdict.block_messages) {
      reasons.push_back("Custom rule: " + message);
    }
    result.is_safe = result.triggered_checks.empty() && !verdict.blocked;
    if (!result.is_safe) {
      result.reason = common::join(reasons, "; ");
    }
  }

  result.latency_ms = elapsed_ms(evaluation_started);

  if (options_.metrics_enabled) {
    metrics_.record(selected_names, result, result.latency_ms, false);
  }
  if (cache_ != nullptr) {
    cache_->put(key, std::make_shared<const SafetyResult>(result));
    observability::record_metric(
        observability::CacheSizeMetric{.entries = static_cast<std::uint64_t>(cache_->size())});
  }
  observability::record_check(log_id, result.is_safe, false, to_micros(result.latency_ms),
                              result.triggered_checks);

  return common::Result<SafetyResult>::success(std::move(result));
}

common::Result<bool> SafetyGuard::is_safe(const std::string &text, const CheckList &checks) {
  const auto result = check(text, checks);
  if (!result.ok()) {
    return common::Result<bool>::failure_from(result);
  }
  return common::Result<bool>::success(result.value().is_safe);
}

common::Result<SafetyResult> SafetyGuard::analyze(const std::string &text) {
  return check(text, std::nullopt, true);
}

const validators::PiiValidator &SafetyGuard::pii_validator() const {
  for (const auto *validator : active_) {
    if (const auto *pii = dynamic_cast<const validators::PiiValidator *>(validator)) {
      return *pii;
    }
  }
  return fallback_pii_;
}

const validators::PromptInjectionValidator &SafetyGuard::injection_validator() const {
  for (const auto *validator : active_) {
    if (const auto *injection =
            dynamic_cast<const validators::PromptInjectionValidator *>(validator)) {
      return *injection;
    }
  }
  return fallback_injection_;
}

common::Result<std::string> SafetyGuard::redact_pii(const std::string &text) const {
  auto redacted = pii_validator().redact(text);
  if (!redacted.ok()) {
    record_failure("redact_pii", redacted.code(), redacted.error());
  }
  return redacted;
}

common::Result<std::string> SafetyGuard::redact(const std::string &text) const {
  const auto redacted = redact_pii(text);
  if (!redacted.ok()) {
    return redacted;
  }
  auto ruled = rules_.redact(redacted.value());
  if (!ruled.ok()) {
    record_failure("redact", ruled.code(), ruled.error());
  }
  return ruled;
}

common::Result<InjectionVerdict> SafetyGuard::detect_prompt_injection(const std::string &text) const {
  const auto &validator = injection_validator();
  const auto validation = validator.validate(text);
  if (!validation.ok()) {
    record_failure("detect_prompt_injection", validation.code(), validation.error());
    return common::Result<InjectionVerdict>::failure_from(validation);
  }
  const double threshold = threshold_for(thresholds(), validator.threshold_key());
  return common::Result<InjectionVerdict>::success(
      InjectionVerdict{.is_injection = validation.value().score > threshold,
                       .score = validation.value().score});
}

common::Result<validators::JailbreakVerdict>
SafetyGuard::detect_jailbreak(const std::string &text) const {
  auto verdict = injection_validator().detect_jailbreak(text, threshold_for(thresholds(), "jailbreak"));
  if (!verdict.ok()) {
    record_failure("detect_jailbreak", verdict.code(), verdict.error());
  }
  return verdict;
}

common::Result<std::vector<SafetyResult>>
SafetyGuard::batch_check(const std::vector<std::string> &texts, const CheckList &checks,
                         const std::size_t max_workers) {
  using ResultT = common::Result<std::vector<SafetyResult>>;
  std::vector<common::Result<SafetyResult>> outcomes;
  outcomes.reserve(texts.size());
  {
    common::WorkerPool pool(std::min(std::max<std::size_t>(1, max_workers),
                                     std::max<std::size_t>(1, texts.size())));
    std::vector<std::future<common::Result<SafetyResult>>> futures;
    futures.reserve(texts.size());
    for (const auto &text : texts) {
      futures.push_back(pool.submit([this, &text, &checks]() { return check(text, checks); }));
    }
    for (auto &future : futures) {
      try {
        outcomes.push_back(future.get());
      } catch (const std::exception &e) {
        outcomes.push_back(common::Result<SafetyResult>::failure(
            std::string("batch element threw: ") + e.what(), common::ErrorCode::Validator));
      }
    }
  }

  std::vector<SafetyResult> results;
  results.reserve(outcomes.size());
  for (auto &outcome : outcomes) {
    if (!outcome.ok()) {
      return ResultT::failure_from(outcome);
    }
    results.push_back(std::move(outcome.value()));
  }
  return ResultT::success(std::move(results));
}

common::Result<std::optional<std::string>> SafetyGuard::filter_stream(const std::string &chunk,
                                                                      const std::string &context) {
  using ResultT = common::Result<std::optional<std::string>>;
  std::vector<std::string> fast_checks;
  for (const auto *validator : active_) {
    if (validator->name() == "pii" || validator->name() == "toxicity") {
      fast_checks.emplace_back(validator->name());
    }
  }
  if (fast_checks.empty()) {
    return ResultT::success(chunk);
  }

  const auto result = check(context + chunk, fast_checks);
  if (!result.ok()) {
    return ResultT::failure_from(result);
  }
  if (result.value().is_safe) {
    return ResultT::success(chunk);
  }

  const auto cleaned = redact_pii(chunk);
  if (!cleaned.ok()) {
    return ResultT::failure_from(cleaned);
  }
  if (cleaned.value() != chunk) {
    return ResultT::success(cleaned.value());
  }
  return ResultT::success(std::nullopt);
}

common::Status SafetyGuard::add_custom_rule(rules::CustomRuleSpec spec) {
  const std::string name = spec.name;
  const std::string action = rules::rule_action_name(spec.action);
  auto status = rules_.add_rule(std::move(spec));
  if (!status.ok()) {
    record_failure("add_custom_rule", status.code(), status.error());
    return status;
  }
  config_changed();
  observability::record_rule_change(name, action, true);
  return status;
}

bool SafetyGuard::remove_custom_rule(const std::string &name) {
  const auto existing = rules_.rules();
  const auto it = std::find_if(existing.begin(), existing.end(),
                               [&name](const rules::CustomRuleSpec &r) { return r.name == name; });
  if (!rules_.remove_rule(name)) {
    return false;
  }
  config_changed();
  observability::record_rule_change(
      name, it == existing.end() ? std::string("unknown") : rules::rule_action_name(it->action),
      false);
  return true;
}

std::vector<rules::CustomRuleSpec> SafetyGuard::custom_rules() const { return rules_.rules(); }

common::Status SafetyGuard::set_threshold(const std::string &key, const double value) {
  if (common::trim(key).empty()) {
    return common::Status::error("threshold key must not be empty");
  }
  if (auto status = check_threshold_value(key, value); !status.ok()) {
    record_failure("set_threshold", status.code(), status.error());
    return status;
  }
  {
    std::lock_guard<std::mutex> lock(thresholds_mutex_);
    thresholds_[key] = value;
  }
  config_changed();
  return common::Status::success();
}

ThresholdTable SafetyGuard::thresholds() const {
  std::lock_guard<std::mutex> lock(thresholds_mutex_);
  return thresholds_;
}

MetricsSnapshot SafetyGuard::metrics() const {
  if (!options_.metrics_enabled) {
    return MetricsSnapshot{};
  }
  auto snapshot = metrics_.snapshot();
  snapshot.cache_size = cache_size();
  observability::record_metric(observability::BlockRateMetric{.rate = snapshot.block_rate});
  return snapshot;
}

void SafetyGuard::reset_metrics() { metrics_.reset(); }

void SafetyGuard::config_changed() {
  config_generation_.fetch_add(1);
  clear_cache();
}

void SafetyGuard::clear_cache() {
  if (cache_ != nullptr) {
    cache_->clear();
  }
}

std::size_t SafetyGuard::cache_size() const { return cache_ == nullptr ? 0 : cache_->size(); }

GuardRecord SafetyGuard::export_record() const {
  GuardRecord record;
  record.thresholds = thresholds();
  record.validators = active_validators();
  record.custom_rules = rules_.rules();
  return record;
}

common::Status SafetyGuard::apply_record(const GuardRecord &record) {
  for (const auto &[key, value] : record.thresholds) {
    if (auto status = check_threshold_value(key, value); !status.ok()) {
      record_failure("apply_record", status.code(), status.error());
      return status;
    }
  }

  // Dry run against a scratch engine seeded with the current rules.
  rules::RuleEngine scratch;
  for (auto rule : rules_.rules()) {
    if (auto status = scratch.add_rule(std::move(rule)); !status.ok()) {
      return status;
    }
  }
  for (const auto &rule : record.custom_rules) {
    if (auto status = scratch.add_rule(rule); !status.ok()) {
      record_failure("apply_record", status.code(), status.error());
      return status;
    }
  }

  {
    std::lock_guard<std::mutex> lock(thresholds_mutex_);
    for (const auto &[key, value] : record.thresholds) {
      thresholds_[key] = value;
    }
  }
  for (const auto &rule : record.custom_rules) {
    if (auto status = add_custom_rule(rule); !status.ok()) {
      return status;
    }
  }
  config_changed();
  return common::Status::success();
}

common::Status SafetyGuard::save_config(const std::filesystem::path &path) const {
  auto status = save_record(path, export_record());
  if (!status.ok()) {
    record_failure("save_config", status.code(), status.error());
  }
  return status;
}

common::Status SafetyGuard::load_config(const std::filesystem::path &path) {
  const auto record = load_record(path);
  if (!record.ok()) {
    record_failure("load_config", record.code(), record.error());
    return common::Status::error(record.error(), record.code());
  }
  if (auto status = apply_record(record.value()); !status.ok()) {
    return status;
  }
  observability::record_config_loaded(path.string(), record.value().custom_rules.size());
  return common::Status::success();
}

} // namespace llmshield::guard
