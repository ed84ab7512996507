#include "llmshield/config/config.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/common/toml.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <set>
#include <sstream>

namespace llmshield::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".llmshield";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("LLMSHIELD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool is_known_backend(const std::string &name) {
  return name == "log" || name == "none" || name == "noop";
}

} // namespace

const std::vector<std::string> &known_validators() {
  static const std::vector<std::string> names = {"toxicity", "pii", "prompt_injection"};
  return names;
}

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory", common::ErrorCode::Io);
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure_from(home);
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure_from(cfg_dir);
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  if (const char *cache_size = std::getenv("LLMSHIELD_CACHE_SIZE");
      cache_size != nullptr && *cache_size) {
    const std::string raw = common::trim(cache_size);
    std::size_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
      config.engine.cache_size = parsed;
    }
  }

  if (const char *parallel = std::getenv("LLMSHIELD_PARALLEL_CHECKS");
      parallel != nullptr && *parallel) {
    const std::string value = common::to_lower(common::trim(parallel));
    if (value == "1" || value == "true" || value == "yes") {
      config.engine.parallel_checks = true;
    } else if (value == "0" || value == "false" || value == "no") {
      config.engine.parallel_checks = false;
    }
  }

  if (const char *backend = std::getenv("LLMSHIELD_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure_from(parsed);
  }
  const auto &doc = parsed.value();

  Config config;
  config.engine.validators =
      doc.get_string_array("engine.validators", config.engine.validators);
  config.engine.cache_enabled = doc.get_bool("engine.cache_enabled", config.engine.cache_enabled);
  config.engine.cache_size = static_cast<std::size_t>(
      doc.get_u64("engine.cache_size", static_cast<std::uint64_t>(config.engine.cache_size)));
  config.engine.metrics_enabled =
      doc.get_bool("engine.metrics_enabled", config.engine.metrics_enabled);
  config.engine.parallel_checks =
      doc.get_bool("engine.parallel_checks", config.engine.parallel_checks);

  for (const auto &key : doc.keys_in_section("thresholds")) {
    const std::string full_key = "thresholds." + key;
    const double value = doc.get_double(full_key, -1.0);
    if (value < 0.0 || value > 1.0) {
      return common::Result<Config>::failure("threshold '" + key +
                                             "' must be a number between 0.0 and 1.0");
    }
    config.thresholds[key] = value;
  }

  config.rules.file = doc.get_string("rules.file", config.rules.file);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  file << "[engine]\n";
  file << "validators = " << common::string_array_to_toml(config.engine.validators) << "\n";
  file << "cache_enabled = " << bool_to_toml(config.engine.cache_enabled) << "\n";
  file << "cache_size = " << config.engine.cache_size << "\n";
  file << "metrics_enabled = " << bool_to_toml(config.engine.metrics_enabled) << "\n";
  file << "parallel_checks = " << bool_to_toml(config.engine.parallel_checks) << "\n";

  file << "\n[thresholds]\n";
  for (const auto &[key, value] : config.thresholds) {
    file << key << " = " << value << "\n";
  }

  file << "\n[rules]\n";
  file << "file = " << common::quote_toml_string(config.rules.file) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return file.str();
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure_from(cfg_path_result);
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorCode::Io);
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error(), config.code());
  }

  config.value().rules.file = expand_config_path(config.value().rules.file);
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error(), cfg_path_result.code());
  }
  return common::write_file_atomic(cfg_path_result.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto &known = known_validators();

  if (config.engine.validators.empty()) {
    warnings.push_back("engine.validators is empty; only custom rules will run");
  }

  std::set<std::string> seen;
  for (const auto &name : config.engine.validators) {
    if (std::find(known.begin(), known.end(), name) == known.end()) {
      return common::Result<std::vector<std::string>>::failure("Unknown validator: " + name);
    }
    if (!seen.insert(name).second) {
      warnings.push_back("engine.validators lists '" + name + "' more than once");
    }
  }

  if (config.engine.cache_enabled && config.engine.cache_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "engine.cache_size must be positive when the cache is enabled");
  }

  static const std::set<std::string> builtin_keys = {"toxicity", "pii_risk", "prompt_injection",
                                                     "jailbreak"};
  for (const auto &[key, value] : config.thresholds) {
    if (value < 0.0 || value > 1.0) {
      return common::Result<std::vector<std::string>>::failure(
          "threshold '" + key + "' must be between 0.0 and 1.0");
    }
    if (!builtin_keys.contains(key)) {
      warnings.push_back("threshold '" + key + "' does not match a built-in check");
    }
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (!backend.empty()) {
    for (const auto &part : common::split(backend, ',')) {
      if (!is_known_backend(part)) {
        return common::Result<std::vector<std::string>>::failure(
            "Invalid observability.backend: " + config.observability.backend);
      }
    }
  }

  if (common::trim(config.rules.file).empty()) {
    warnings.push_back("rules.file is empty; custom rules will not be persisted");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace llmshield::config
