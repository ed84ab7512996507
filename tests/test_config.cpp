#include "test_framework.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/config/config.hpp"
#include "llmshield/guard/options.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = llmshield::config::config_path_override();
    if (next.has_value()) {
      llmshield::config::set_config_path_override(*next);
    } else {
      llmshield::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      llmshield::config::set_config_path_override(*old_override);
    } else {
      llmshield::config::clear_config_path_override();
    }
  }
};

std::filesystem::path make_temp_home() {
  static std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path path = std::filesystem::temp_directory_path() /
                               ("llmshield-test-home-" + std::to_string(rng()));
  std::filesystem::create_directories(path);
  return path;
}

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<llmshield::tests::TestCase> &tests) {
  using llmshield::tests::require;
  namespace cfg = llmshield::config;

  tests.push_back({"config_dir_creates_directory", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("LLMSHIELD_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const auto dir = cfg::config_dir();
                     require(dir.ok(), dir.error());
                     require(std::filesystem::exists(dir.value()), "config directory should exist");
                     require(dir.value().filename() == ".llmshield", "config folder name mismatch");
                   }});

  tests.push_back({"load_config_missing_file_returns_defaults", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("LLMSHIELD_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_cache("LLMSHIELD_CACHE_SIZE", std::nullopt);
                     const ConfigOverrideGuard cfg_override;

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().engine.validators.size() == 3,
                             "three validators by default");
                     require(loaded.value().engine.cache_size == 10'000, "default cache size");
                     require(loaded.value().engine.parallel_checks, "parallel by default");
                     require(loaded.value().thresholds.empty(), "no threshold overrides");
                     require(loaded.value().observability.backend == "log", "log backend default");
                   }});

  tests.push_back({"load_config_valid_toml", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const ConfigOverrideGuard cfg_override(home / "custom.toml");
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / "custom.toml", "override path should be used");

                     write_file(path.value(), R"(
[engine]
validators = ["pii", "prompt_injection"]
cache_enabled = false
cache_size = 50
metrics_enabled = false
parallel_checks = false

[thresholds]
toxicity = 0.6
pii_risk = 0.75

[rules]
file = "~/rules/custom.json"

[observability]
backend = "none"
)");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.engine.validators.size() == 2, "validators mismatch");
                     require(config.engine.validators[0] == "pii", "validator order mismatch");
                     require(!config.engine.cache_enabled, "cache flag mismatch");
                     require(config.engine.cache_size == 50, "cache size mismatch");
                     require(!config.engine.metrics_enabled, "metrics flag mismatch");
                     require(!config.engine.parallel_checks, "parallel flag mismatch");
                     require(config.thresholds.at("toxicity") == 0.6, "toxicity threshold");
                     require(config.thresholds.at("pii_risk") == 0.75, "pii threshold");
                     require(config.rules.file == (home / "rules" / "custom.json").string(),
                             "rules file should expand ~");
                     require(config.observability.backend == "none", "backend mismatch");
                   }});

  tests.push_back({"parse_config_rejects_out_of_range_threshold", [] {
                     const auto parsed = cfg::parse_config("[thresholds]\ntoxicity = 1.5\n");
                     require(!parsed.ok(), "threshold above 1 should fail");
                     require(parsed.code() == llmshield::common::ErrorCode::Configuration,
                             "should be a configuration error");
                     require(!cfg::parse_config("[thresholds]\npii_risk = high\n").ok(),
                             "non-numeric threshold should fail");
                   }});

  tests.push_back({"save_and_reload_config", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_cache("LLMSHIELD_CACHE_SIZE", std::nullopt);
                     const EnvGuard env_parallel("LLMSHIELD_PARALLEL_CHECKS", std::nullopt);
                     const EnvGuard env_obs("LLMSHIELD_OBSERVABILITY", std::nullopt);
                     const ConfigOverrideGuard cfg_override(home / "saved.toml");

                     cfg::Config config;
                     config.engine.validators = {"toxicity"};
                     config.engine.cache_size = 7;
                     config.thresholds["toxicity"] = 0.55;
                     config.rules.file = (home / "rules.json").string();
                     config.observability.backend = "none";
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "config file should exist after save");
                     require(!std::filesystem::exists(home / "saved.toml.tmp"),
                             "temporary file should be renamed away");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().engine.validators.size() == 1, "validators mismatch");
                     require(loaded.value().engine.cache_size == 7, "cache size mismatch");
                     require(loaded.value().thresholds.at("toxicity") == 0.55, "threshold mismatch");
                     require(loaded.value().rules.file == config.rules.file, "rules file mismatch");
                   }});

  tests.push_back({"env_overrides_apply", [] {
                     const auto home = make_temp_home();
                     const EnvGuard env_home("HOME", home.string());
                     const EnvGuard env_path("LLMSHIELD_CONFIG_PATH", std::nullopt);
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard env_cache("LLMSHIELD_CACHE_SIZE", std::optional<std::string>("12"));
                     const EnvGuard env_parallel("LLMSHIELD_PARALLEL_CHECKS",
                                                 std::optional<std::string>("no"));
                     const EnvGuard env_obs("LLMSHIELD_OBSERVABILITY",
                                            std::optional<std::string>("none"));

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().engine.cache_size == 12, "cache size env override");
                     require(!loaded.value().engine.parallel_checks, "parallel env override");
                     require(loaded.value().observability.backend == "none", "backend env override");
                   }});

  tests.push_back({"env_config_path_is_used", [] {
                     const auto home = make_temp_home();
                     const ConfigOverrideGuard cfg_override;
                     const EnvGuard env_path("LLMSHIELD_CONFIG_PATH",
                                             (home / "env.toml").string());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home / "env.toml", "env path should be used");
                   }});

  tests.push_back({"validate_config_reports_errors_and_warnings", [] {
                     cfg::Config config;
                     auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(warnings.value().empty(), "defaults should be clean");

                     config.engine.validators = {"pii", "pii"};
                     config.thresholds["custom"] = 0.3;
                     warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(warnings.value().size() == 2, "duplicate and unknown key warnings");

                     config.engine.validators = {"sentiment"};
                     require(!cfg::validate_config(config).ok(), "unknown validator should fail");

                     config.engine.validators = {"pii"};
                     config.engine.cache_size = 0;
                     require(!cfg::validate_config(config).ok(), "zero cache size should fail");

                     config.engine.cache_size = 10;
                     config.observability.backend = "prometheus";
                     require(!cfg::validate_config(config).ok(), "unknown backend should fail");

                     config.observability.backend = "log,none";
                     require(cfg::validate_config(config).ok(), "comma backend list is valid");
                   }});

  tests.push_back({"options_from_config_copies_engine_settings", [] {
                     auto config = llmshield::testing::mock_config();
                     config.engine.validators = {"toxicity"};
                     config.engine.parallel_checks = false;
                     config.thresholds["toxicity"] = 0.4;
                     const auto options = llmshield::guard::options_from_config(config);
                     require(options.validators.size() == 1, "validators should carry over");
                     require(options.cache_size == 128, "cache size should carry over");
                     require(!options.parallel_checks, "parallel flag should carry over");
                     require(options.thresholds.at("toxicity") == 0.4, "thresholds should carry over");
                     require(llmshield::guard::default_thresholds().at("pii_risk") == 0.9,
                             "default pii threshold");
                   }});
}
