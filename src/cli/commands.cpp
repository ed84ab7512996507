#include "llmshield/cli/commands.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/common/json_util.hpp"
#include "llmshield/config/config.hpp"
#include "llmshield/guard/guard.hpp"
#include "llmshield/observability/factory.hpp"
#include "llmshield/observability/global.hpp"
#include "llmshield/validators/pii.hpp"
#include "llmshield/validators/validator.hpp"

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace llmshield::cli {

namespace {

constexpr int kExitUnsafe = 2;

std::string version_string() {
#ifdef LLMSHIELD_VERSION
  std::string version = LLMSHIELD_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef LLMSHIELD_GIT_COMMIT
  const std::string commit = LLMSHIELD_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "llmshield " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

int fail(const std::string &message) {
  std::cerr << "error: " << message << "\n";
  return 1;
}

// Positional tokens joined with spaces; a lone "-" reads stdin.
bool take_text(const std::vector<std::string> &args, std::string &out_text) {
  if (args.size() == 1 && args[0] == "-") {
    out_text = read_stdin_all();
    while (!out_text.empty() && (out_text.back() == '\n' || out_text.back() == '\r')) {
      out_text.pop_back();
    }
    return true;
  }
  if (args.empty()) {
    return false;
  }
  out_text = join_tokens(args);
  return true;
}

std::filesystem::path rules_file_path(const config::Config &cfg) {
  return config::expand_config_path(cfg.rules.file);
}

struct Session {
  config::Config config;
  std::unique_ptr<guard::SafetyGuard> guard;
};

common::Result<Session> open_session() {
  using ResultT = common::Result<Session>;
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return ResultT::failure_from(cfg);
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  auto created = guard::SafetyGuard::create(guard::options_from_config(cfg.value()));
  if (!created.ok()) {
    return ResultT::failure_from(created);
  }

  Session session{cfg.value(), std::move(created.value())};
  const auto rules_path = rules_file_path(session.config);
  std::error_code ec;
  if (std::filesystem::exists(rules_path, ec)) {
    auto loaded = session.guard->load_config(rules_path);
    if (!loaded.ok()) {
      return ResultT::failure_from(loaded);
    }
  }
  return ResultT::success(std::move(session));
}

std::string format_ms(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value;
  return out.str();
}

void print_verdict(const guard::SafetyResult &result) {
  if (result.is_safe) {
    std::cout << "SAFE";
    if (result.allowed_by.has_value()) {
      std::cout << " (allowed by rule '" << *result.allowed_by << "')";
    }
    std::cout << "\n";
  } else {
    std::cout << "UNSAFE: " << result.reason.value_or("blocked") << "\n";
  }
  for (const auto &flag : result.flags) {
    std::cout << "  flag: " << flag << "\n";
  }
}

void print_scores(const guard::SafetyResult &result) {
  if (result.scores.empty()) {
    return;
  }
  std::cout << "\nScores:\n";
  for (const auto &[check, score] : result.scores) {
    std::cout << "  " << check << ": " << std::fixed << std::setprecision(2) << score << "\n";
  }
  std::cout.unsetf(std::ios::floatfield);
}

int run_check(std::vector<std::string> args) {
  std::string checks_raw;
  const bool has_checks = take_option(args, "--checks", "-c", checks_raw);
  const bool detailed = take_flag(args, "--detailed");
  const bool as_json = take_flag(args, "--json");

  std::string text;
  if (!take_text(args, text)) {
    std::cerr << "usage: llmshield check <text|-> [--checks a,b] [--detailed] [--json]\n";
    return 1;
  }

  auto session = open_session();
  if (!session.ok()) {
    return fail(session.error());
  }
  auto &shield = *session.value().guard;

  guard::CheckList checks;
  if (has_checks) {
    checks = common::split(checks_raw, ',');
  }
  auto result = shield.check(text, checks, detailed);
  if (!result.ok()) {
    return fail(result.error());
  }

  const auto &verdict = result.value();
  if (as_json) {
    std::cout << guard::to_json(verdict) << "\n";
  } else {
    print_verdict(verdict);
    if (detailed) {
      print_scores(verdict);
    }
    std::cout << "\nLatency: " << format_ms(verdict.latency_ms) << "ms\n";
  }
  return verdict.is_safe ? 0 : kExitUnsafe;
}

int run_analyze(std::vector<std::string> args) {
  const bool as_json = take_flag(args, "--json");
  std::string text;
  if (!take_text(args, text)) {
    std::cerr << "usage: llmshield analyze <text|-> [--json]\n";
    return 1;
  }

  auto session = open_session();
  if (!session.ok()) {
    return fail(session.error());
  }
  auto result = session.value().guard->analyze(text);
  if (!result.ok()) {
    return fail(result.error());
  }

  const auto &verdict = result.value();
  if (as_json) {
    std::cout << guard::to_json(verdict) << "\n";
    return verdict.is_safe ? 0 : kExitUnsafe;
  }

  print_verdict(verdict);
  print_scores(verdict);
  for (const auto &[check, detail] : verdict.details) {
    if (detail.reason.has_value()) {
      std::cout << "  " << check << " reason: " << *detail.reason << "\n";
    }
  }
  if (!verdict.triggered_rules.empty()) {
    std::cout << "\nRules:\n";
    for (const auto &rule : verdict.triggered_rules) {
      std::cout << "  " << rule.name << " [" << rules::rule_action_name(rule.action)
                << ", priority " << rule.priority << "]\n";
    }
  }
  std::cout << "\nLatency: " << format_ms(verdict.latency_ms) << "ms\n";
  return verdict.is_safe ? 0 : kExitUnsafe;
}

int run_redact(std::vector<std::string> args) {
  std::string text;
  if (!take_text(args, text)) {
    std::cerr << "usage: llmshield redact <text|->\n";
    return 1;
  }
  auto session = open_session();
  if (!session.ok()) {
    return fail(session.error());
  }
  auto redacted = session.value().guard->redact(text);
  if (!redacted.ok()) {
    return fail(redacted.error());
  }
  std::cout << redacted.value() << "\n";
  return 0;
}

int run_report(std::vector<std::string> args) {
  std::string text;
  if (!take_text(args, text)) {
    std::cerr << "usage: llmshield report <text|->\n";
    return 1;
  }
  const validators::PiiValidator pii;
  auto report = pii.generate_report(text);
  if (!report.ok()) {
    return fail(report.error());
  }
  std::cout << report.value() << "\n";
  return 0;
}

int run_interactive() {
  auto session = open_session();
  if (!session.ok()) {
    return fail(session.error());
  }
  auto &shield = *session.value().guard;

  std::cout << "llmshield interactive mode\n";
  std::cout << "Type 'quit' to exit\n";
  std::cout << std::string(40, '-') << "\n";

  std::string line;
  while (true) {
    std::cout << "\n> " << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\n";
      break;
    }
    const std::string text = common::trim(line);
    if (text.empty()) {
      continue;
    }
    if (common::to_lower(text) == "quit") {
      break;
    }
    auto result = shield.check(text);
    if (!result.ok()) {
      std::cerr << "error: " << result.error() << "\n";
      continue;
    }
    print_verdict(result.value());
  }

  std::cout << guard::to_json(shield.metrics()) << "\n";
  std::cout << "Goodbye!\n";
  return 0;
}

int run_rules(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: llmshield rules list|add|remove\n";
    return 1;
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto session = open_session();
  if (!session.ok()) {
    return fail(session.error());
  }
  auto &shield = *session.value().guard;
  const auto rules_path = rules_file_path(session.value().config);

  if (action == "list") {
    const auto rules = shield.custom_rules();
    if (rules.empty()) {
      std::cout << "No custom rules.\n";
      return 0;
    }
    for (const auto &rule : rules) {
      std::cout << rule.name << "  " << rules::rule_action_name(rule.action) << "  priority "
                << rule.priority << "  /" << rule.pattern << "/";
      if (!rule.message.empty()) {
        std::cout << "  " << common::json_quote(rule.message);
      }
      std::cout << "\n";
    }
    return 0;
  }

  if (action == "add") {
    rules::CustomRuleSpec spec;
    std::string action_raw;
    if (take_option(args, "--action", "-a", action_raw)) {
      const auto parsed = rules::parse_rule_action(action_raw);
      if (!parsed.has_value()) {
        return fail("unknown rule action: " + action_raw);
      }
      spec.action = *parsed;
    }
    take_option(args, "--message", "-m", spec.message);
    std::string priority_raw;
    if (take_option(args, "--priority", "-p", priority_raw)) {
      const auto [ptr, ec] = std::from_chars(
          priority_raw.data(), priority_raw.data() + priority_raw.size(), spec.priority);
      if (ec != std::errc() || ptr != priority_raw.data() + priority_raw.size()) {
        return fail("priority must be an integer: " + priority_raw);
      }
    }
    std::string replacement;
    if (take_option(args, "--replacement", "", replacement)) {
      spec.replacement = replacement;
    }
    if (args.size() != 2) {
      std::cerr << "usage: llmshield rules add <name> <pattern> [--action block|flag|redact|allow]"
                   " [--message MSG] [--priority N] [--replacement TEXT]\n";
      return 1;
    }
    spec.name = args[0];
    spec.pattern = args[1];
    const std::string name = spec.name;
    if (auto added = shield.add_custom_rule(std::move(spec)); !added.ok()) {
      return fail(added.error());
    }
    if (auto saved = shield.save_config(rules_path); !saved.ok()) {
      return fail(saved.error());
    }
    std::cout << "Added rule '" << name << "' to " << rules_path.string() << "\n";
    return 0;
  }

  if (action == "remove") {
    if (args.size() != 1) {
      std::cerr << "usage: llmshield rules remove <name>\n";
      return 1;
    }
    if (!shield.remove_custom_rule(args[0])) {
      return fail("no rule named '" + args[0] + "'");
    }
    if (auto saved = shield.save_config(rules_path); !saved.ok()) {
      return fail(saved.error());
    }
    std::cout << "Removed rule '" << args[0] << "'\n";
    return 0;
  }

  std::cerr << "unknown rules command: " << action << "\n";
  return 1;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      return fail(path.error());
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }
  if (!args.empty() && args[0] != "show") {
    std::cerr << "unknown config command\n";
    return 1;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return fail(warnings.error());
  }
  std::cout << config::render_config(cfg.value());
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  llmshield" << RESET << DIM
            << "  Safety screening for LLM inputs and outputs" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "llmshield [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SCREENING" << RESET << "\n";
  std::cout << "  " << GREEN << "check" << RESET << " TEXT" << DIM
            << "     Check text safety (--checks a,b --detailed --json)" << RESET << "\n";
  std::cout << "  " << GREEN << "analyze" << RESET << " TEXT" << DIM
            << "   Run every check with scores and details" << RESET << "\n";
  std::cout << "  " << GREEN << "redact" << RESET << " TEXT" << DIM
            << "    Redact PII and apply redact rules" << RESET << "\n";
  std::cout << "  " << GREEN << "report" << RESET << " TEXT" << DIM
            << "    Print a PII detection report" << RESET << "\n";
  std::cout << "  " << GREEN << "interactive" << RESET << DIM
            << "      Check lines from stdin until 'quit'" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "rules list" << RESET << DIM << "       List custom rules" << RESET
            << "\n";
  std::cout << "  " << GREEN << "rules add" << RESET << " N P" << DIM
            << "    Add a rule (--action --message --priority --replacement)" << RESET << "\n";
  std::cout << "  " << GREEN << "rules remove" << RESET << " N" << DIM << "   Remove a rule"
            << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM
            << "      Display current configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config path" << RESET << DIM << "      Print the config path"
            << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "          Show version" << RESET
            << "\n\n";
  std::cout << DIM << "  Pass '-' as TEXT to read from stdin." << RESET << "\n\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    return fail(global_error);
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "check") {
    return run_check(std::move(args));
  }
  if (subcommand == "analyze") {
    return run_analyze(std::move(args));
  }
  if (subcommand == "redact") {
    return run_redact(std::move(args));
  }
  if (subcommand == "report") {
    return run_report(std::move(args));
  }
  if (subcommand == "interactive") {
    return run_interactive();
  }
  if (subcommand == "rules") {
    return run_rules(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace llmshield::cli
