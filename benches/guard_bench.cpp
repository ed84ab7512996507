#include "bench_common.hpp"

#include "llmshield/guard/guard.hpp"

#include <vector>

void run_guard_benchmark() {
  llmshield::guard::GuardOptions uncached;
  uncached.cache_enabled = false;
  auto created = llmshield::guard::SafetyGuard::create(uncached);
  if (!created.ok()) {
    std::cerr << "guard setup failed: " << created.error() << "\n";
    return;
  }
  auto &shield = *created.value();
  (void)shield.add_custom_rule(
      {.name = "no-secrets", .pattern = R"(\bsecret\b)", .message = "secret"});

  const std::string text = "Summarise the quarterly report for the board, call 555-123-4567.";
  llmshield::bench::run_bench("guard_check_uncached", 200, [&] { (void)shield.check(text); });

  auto cached = llmshield::guard::SafetyGuard::create();
  if (!cached.ok()) {
    std::cerr << "guard setup failed: " << cached.error() << "\n";
    return;
  }
  (void)cached.value()->check(text);
  llmshield::bench::run_bench("guard_check_cached", 2000,
                              [&] { (void)cached.value()->check(text); });

  const std::vector<std::string> batch(32, text);
  llmshield::bench::run_bench("guard_batch_check_32", 10,
                              [&] { (void)shield.batch_check(batch); });
}
