#include "test_framework.hpp"

#include "llmshield/guard/metrics.hpp"
#include "llmshield/guard/result_cache.hpp"

#include <memory>

namespace {

std::shared_ptr<const llmshield::guard::SafetyResult> make_result(const bool safe,
                                                                  const std::string &reason = "") {
  llmshield::guard::SafetyResult result;
  result.is_safe = safe;
  if (!safe) {
    result.reason = reason;
  }
  return std::make_shared<const llmshield::guard::SafetyResult>(result);
}

} // namespace

void register_metrics_cache_tests(std::vector<llmshield::tests::TestCase> &tests) {
  using llmshield::tests::require;
  namespace guard = llmshield::guard;

  tests.push_back({"cache_evicts_oldest_insertion", [] {
                     guard::ResultCache cache(2);
                     cache.put("a", make_result(true));
                     cache.put("b", make_result(true));
                     // Reading "a" does not protect it from eviction.
                     require(cache.get("a") != nullptr, "a should be cached");
                     cache.put("c", make_result(true));
                     require(cache.size() == 2, "capacity should be respected");
                     require(cache.get("a") == nullptr, "oldest insertion should be evicted");
                     require(cache.get("b") != nullptr && cache.get("c") != nullptr,
                             "newer entries should remain");
                   }});

  tests.push_back({"cache_put_replaces_without_growing", [] {
                     guard::ResultCache cache(2);
                     cache.put("a", make_result(true));
                     cache.put("b", make_result(true));
                     cache.put("a", make_result(false, "changed"));
                     require(cache.size() == 2, "replacement should not grow the cache");
                     require(!cache.get("a")->is_safe, "replacement should be visible");
                     cache.put("c", make_result(true));
                     require(cache.get("a") == nullptr, "replacement keeps the original slot");
                   }});

  tests.push_back({"cache_clear_and_null_results", [] {
                     guard::ResultCache cache(4);
                     cache.put("a", nullptr);
                     require(cache.size() == 0, "null results are not stored");
                     cache.put("a", make_result(true));
                     cache.clear();
                     require(cache.size() == 0 && cache.get("a") == nullptr, "clear should empty");
                     require(cache.capacity() == 4, "capacity is fixed");
                   }});

  tests.push_back({"metrics_count_checks_and_blocks", [] {
                     guard::MetricsAccumulator metrics;
                     guard::SafetyResult safe;
                     guard::SafetyResult unsafe;
                     unsafe.is_safe = false;
                     unsafe.triggered_checks = {"pii"};

                     metrics.record({"pii", "toxicity"}, safe, 2.0, false);
                     metrics.record({"pii", "toxicity"}, unsafe, 4.0, false);
                     metrics.record({"pii"}, unsafe, 0.0, true);

                     const auto snapshot = metrics.snapshot();
                     require(snapshot.total_checks == 3, "three checks recorded");
                     require(snapshot.blocked == 2, "two blocked");
                     require(snapshot.block_rate == 2.0 / 3.0, "block rate mismatch");
                     require(snapshot.avg_latency_ms == 2.0, "average latency mismatch");
                     require(snapshot.check_counts.at("pii") == 3, "pii ran three times");
                     require(snapshot.check_counts.at("toxicity") == 2, "toxicity ran twice");
                     require(snapshot.block_counts.at("pii") == 2, "pii blocked twice");
                     require(snapshot.cache_hits == 1, "one cache hit");
                   }});

  tests.push_back({"metrics_rule_blocks_use_custom_key", [] {
                     guard::MetricsAccumulator metrics;
                     guard::SafetyResult ruled;
                     ruled.is_safe = false;
                     ruled.triggered_rules = {{.name = "no-secrets",
                                               .action = llmshield::rules::RuleAction::Block,
                                               .message = "secret",
                                               .priority = 1}};
                     metrics.record({"pii"}, ruled, 1.0, false);

                     guard::SafetyResult allowed;
                     allowed.triggered_rules = ruled.triggered_rules;
                     allowed.allowed_by = "ok";
                     metrics.record({"pii"}, allowed, 1.0, false);

                     const auto snapshot = metrics.snapshot();
                     require(snapshot.block_counts.size() == 1, "only the rule key expected");
                     require(snapshot.block_counts.at(guard::kCustomRulesMetricKey) == 1,
                             "rule block should be counted once");
                   }});

  tests.push_back({"metrics_reset_and_json", [] {
                     guard::MetricsAccumulator metrics;
                     guard::SafetyResult unsafe;
                     unsafe.is_safe = false;
                     unsafe.triggered_checks = {"toxicity"};
                     metrics.record({"toxicity"}, unsafe, 1.0, false);
                     metrics.record({"toxicity"}, guard::SafetyResult{}, 1.0, false);

                     auto snapshot = metrics.snapshot();
                     snapshot.cache_size = 5;
                     const std::string json = guard::to_json(snapshot);
                     require(json.find("\"total_checks\":2") != std::string::npos, json);
                     require(json.find("\"block_rate\":0.5") != std::string::npos, json);
                     require(json.find("\"block_counts\":{\"toxicity\":1}") != std::string::npos,
                             json);
                     require(json.find("\"cache_size\":5") != std::string::npos, json);

                     metrics.reset();
                     const auto cleared = metrics.snapshot();
                     require(cleared.total_checks == 0 && cleared.check_counts.empty(),
                             "reset should clear counters");
                     require(cleared.block_rate == 0.0, "empty block rate is zero");
                   }});
}
