#include "trustgate/Config.h"
#include <cassert>
#include <cstdio>
#include <fstream>

using namespace trustgate;

void test_config() {
  EngineConfig defaults{};
  assert(validate_config(defaults).ok);

  EngineConfig bad = defaults;
  bad.weights.graph = 0.4;
  auto st = validate_config(bad);
  assert(!st.ok && st.error == ConfigError::WeightSum);

  bad = defaults;
  bad.weights = FusionWeights{0.25, 0.25, 0.25, 0.25};
  assert(validate_config(bad).ok);

  bad = defaults;
  bad.policy.levels[index_of(PolicyLevel::Level2)].block = 0.6;
  assert(validate_config(bad).error == ConfigError::ThresholdOrder);

  bad = defaults;
  bad.similarity.low_threshold = 0.9;
  assert(validate_config(bad).error == ConfigError::ThresholdOrder);

  bad = defaults;
  bad.phases.gradual_threshold = bad.phases.learning_threshold;
  assert(validate_config(bad).error == ConfigError::PhaseOrder);

  bad = defaults;
  bad.vectors.min_vectors_for_search = 500;
  assert(validate_config(bad).error == ConfigError::OutOfRange);

  bad = defaults;
  bad.drift.adaptation_rate = 0.0;
  assert(validate_config(bad).error == ConfigError::OutOfRange);

  // Partial documents override only what they name.
  auto loaded = parse_config_json(R"({
    "vector_store": {"dimension": 16},
    "similarity": {"top_k": 3, "thresholds": {"high": 0.9}},
    "phases": {"full_auth_level": "level_3_strict"},
    "policy": {"levels": {"level_1": {"allow": 0.7}}, "max_failures_per_hour": 3},
    "ensemble_weights": {"similarity": 0.2, "drift": 0.2, "context": 0.3, "graph": 0.3}
  })");
  assert(loaded.status.ok);
  assert(loaded.config.vectors.dimension == 16);
  assert(loaded.config.vectors.max_vectors_per_user == 200);
  assert(loaded.config.similarity.top_k == 3);
  assert(loaded.config.similarity.high_threshold == 0.9);
  assert(loaded.config.similarity.medium_threshold == 0.70);
  assert(loaded.config.phases.full_auth_level == PolicyLevel::Level3);
  assert(loaded.config.policy.levels[0].allow == 0.7);
  assert(loaded.config.policy.levels[0].block == 0.20);
  assert(loaded.config.policy.max_failures_per_hour == 3);

  assert(parse_config_json("{not json").status.error == ConfigError::Malformed);
  assert(parse_config_json("[1,2]").status.error == ConfigError::Malformed);
  assert(parse_config_json(R"({"vector_store": {"dimension": -4}})").status.error ==
         ConfigError::Malformed);
  assert(parse_config_json(R"({"vector_store": {"dimension": "90"}})").status.error ==
         ConfigError::Malformed);
  assert(parse_config_json(R"({"drift": []})").status.error == ConfigError::Malformed);
  assert(parse_config_json(R"({"phases": {"gradual_level": "level_9"}})").status.error ==
         ConfigError::Malformed);
  assert(parse_config_json(R"({"ensemble_weights": {"graph": 0.9}})").status.error ==
         ConfigError::WeightSum);

  // Dumped defaults load back as defaults.
  auto again = parse_config_json(config_to_json(defaults));
  assert(again.status.ok);
  assert(config_to_json(again.config) == config_to_json(defaults));

  const char* path = "trustgate_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"scorers": {"timeout_ms": 25}})";
  }
  auto from_file = load_config_file(path);
  std::remove(path);
  assert(from_file.status.ok && from_file.config.scorers.timeout_ms == 25);
  assert(load_config_file("/nonexistent/trustgate.json").status.error == ConfigError::FileUnreadable);

  ConfigStore store(defaults);
  auto first = store.snapshot();
  EngineConfig next = defaults;
  next.policy.high_value_threshold = 500.0;
  assert(store.reload(next).ok);
  assert(store.snapshot()->policy.high_value_threshold == 500.0);
  assert(first->policy.high_value_threshold == 10000.0); // old snapshot untouched

  EngineConfig resized = next;
  resized.vectors.dimension = 32;
  st = store.reload(resized);
  assert(!st.ok && st.error == ConfigError::ImmutableChanged);
  EngineConfig invalid = next;
  invalid.weights.drift = 0.5;
  assert(store.reload(invalid).error == ConfigError::WeightSum);
  assert(store.snapshot()->policy.high_value_threshold == 500.0);
  assert(to_string(ConfigError::WeightSum) == "weight_sum");
}
