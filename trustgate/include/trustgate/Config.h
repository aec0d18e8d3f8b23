#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include "Admission.h"
#include "DriftDetector.h"
#include "EnsembleFusion.h"
#include "ExternalScorer.h"
#include "PhaseManager.h"
#include "PolicyOrchestrator.h"
#include "Precheck.h"
#include "SimilarityMatcher.h"
#include "VectorStore.h"

namespace trustgate {

struct EngineConfig {
  VectorStoreConfig vectors{};
  SimilarityConfig similarity{};
  DriftConfig drift{};
  ScorerConfig scorers{};
  FusionWeights weights{};
  PhaseConfig phases{};
  PolicyConfig policy{};
  AdmissionConfig admission{};
  RequestLimits limits{};
};

enum class ConfigError : uint8_t {
  None = 0,
  FileUnreadable,
  Malformed,
  OutOfRange,
  WeightSum,
  ThresholdOrder,
  PhaseOrder,
  ImmutableChanged,
};

std::string_view to_string(ConfigError e);

struct ConfigStatus {
  bool ok{true};
  ConfigError error{ConfigError::None};
  std::string message{};

  static ConfigStatus Ok() { return {}; }
  static ConfigStatus Fail(ConfigError e, std::string msg) { return {false, e, std::move(msg)}; }
};

struct ConfigLoadResult {
  ConfigStatus status{};
  EngineConfig config{};
};

ConfigStatus validate_config(const EngineConfig& cfg);

// Fields that size long-lived structures (vector dimension, pools, lock
// shards) are fixed for the life of the engine.
ConfigStatus check_reload(const EngineConfig& current, const EngineConfig& next);

// Missing keys keep their defaults. The result is validated.
ConfigLoadResult parse_config_json(std::string_view text);
ConfigLoadResult load_config_file(const std::string& path);
std::string config_to_json(const EngineConfig& cfg);

// Immutable snapshots swapped whole; a request keeps the snapshot it started with.
class ConfigStore {
 public:
  explicit ConfigStore(const EngineConfig& initial);

  std::shared_ptr<const EngineConfig> snapshot() const;
  ConfigStatus reload(const EngineConfig& next);

 private:
  mutable std::mutex mu_;
  std::shared_ptr<const EngineConfig> current_;
};

} // namespace trustgate
