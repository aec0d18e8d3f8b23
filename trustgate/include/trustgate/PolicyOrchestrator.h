#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include "Common.h"
#include "EnsembleFusion.h"
#include "FailureTracker.h"

namespace trustgate {

// Minimum trust (1 - fused risk) per verdict; block < challenge < allow.
struct LevelThresholds {
  double allow{0.75};
  double challenge{0.55};
  double block{0.35};
};

struct PolicyConfig {
  std::array<LevelThresholds, kPolicyLevelCount> levels{{
      {0.60, 0.40, 0.20},  // level_1_basic
      {0.75, 0.55, 0.35},  // level_2_enhanced
      {0.85, 0.70, 0.50},  // level_3_strict
      {0.92, 0.80, 0.65},  // level_4_maximum
  }};
  uint32_t max_failures_per_hour{5};
  FailureWindowConfig failures{};
  double high_value_threshold{10000.0};
};

struct PolicyInput {
  double fused_risk{0.5};
  Phase phase{Phase::ColdStart};
  bool enforce_risk{false};
  PolicyLevel level{PolicyLevel::Level1};
  std::optional<double> transaction_amount{};
  bool device_integrity_ok{true};
  uint32_t failure_count{0};
};

struct PolicyOutcome {
  Verdict verdict{Verdict::Challenge};
  Rule rule{Rule::AmbiguousBand};
  Rule base_rule{Rule::AmbiguousBand};
  double trust{0.5};
};

// Context appended to the explanation text.
struct ExplainNotes {
  std::string_view similarity_tier{"none"};
  bool drift_alert{false};
  bool baseline_frozen{false};
};

class PolicyOrchestrator {
 public:
  explicit PolicyOrchestrator(const PolicyConfig& cfg);

  PolicyOutcome decide(const PolicyInput& in) const;
  std::string explain(const PolicyInput& in, const PolicyOutcome& out, const FusedRisk& risk,
                      const ExplainNotes& notes) const;

  const LevelThresholds& thresholds(PolicyLevel l) const { return cfg_.levels[index_of(l)]; }
  bool high_value(const std::optional<double>& amount) const;

 private:
  PolicyOutcome by_threshold(double fused_risk, PolicyLevel level) const;

  PolicyConfig cfg_{};
};

} // namespace trustgate
