#include "trustgate/Common.h"

namespace trustgate {

std::string_view to_string(Verdict v) {
  switch (v) {
    case Verdict::Allow: return "allow";
    case Verdict::Challenge: return "challenge";
    case Verdict::Block: return "block";
  }
  return "challenge";
}

std::string_view to_string(SignalSource s) {
  switch (s) {
    case SignalSource::Similarity: return "similarity";
    case SignalSource::Drift: return "drift";
    case SignalSource::Context: return "context";
    case SignalSource::Graph: return "graph";
  }
  return "unknown";
}

std::string_view to_string(Phase p) {
  switch (p) {
    case Phase::ColdStart: return "cold_start";
    case Phase::Learning: return "learning";
    case Phase::GradualRisk: return "gradual_risk";
    case Phase::FullAuth: return "full_auth";
  }
  return "cold_start";
}

std::string_view to_string(PolicyLevel l) {
  switch (l) {
    case PolicyLevel::Level1: return "level_1";
    case PolicyLevel::Level2: return "level_2";
    case PolicyLevel::Level3: return "level_3";
    case PolicyLevel::Level4: return "level_4";
  }
  return "level_1";
}

std::string_view to_string(Rule r) {
  switch (r) {
    case Rule::Lockout: return "lockout";
    case Rule::LearningAllow: return "learning_allow";
    case Rule::LearningIntegrity: return "learning_integrity";
    case Rule::ThresholdBlock: return "threshold_block";
    case Rule::ThresholdChallenge: return "threshold_challenge";
    case Rule::ThresholdAllow: return "threshold_allow";
    case Rule::AmbiguousBand: return "ambiguous_band";
    case Rule::HighValueEscalation: return "high_value_escalation";
    case Rule::IntegrityEscalation: return "integrity_escalation";
    case Rule::NoTelemetry: return "no_telemetry";
  }
  return "unknown";
}

std::string_view to_string(RejectReason r) {
  switch (r) {
    case RejectReason::None: return "none";
    case RejectReason::MissingUser: return "missing_user";
    case RejectReason::MissingSession: return "missing_session";
    case RejectReason::DimensionMismatch: return "dimension_mismatch";
    case RejectReason::NonFiniteValue: return "non_finite_value";
    case RejectReason::MalformedGraph: return "malformed_graph";
    case RejectReason::BudgetExceeded: return "budget_exceeded";
    case RejectReason::InvalidAmount: return "invalid_amount";
    case RejectReason::CapacityExceeded: return "capacity_exceeded";
  }
  return "unknown";
}

std::optional<PolicyLevel> parse_policy_level(std::string_view name) {
  // Accept the bare level and the descriptive aliases used in policy files.
  if (name == "level_1" || name == "level_1_basic") return PolicyLevel::Level1;
  if (name == "level_2" || name == "level_2_enhanced") return PolicyLevel::Level2;
  if (name == "level_3" || name == "level_3_strict") return PolicyLevel::Level3;
  if (name == "level_4" || name == "level_4_maximum") return PolicyLevel::Level4;
  return std::nullopt;
}

} // namespace trustgate
