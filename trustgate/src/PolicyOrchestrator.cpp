#include "trustgate/PolicyOrchestrator.h"
#include "trustgate/Util.h"
#include <iomanip>
#include <sstream>

namespace trustgate {

PolicyOrchestrator::PolicyOrchestrator(const PolicyConfig& cfg) : cfg_(cfg) {}

bool PolicyOrchestrator::high_value(const std::optional<double>& amount) const {
  return amount.has_value() && *amount >= cfg_.high_value_threshold;
}

PolicyOutcome PolicyOrchestrator::by_threshold(double fused_risk, PolicyLevel level) const {
  const LevelThresholds& t = thresholds(level);
  PolicyOutcome out{};
  out.trust = 1.0 - clamp01(fused_risk);
  if (out.trust <= t.block) {
    out.verdict = Verdict::Block;
    out.rule = Rule::ThresholdBlock;
  } else if (out.trust <= t.challenge) {
    out.verdict = Verdict::Challenge;
    out.rule = Rule::ThresholdChallenge;
  } else if (out.trust >= t.allow) {
    out.verdict = Verdict::Allow;
    out.rule = Rule::ThresholdAllow;
  } else {
    out.verdict = Verdict::Challenge;
    out.rule = Rule::AmbiguousBand;
  }
  out.base_rule = out.rule;
  return out;
}

PolicyOutcome PolicyOrchestrator::decide(const PolicyInput& in) const {
  PolicyOutcome out{};
  out.trust = 1.0 - clamp01(in.fused_risk);

  if (in.failure_count >= cfg_.max_failures_per_hour) {
    out.verdict = Verdict::Block;
    out.rule = out.base_rule = Rule::Lockout;
    return out;
  }

  if (!in.enforce_risk) {
    if (!in.device_integrity_ok) {
      out.verdict = Verdict::Challenge;
      out.rule = out.base_rule = Rule::LearningIntegrity;
    } else {
      out.verdict = Verdict::Allow;
      out.rule = out.base_rule = Rule::LearningAllow;
    }
    return out;
  }

  out = by_threshold(in.fused_risk, in.level);
  if (out.verdict == Verdict::Allow && high_value(in.transaction_amount)) {
    out.verdict = Verdict::Challenge;
    out.rule = Rule::HighValueEscalation;
  } else if (out.verdict == Verdict::Allow && !in.device_integrity_ok) {
    out.verdict = Verdict::Challenge;
    out.rule = Rule::IntegrityEscalation;
  }
  return out;
}

std::string PolicyOrchestrator::explain(const PolicyInput& in, const PolicyOutcome& out,
                                        const FusedRisk& risk, const ExplainNotes& notes) const {
  std::ostringstream os;
  os << std::fixed << std::setprecision(3);
  os << "rule=" << to_string(out.rule);
  if (out.base_rule != out.rule) os << " (from " << to_string(out.base_rule) << ")";
  os << " verdict=" << to_string(out.verdict) << " phase=" << to_string(in.phase);

  if (out.rule == Rule::Lockout) {
    os << " failures=" << in.failure_count << "/" << cfg_.max_failures_per_hour;
  }
  if (in.enforce_risk) {
    const LevelThresholds& t = thresholds(in.level);
    os << " level=" << to_string(in.level) << " trust=" << out.trust << " [allow>=" << t.allow
       << " challenge<=" << t.challenge << " block<=" << t.block << "]";
  } else {
    os << " risk_not_enforced";
  }
  if (out.rule == Rule::HighValueEscalation && in.transaction_amount) {
    os << " amount=" << *in.transaction_amount << ">=" << cfg_.high_value_threshold;
  }

  os << " fused_risk=" << risk.score << " contributions:";
  for (const auto& c : risk.breakdown) {
    os << " " << to_string(c.source) << "=" << c.contribution;
    if (c.degraded) os << "(degraded)";
  }
  os << " similarity_tier=" << notes.similarity_tier;
  if (notes.drift_alert) os << " drift_alert";
  if (notes.baseline_frozen) os << " baseline_frozen";
  if (!in.device_integrity_ok) os << " device_integrity_failed";
  return os.str();
}

} // namespace trustgate
