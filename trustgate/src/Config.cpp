#include "trustgate/Config.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace trustgate {

using nlohmann::json;

std::string_view to_string(ConfigError e) {
  switch (e) {
    case ConfigError::None: return "none";
    case ConfigError::FileUnreadable: return "file_unreadable";
    case ConfigError::Malformed: return "malformed";
    case ConfigError::OutOfRange: return "out_of_range";
    case ConfigError::WeightSum: return "weight_sum";
    case ConfigError::ThresholdOrder: return "threshold_order";
    case ConfigError::PhaseOrder: return "phase_order";
    case ConfigError::ImmutableChanged: return "immutable_changed";
  }
  return "malformed";
}

namespace {

bool unit_interval(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

// Type-checked field reader. The first mismatch is kept in error_.
class FieldReader {
 public:
  const json* section(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) {
      fail(key, "expected an object");
      return nullptr;
    }
    return &*it;
  }

  void number(const json* obj, const char* key, double& out) {
    const json* v = field(obj, key);
    if (!v) return;
    if (!v->is_number()) return fail(key, "expected a number");
    out = v->get<double>();
  }

  template <typename T>
  void count(const json* obj, const char* key, T& out) {
    const json* v = field(obj, key);
    if (!v) return;
    if (!v->is_number_unsigned()) return fail(key, "expected a non-negative integer");
    uint64_t raw = v->get<uint64_t>();
    if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max())) return fail(key, "too large");
    out = static_cast<T>(raw);
  }

  void level(const json* obj, const char* key, PolicyLevel& out) {
    const json* v = field(obj, key);
    if (!v) return;
    if (!v->is_string()) return fail(key, "expected a policy level name");
    auto parsed = parse_policy_level(v->get<std::string>());
    if (!parsed) return fail(key, "unknown policy level");
    out = *parsed;
  }

  bool failed() const { return !error_.empty(); }
  const std::string& error() const { return error_; }

 private:
  const json* field(const json* obj, const char* key) const {
    if (!obj || failed()) return nullptr;
    auto it = obj->find(key);
    return it == obj->end() ? nullptr : &*it;
  }

  void fail(const char* key, const char* what) {
    if (error_.empty()) error_ = std::string(key) + ": " + what;
  }

  std::string error_;
};

void read_config(const json& root, FieldReader& r, EngineConfig& cfg) {
  if (const json* s = r.section(root, "vector_store")) {
    r.count(s, "dimension", cfg.vectors.dimension);
    r.count(s, "max_vectors_per_user", cfg.vectors.max_vectors_per_user);
    r.count(s, "min_vectors_for_search", cfg.vectors.min_vectors_for_search);
  }
  if (const json* s = r.section(root, "similarity")) {
    r.count(s, "top_k", cfg.similarity.top_k);
    if (const json* t = r.section(*s, "thresholds")) {
      r.number(t, "high", cfg.similarity.high_threshold);
      r.number(t, "medium", cfg.similarity.medium_threshold);
      r.number(t, "low", cfg.similarity.low_threshold);
    }
  }
  if (const json* s = r.section(root, "drift")) {
    r.count(s, "window_size", cfg.drift.window_size);
    r.number(s, "drift_threshold", cfg.drift.drift_threshold);
    r.number(s, "baseline_adaptation_threshold", cfg.drift.baseline_adaptation_threshold);
    r.number(s, "adaptation_rate", cfg.drift.adaptation_rate);
  }
  if (const json* s = r.section(root, "scorers")) {
    r.count(s, "timeout_ms", cfg.scorers.timeout_ms);
    r.count(s, "threads", cfg.scorers.threads);
    r.count(s, "max_queue", cfg.scorers.max_queue);
    r.number(s, "min_feature_coverage", cfg.scorers.min_feature_coverage);
    r.number(s, "high_value_confidence_scale", cfg.scorers.high_value_confidence_scale);
    r.number(s, "integrity_fail_confidence_scale", cfg.scorers.integrity_fail_confidence_scale);
  }
  if (const json* s = r.section(root, "ensemble_weights")) {
    r.number(s, "similarity", cfg.weights.similarity);
    r.number(s, "drift", cfg.weights.drift);
    r.number(s, "context", cfg.weights.context);
    r.number(s, "graph", cfg.weights.graph);
  }
  if (const json* s = r.section(root, "phases")) {
    r.count(s, "learning_threshold", cfg.phases.learning_threshold);
    r.count(s, "gradual_threshold", cfg.phases.gradual_threshold);
    r.level(s, "gradual_level", cfg.phases.gradual_level);
    r.level(s, "full_auth_level", cfg.phases.full_auth_level);
    r.count(s, "max_open_sessions", cfg.phases.max_open_sessions);
    r.count(s, "max_closed_sessions", cfg.phases.max_closed_sessions);
  }
  if (const json* s = r.section(root, "policy")) {
    if (const json* levels = r.section(*s, "levels")) {
      for (size_t i = 0; i < kPolicyLevelCount; ++i) {
        auto name = std::string(to_string(static_cast<PolicyLevel>(i)));
        if (const json* l = r.section(*levels, name.c_str())) {
          r.number(l, "allow", cfg.policy.levels[i].allow);
          r.number(l, "challenge", cfg.policy.levels[i].challenge);
          r.number(l, "block", cfg.policy.levels[i].block);
        }
      }
    }
    r.count(s, "max_failures_per_hour", cfg.policy.max_failures_per_hour);
    r.count(s, "failure_window_ms", cfg.policy.failures.window_ms);
    r.count(s, "max_tracked_failures", cfg.policy.failures.max_tracked_per_user);
    r.number(s, "high_value_threshold", cfg.policy.high_value_threshold);
  }
  if (const json* s = r.section(root, "admission")) {
    r.count(s, "max_concurrent_sessions", cfg.admission.max_concurrent_sessions);
    r.count(s, "user_lock_shards", cfg.admission.user_lock_shards);
  }
  if (const json* s = r.section(root, "limits")) {
    r.count(s, "max_id_len", cfg.limits.max_id_len);
    r.count(s, "max_graph_nodes", cfg.limits.max_graph_nodes);
    r.count(s, "max_graph_edges", cfg.limits.max_graph_edges);
    r.count(s, "max_context_features", cfg.limits.max_context_features);
  }
}

} // namespace

ConfigStatus validate_config(const EngineConfig& cfg) {
  const auto& v = cfg.vectors;
  if (v.dimension == 0 || v.min_vectors_for_search == 0 ||
      v.max_vectors_per_user < v.min_vectors_for_search) {
    return ConfigStatus::Fail(ConfigError::OutOfRange,
                              "vector_store: need dimension > 0 and max_vectors >= min_vectors >= 1");
  }

  const auto& s = cfg.similarity;
  if (s.top_k == 0) return ConfigStatus::Fail(ConfigError::OutOfRange, "similarity.top_k must be >= 1");
  if (!unit_interval(s.low_threshold) || !unit_interval(s.medium_threshold) ||
      !unit_interval(s.high_threshold) || !(s.low_threshold < s.medium_threshold) ||
      !(s.medium_threshold < s.high_threshold)) {
    return ConfigStatus::Fail(ConfigError::ThresholdOrder,
                              "similarity thresholds must satisfy 0 <= low < medium < high <= 1");
  }

  const auto& d = cfg.drift;
  if (d.window_size == 0 || !unit_interval(d.drift_threshold) ||
      !unit_interval(d.baseline_adaptation_threshold) || !(d.adaptation_rate > 0.0) ||
      !unit_interval(d.adaptation_rate)) {
    return ConfigStatus::Fail(ConfigError::OutOfRange, "drift: window >= 1, thresholds and rate in [0,1]");
  }

  const auto& sc = cfg.scorers;
  if (sc.timeout_ms == 0 || sc.threads == 0 || sc.max_queue == 0 ||
      !unit_interval(sc.min_feature_coverage) || !unit_interval(sc.high_value_confidence_scale) ||
      !unit_interval(sc.integrity_fail_confidence_scale)) {
    return ConfigStatus::Fail(ConfigError::OutOfRange,
                              "scorers: timeout, threads and queue >= 1; scales in [0,1]");
  }

  const auto& w = cfg.weights;
  for (double x : {w.similarity, w.drift, w.context, w.graph}) {
    if (!unit_interval(x)) {
      return ConfigStatus::Fail(ConfigError::WeightSum, "ensemble weights must each lie in [0,1]");
    }
  }
  if (std::fabs(w.sum() - 1.0) > kWeightSumTolerance) {
    std::ostringstream os;
    os << "ensemble weights sum to " << w.sum() << ", expected 1.0";
    return ConfigStatus::Fail(ConfigError::WeightSum, os.str());
  }

  const auto& p = cfg.phases;
  if (p.learning_threshold == 0 || !(p.learning_threshold < p.gradual_threshold)) {
    return ConfigStatus::Fail(ConfigError::PhaseOrder,
                              "phases: need 1 <= learning_threshold < gradual_threshold");
  }
  if (p.max_open_sessions == 0) {
    return ConfigStatus::Fail(ConfigError::OutOfRange, "phases.max_open_sessions must be >= 1");
  }
  if (p.max_closed_sessions == 0) {
    return ConfigStatus::Fail(ConfigError::OutOfRange, "phases.max_closed_sessions must be >= 1");
  }

  const auto& pol = cfg.policy;
  for (size_t i = 0; i < kPolicyLevelCount; ++i) {
    const auto& t = pol.levels[i];
    if (!unit_interval(t.block) || !unit_interval(t.challenge) || !unit_interval(t.allow) ||
        !(t.block < t.challenge) || !(t.challenge < t.allow)) {
      return ConfigStatus::Fail(ConfigError::ThresholdOrder,
                                std::string(to_string(static_cast<PolicyLevel>(i))) +
                                    ": need 0 <= block < challenge < allow <= 1");
    }
  }
  if (pol.max_failures_per_hour == 0 || pol.failures.window_ms == 0 ||
      pol.failures.max_tracked_per_user < pol.max_failures_per_hour) {
    return ConfigStatus::Fail(ConfigError::OutOfRange,
                              "policy: max_failures >= 1, window >= 1 ms, tracked >= max_failures");
  }
  if (!std::isfinite(pol.high_value_threshold) || pol.high_value_threshold < 0.0) {
    return ConfigStatus::Fail(ConfigError::OutOfRange, "policy.high_value_threshold must be >= 0");
  }

  if (cfg.admission.max_concurrent_sessions == 0 || cfg.admission.user_lock_shards == 0) {
    return ConfigStatus::Fail(ConfigError::OutOfRange, "admission limits must be >= 1");
  }
  const auto& l = cfg.limits;
  if (l.max_id_len == 0 || l.max_graph_nodes == 0 || l.max_graph_edges == 0 ||
      l.max_context_features == 0) {
    return ConfigStatus::Fail(ConfigError::OutOfRange, "request limits must be >= 1");
  }
  return ConfigStatus::Ok();
}

ConfigStatus check_reload(const EngineConfig& current, const EngineConfig& next) {
  if (current.vectors.dimension != next.vectors.dimension) {
    return ConfigStatus::Fail(ConfigError::ImmutableChanged, "vector_store.dimension cannot change");
  }
  if (current.scorers.threads != next.scorers.threads ||
      current.scorers.max_queue != next.scorers.max_queue) {
    return ConfigStatus::Fail(ConfigError::ImmutableChanged, "scorer pool size cannot change");
  }
  if (current.admission.user_lock_shards != next.admission.user_lock_shards) {
    return ConfigStatus::Fail(ConfigError::ImmutableChanged, "admission.user_lock_shards cannot change");
  }
  return validate_config(next);
}

ConfigLoadResult parse_config_json(std::string_view text) {
  ConfigLoadResult res{};
  json root = json::parse(text.begin(), text.end(), nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    res.status = ConfigStatus::Fail(ConfigError::Malformed, "config is not a JSON object");
    return res;
  }
  FieldReader r;
  read_config(root, r, res.config);
  if (r.failed()) {
    res.status = ConfigStatus::Fail(ConfigError::Malformed, r.error());
    return res;
  }
  res.status = validate_config(res.config);
  return res;
}

ConfigLoadResult load_config_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ConfigLoadResult res{};
    res.status = ConfigStatus::Fail(ConfigError::FileUnreadable, "cannot open " + path);
    return res;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return parse_config_json(buf.str());
}

std::string config_to_json(const EngineConfig& cfg) {
  json levels = json::object();
  for (size_t i = 0; i < kPolicyLevelCount; ++i) {
    const auto& t = cfg.policy.levels[i];
    levels[std::string(to_string(static_cast<PolicyLevel>(i)))] = {
        {"allow", t.allow}, {"challenge", t.challenge}, {"block", t.block}};
  }
  json root = {
      {"vector_store",
       {{"dimension", cfg.vectors.dimension},
        {"max_vectors_per_user", cfg.vectors.max_vectors_per_user},
        {"min_vectors_for_search", cfg.vectors.min_vectors_for_search}}},
      {"similarity",
       {{"top_k", cfg.similarity.top_k},
        {"thresholds",
         {{"high", cfg.similarity.high_threshold},
          {"medium", cfg.similarity.medium_threshold},
          {"low", cfg.similarity.low_threshold}}}}},
      {"drift",
       {{"window_size", cfg.drift.window_size},
        {"drift_threshold", cfg.drift.drift_threshold},
        {"baseline_adaptation_threshold", cfg.drift.baseline_adaptation_threshold},
        {"adaptation_rate", cfg.drift.adaptation_rate}}},
      {"scorers",
       {{"timeout_ms", cfg.scorers.timeout_ms},
        {"threads", cfg.scorers.threads},
        {"max_queue", cfg.scorers.max_queue},
        {"min_feature_coverage", cfg.scorers.min_feature_coverage},
        {"high_value_confidence_scale", cfg.scorers.high_value_confidence_scale},
        {"integrity_fail_confidence_scale", cfg.scorers.integrity_fail_confidence_scale}}},
      {"ensemble_weights",
       {{"similarity", cfg.weights.similarity},
        {"drift", cfg.weights.drift},
        {"context", cfg.weights.context},
        {"graph", cfg.weights.graph}}},
      {"phases",
       {{"learning_threshold", cfg.phases.learning_threshold},
        {"gradual_threshold", cfg.phases.gradual_threshold},
        {"gradual_level", std::string(to_string(cfg.phases.gradual_level))},
        {"full_auth_level", std::string(to_string(cfg.phases.full_auth_level))},
        {"max_open_sessions", cfg.phases.max_open_sessions},
        {"max_closed_sessions", cfg.phases.max_closed_sessions}}},
      {"policy",
       {{"levels", levels},
        {"max_failures_per_hour", cfg.policy.max_failures_per_hour},
        {"failure_window_ms", cfg.policy.failures.window_ms},
        {"max_tracked_failures", cfg.policy.failures.max_tracked_per_user},
        {"high_value_threshold", cfg.policy.high_value_threshold}}},
      {"admission",
       {{"max_concurrent_sessions", cfg.admission.max_concurrent_sessions},
        {"user_lock_shards", cfg.admission.user_lock_shards}}},
      {"limits",
       {{"max_id_len", cfg.limits.max_id_len},
        {"max_graph_nodes", cfg.limits.max_graph_nodes},
        {"max_graph_edges", cfg.limits.max_graph_edges},
        {"max_context_features", cfg.limits.max_context_features}}},
  };
  return root.dump(2);
}

ConfigStore::ConfigStore(const EngineConfig& initial)
    : current_(std::make_shared<const EngineConfig>(initial)) {}

std::shared_ptr<const EngineConfig> ConfigStore::snapshot() const {
  std::lock_guard lock(mu_);
  return current_;
}

ConfigStatus ConfigStore::reload(const EngineConfig& next) {
  std::lock_guard lock(mu_);
  ConfigStatus st = check_reload(*current_, next);
  if (!st.ok) return st;
  current_ = std::make_shared<const EngineConfig>(next);
  return st;
}

} // namespace trustgate
