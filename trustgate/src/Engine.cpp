#include "trustgate/Engine.h"
#include <chrono>
#include <sstream>

namespace trustgate {

std::string_view to_string(EvaluateStatus s) {
  switch (s) {
    case EvaluateStatus::Ok: return "ok";
    case EvaluateStatus::ValidationError: return "validation_error";
    case EvaluateStatus::CapacityExceeded: return "capacity_exceeded";
  }
  return "validation_error";
}

namespace {

TimeMs resolve_now(TimeMs now_ms) { return now_ms ? now_ms : wall_clock_ms(); }

SignalSet neutral_signals(const char* why) {
  return SignalSet{SignalScore::Neutral(SignalSource::Similarity, why),
                   SignalScore::Neutral(SignalSource::Drift, why),
                   SignalScore::Neutral(SignalSource::Context, why),
                   SignalScore::Neutral(SignalSource::Graph, why)};
}

} // namespace

Engine::Engine(const EngineConfig& cfg, std::shared_ptr<IScorer> context_scorer,
               std::shared_ptr<IScorer> graph_scorer, IMetricSink* metrics, IAuditSink* audit)
    : config_(cfg),
      metrics_(metrics ? metrics : &noop_),
      audit_(audit ? audit : &noop_audit_),
      locks_(cfg.admission.user_lock_shards),
      scorers_(std::move(context_scorer), std::move(graph_scorer), cfg.scorers.threads,
               cfg.scorers.max_queue, metrics_) {}

EngineCreateResult Engine::create(const EngineConfig& cfg, std::shared_ptr<IScorer> context_scorer,
                                  std::shared_ptr<IScorer> graph_scorer, IMetricSink* metrics,
                                  IAuditSink* audit) {
  EngineCreateResult res{};
  res.status = validate_config(cfg);
  if (!res.status.ok) return res;
  res.engine.reset(new Engine(cfg, std::move(context_scorer), std::move(graph_scorer), metrics, audit));
  return res;
}

EvaluateResult Engine::reject(const DecisionRequest& req, EvaluateStatus status,
                              RejectReason reason, TimeMs now_ms) {
  rejected_.fetch_add(1);
  metrics_->inc_counter("trustgate_rejected_total", 1, {{"reason", std::string(to_string(reason))}});
  audit_->on_rejected(RejectEvent{req.user_id, req.session_id, reason, now_ms});
  EvaluateResult res{};
  res.status = status;
  res.reason = reason;
  return res;
}

Decision Engine::no_telemetry(const DecisionRequest& req, const PhaseGate& gate, uint32_t failures,
                              const EngineConfig& cfg, TimeMs now_ms) const {
  Decision d{};
  d.user_id = req.user_id;
  d.session_id = req.session_id;
  d.decided_at_ms = now_ms;
  d.phase = gate.phase;
  d.level = gate.level;

  FusedRisk risk = EnsembleFusion(cfg.weights).fuse(neutral_signals("no_telemetry"));
  d.fused_risk = risk.score;
  d.confidence = 0.0;
  d.breakdown = risk.breakdown;

  if (failures >= cfg.policy.max_failures_per_hour) {
    d.verdict = Verdict::Block;
    d.rule = Rule::Lockout;
  } else {
    d.verdict = gate.enforce_risk ? Verdict::Challenge : Verdict::Allow;
    d.rule = Rule::NoTelemetry;
  }

  std::ostringstream os;
  os << "rule=" << to_string(d.rule) << " verdict=" << to_string(d.verdict)
     << " phase=" << to_string(d.phase) << " behavioral vector empty, profile unchanged";
  d.explanation = os.str();
  return d;
}

EvaluateResult Engine::evaluate(const DecisionRequest& req) {
  auto started = std::chrono::steady_clock::now();
  total_.fetch_add(1);
  const TimeMs now = resolve_now(req.now_ms);
  std::shared_ptr<const EngineConfig> snap = config_.snapshot();
  const EngineConfig& cfg = *snap;

  AdmissionTicket ticket = admission_.try_admit(cfg.admission.max_concurrent_sessions);
  if (!ticket.admitted()) {
    return reject(req, EvaluateStatus::CapacityExceeded, RejectReason::CapacityExceeded, now);
  }

  auto pre = precheck_request(req, cfg.vectors.dimension, cfg.limits);
  if (!pre.ok) return reject(req, EvaluateStatus::ValidationError, pre.reason, now);

  auto user_lock = locks_.lock(req.user_id);

  const PhaseGate gate = PhaseManager::gate(phases_.phase_of(req.user_id), cfg.phases);
  const uint32_t failures = failures_.count(req.user_id, now, cfg.policy.failures);

  if (all_zero(req.behavioral_vector)) {
    EvaluateResult res{};
    res.decision = no_telemetry(req, gate, failures, cfg, now);
    metrics_->inc_counter("trustgate_empty_telemetry_total", 1);
    user_lock.unlock();
    report(*res.decision, neutral_signals("no_telemetry"),
           std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
    return res;
  }

  PolicyOrchestrator policy(cfg.policy);

  // External models run on the pool while the in-process layers score.
  auto input = std::make_shared<ScorerInput>();
  input->user_id = req.user_id;
  input->session_id = req.session_id;
  input->behavioral_vector = req.behavioral_vector;
  input->context_features = req.context_features;
  input->session_graph = req.session_graph;
  input->risk = RiskContext{policy.high_value(req.transaction_amount), req.device_integrity_ok,
                            gate.phase};
  ExternalScorers::Pending pending = scorers_.launch(input, cfg.scorers);

  SimilarityResult sim = SimilarityMatcher(cfg.similarity)
                             .match(vectors_, req.user_id, req.behavioral_vector, cfg.vectors);
  DriftAssessment drift = drift_.assess(req.user_id, req.behavioral_vector, cfg.drift);
  ExternalOutcome ext = scorers_.collect(pending, cfg.scorers);

  SignalSet signals{sim.signal, drift.signal, ext.context, ext.graph};
  FusedRisk risk = EnsembleFusion(cfg.weights).fuse(signals);

  PolicyInput in{};
  in.fused_risk = risk.score;
  in.phase = gate.phase;
  in.enforce_risk = gate.enforce_risk;
  in.level = gate.level;
  in.transaction_amount = req.transaction_amount;
  in.device_integrity_ok = req.device_integrity_ok;
  in.failure_count = failures;
  PolicyOutcome out = policy.decide(in);

  // Feedback. A locked-out user learns nothing; blocked telemetry never joins
  // the profile but counts toward lockout.
  DriftCommit committed{};
  if (out.rule == Rule::Lockout) {
    metrics_->inc_counter("trustgate_lockout_total", 1);
  } else if (out.verdict == Verdict::Block) {
    failures_.record(req.user_id, now, cfg.policy.failures);
  } else {
    InsertResult ins = vectors_.insert(
        req.user_id, BehavioralVector{req.behavioral_vector, now, req.session_id}, cfg.vectors);
    if (!ins.ok()) {
      metrics_->inc_counter("trustgate_feedback_skipped_total", 1, {{"stage", "vector_store"}});
    } else {
      committed = drift_.commit(req.user_id, req.behavioral_vector, now, cfg.drift);
      if (committed.baseline_created) metrics_->inc_counter("trustgate_baseline_created_total", 1);
      if (committed.baseline_adapted) metrics_->inc_counter("trustgate_baseline_adapted_total", 1);
      if (committed.baseline_frozen) metrics_->inc_counter("trustgate_baseline_frozen_total", 1);
    }
    auto transition = phases_.record_analysis(req.user_id, req.session_id, now, cfg.phases);
    if (transition) {
      metrics_->inc_counter("trustgate_phase_transition_total", 1,
                            {{"from", std::string(to_string(transition->from))},
                             {"to", std::string(to_string(transition->to))}});
    }
  }

  EvaluateResult res{};
  Decision& d = res.decision.emplace();
  d.verdict = out.verdict;
  d.fused_risk = risk.score;
  d.confidence = risk.confidence;
  d.phase = gate.phase;
  d.level = gate.level;
  d.rule = out.rule;
  d.drift_alert = drift.alert;
  d.breakdown = risk.breakdown;
  d.explanation = policy.explain(
      in, out, risk, ExplainNotes{to_string(sim.tier), drift.alert, committed.baseline_frozen});
  d.user_id = req.user_id;
  d.session_id = req.session_id;
  d.decided_at_ms = now;

  user_lock.unlock();
  report(d, signals,
         std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());
  return res;
}

void Engine::report(const Decision& d, const SignalSet& signals, double elapsed_ms) {
  switch (d.verdict) {
    case Verdict::Allow: allowed_.fetch_add(1); break;
    case Verdict::Challenge: challenged_.fetch_add(1); break;
    case Verdict::Block: blocked_.fetch_add(1); break;
  }
  decided_.fetch_add(1);
  latency_us_total_.fetch_add(static_cast<uint64_t>(elapsed_ms * 1000.0));

  metrics_->inc_counter("trustgate_decisions_total", 1,
                        {{"verdict", std::string(to_string(d.verdict))},
                         {"phase", std::string(to_string(d.phase))},
                         {"rule", std::string(to_string(d.rule))}});
  metrics_->observe_histogram("trustgate_fused_risk", d.fused_risk);
  metrics_->observe_histogram("trustgate_decision_latency_ms", elapsed_ms);

  if (d.rule != Rule::NoTelemetry) {
    for (const auto& s : signals) {
      if (!s.degraded) continue;
      degraded_.fetch_add(1);
      metrics_->inc_counter("trustgate_signal_degraded_total", 1,
                            {{"source", std::string(to_string(s.source))}, {"reason", s.reason}});
      audit_->on_degraded(DegradedEvent{d.user_id, d.session_id, s.source, s.reason, d.decided_at_ms});
    }
  }
  audit_->on_decision(d);
}

SessionEndResult Engine::end_session(const UserId& user, const SessionId& session, TimeMs now_ms) {
  auto snap = config_.snapshot();
  auto lock = locks_.lock(user);
  SessionEndResult res = phases_.complete_session(user, session, resolve_now(now_ms), snap->phases);
  if (res.counted) metrics_->inc_counter("trustgate_sessions_completed_total", 1);
  if (res.after != res.before) {
    metrics_->inc_counter("trustgate_phase_transition_total", 1,
                          {{"from", std::string(to_string(res.before))},
                           {"to", std::string(to_string(res.after))}});
  }
  return res;
}

uint32_t Engine::record_challenge_outcome(const UserId& user, bool passed, TimeMs now_ms) {
  auto snap = config_.snapshot();
  const TimeMs now = resolve_now(now_ms);
  auto lock = locks_.lock(user);
  metrics_->inc_counter("trustgate_challenge_outcome_total", 1,
                        {{"result", passed ? "passed" : "failed"}});
  if (passed) return failures_.count(user, now, snap->policy.failures);
  return failures_.record(user, now, snap->policy.failures);
}

bool Engine::reset_profile(const UserId& user) {
  auto lock = locks_.lock(user);
  bool had_vectors = vectors_.erase(user);
  bool had_drift = drift_.erase(user);
  bool had_phase = phases_.reset(user);
  bool had_failures = failures_.reset(user);
  bool existed = had_vectors || had_drift || had_phase || had_failures;
  if (existed) metrics_->inc_counter("trustgate_profile_reset_total", 1);
  return existed;
}

std::optional<UserStatus> Engine::user_status(const UserId& user, TimeMs now_ms) {
  auto snap = config_.snapshot();
  auto lock = locks_.lock(user);
  auto state = phases_.lookup(user);
  if (!state) return std::nullopt;

  UserStatus st{};
  st.phase = state->phase;
  st.session_count = state->session_count;
  st.sessions_needed = PhaseManager::sessions_needed(*state, snap->phases);
  st.vector_count = vectors_.size(user);
  st.has_baseline = drift_.has_baseline(user);
  st.baseline_updated_ms = drift_.baseline_updated_at(user);
  st.failure_count = failures_.count(user, resolve_now(now_ms), snap->policy.failures);
  return st;
}

EngineStats Engine::stats() const {
  EngineStats s{};
  s.total_requests = total_.load();
  s.allowed = allowed_.load();
  s.challenged = challenged_.load();
  s.blocked = blocked_.load();
  s.rejected = rejected_.load();
  s.degraded_signals = degraded_.load();
  uint64_t decided = decided_.load();
  if (decided > 0) {
    s.avg_processing_ms = static_cast<double>(latency_us_total_.load()) / 1000.0 /
                          static_cast<double>(decided);
  }
  s.in_flight = admission_.in_flight();
  s.store = vectors_.stats();
  return s;
}

HealthReport Engine::health() const {
  HealthReport h{};
  h.context_scorer = scorers_.context_healthy();
  h.graph_scorer = scorers_.graph_healthy();
  metrics_->set_gauge("trustgate_context_scorer_up", h.context_scorer ? 1.0 : 0.0);
  metrics_->set_gauge("trustgate_graph_scorer_up", h.graph_scorer ? 1.0 : 0.0);
  return h;
}

ConfigStatus Engine::reload_config(const EngineConfig& next) {
  ConfigStatus st = config_.reload(next);
  metrics_->inc_counter("trustgate_config_reload_total", 1,
                        {{"result", st.ok ? "ok" : std::string(to_string(st.error))}});
  return st;
}

} // namespace trustgate
