#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include "Common.h"
#include "Admission.h"
#include "Config.h"
#include "DriftDetector.h"
#include "EnsembleFusion.h"
#include "ExternalScorer.h"
#include "FailureTracker.h"
#include "PhaseManager.h"
#include "PolicyOrchestrator.h"
#include "Precheck.h"
#include "SimilarityMatcher.h"
#include "Telemetry.h"
#include "VectorStore.h"
#include "Util.h"

namespace trustgate {

enum class EvaluateStatus : uint8_t {
  Ok = 0,
  ValidationError = 1,
  CapacityExceeded = 2,
};

std::string_view to_string(EvaluateStatus s);

struct EvaluateResult {
  EvaluateStatus status{EvaluateStatus::Ok};
  RejectReason reason{RejectReason::None};
  std::optional<Decision> decision{};

  bool ok() const { return status == EvaluateStatus::Ok; }
};

struct UserStatus {
  Phase phase{Phase::ColdStart};
  uint32_t session_count{0};
  uint32_t sessions_needed{0};
  size_t vector_count{0};
  bool has_baseline{false};
  std::optional<TimeMs> baseline_updated_ms{};
  uint32_t failure_count{0};
};

struct EngineStats {
  uint64_t total_requests{0};
  uint64_t allowed{0};
  uint64_t challenged{0};
  uint64_t blocked{0};
  uint64_t rejected{0};
  uint64_t degraded_signals{0};
  double avg_processing_ms{0.0};
  uint32_t in_flight{0};
  VectorStoreStats store{};
};

// vector_store, similarity and drift run in-process with no external
// dependency, so they report true for as long as the engine exists. Only the
// model scorers can go down.
struct HealthReport {
  bool vector_store{true};
  bool similarity{true};
  bool drift{true};
  bool context_scorer{true};
  bool graph_scorer{true};

  // Scorer outages degrade decisions but never stop them.
  bool serving() const { return vector_store && similarity && drift; }
  bool all_healthy() const { return serving() && context_scorer && graph_scorer; }
};

class Engine;

struct EngineCreateResult {
  ConfigStatus status{};
  std::unique_ptr<Engine> engine{};

  bool ok() const { return status.ok && engine != nullptr; }
};

class Engine {
 public:
  // The configuration is validated before anything is built; an invalid one
  // yields the validation error and no engine.
  static EngineCreateResult create(const EngineConfig& cfg, std::shared_ptr<IScorer> context_scorer,
                                   std::shared_ptr<IScorer> graph_scorer,
                                   IMetricSink* metrics = nullptr, IAuditSink* audit = nullptr);

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  EvaluateResult evaluate(const DecisionRequest& req);

  // Counts a finished session toward the phase thresholds once per session id.
  SessionEndResult end_session(const UserId& user, const SessionId& session, TimeMs now_ms = 0);

  // A failed step-up challenge counts toward lockout. Returns the failures
  // currently inside the window.
  uint32_t record_challenge_outcome(const UserId& user, bool passed, TimeMs now_ms = 0);

  // Drops every piece of learned state for the user; next request is cold_start.
  bool reset_profile(const UserId& user);

  std::optional<UserStatus> user_status(const UserId& user, TimeMs now_ms = 0);
  PhaseDistribution phase_distribution() const { return phases_.distribution(); }
  EngineStats stats() const;
  HealthReport health() const;

  ConfigStatus reload_config(const EngineConfig& next);
  std::shared_ptr<const EngineConfig> config() const { return config_.snapshot(); }

 private:
  Engine(const EngineConfig& cfg, std::shared_ptr<IScorer> context_scorer,
         std::shared_ptr<IScorer> graph_scorer, IMetricSink* metrics, IAuditSink* audit);

  EvaluateResult reject(const DecisionRequest& req, EvaluateStatus status, RejectReason reason,
                        TimeMs now_ms);
  Decision no_telemetry(const DecisionRequest& req, const PhaseGate& gate, uint32_t failures,
                        const EngineConfig& cfg, TimeMs now_ms) const;
  void report(const Decision& d, const SignalSet& signals, double elapsed_ms);

  ConfigStore config_;
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  NoopAuditSink noop_audit_{};
  IAuditSink* audit_{nullptr};

  AdmissionGuard admission_;
  UserLockTable locks_;
  VectorStore vectors_;
  DriftDetector drift_;
  PhaseManager phases_;
  FailureTracker failures_;
  ExternalScorers scorers_;

  std::atomic<uint64_t> total_{0};
  std::atomic<uint64_t> allowed_{0};
  std::atomic<uint64_t> challenged_{0};
  std::atomic<uint64_t> blocked_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> degraded_{0};
  std::atomic<uint64_t> decided_{0};
  std::atomic<uint64_t> latency_us_total_{0};
};

} // namespace trustgate
