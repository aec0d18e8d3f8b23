#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "Common.h"
#include "Telemetry.h"

namespace trustgate {

enum class ScorerStatus : uint8_t { Ok = 0, Timeout = 1, Failed = 2, Unavailable = 3, Saturated = 4, InvalidReply = 5 };

std::string_view to_string(ScorerStatus s);

struct ScorerConfig {
  uint32_t timeout_ms{30};
  size_t threads{4};
  size_t max_queue{256};
  // Confidence conditioning on the risk context of the request.
  double min_feature_coverage{0.25};
  double high_value_confidence_scale{0.85};
  double integrity_fail_confidence_scale{0.5};
};

struct RiskContext {
  bool high_value{false};
  bool device_integrity_ok{true};
  Phase phase{Phase::ColdStart};
};

// Owned copy of everything a model may read; outlives the request when a
// model answers after the deadline.
struct ScorerInput {
  UserId user_id{};
  SessionId session_id{};
  std::vector<float> behavioral_vector{};
  std::vector<float> context_features{};
  SessionGraph session_graph{};
  RiskContext risk{};
};

struct ScorerReply {
  bool ok{false};
  double score{0.5};
  double confidence{0.0};
  std::string detail{};

  static ScorerReply Failed(std::string why) { return {false, 0.5, 0.0, std::move(why)}; }
};

// Context encoder or graph-anomaly model. Higher score means more anomalous.
// Implementations may block; they run on the scorer pool.
class IScorer {
 public:
  virtual ~IScorer() = default;
  virtual ScorerReply score(const ScorerInput& in) = 0;
};

class ScorerPool {
 public:
  ScorerPool(size_t threads, size_t max_queue);
  ~ScorerPool();
  ScorerPool(const ScorerPool&) = delete;
  ScorerPool& operator=(const ScorerPool&) = delete;

  bool submit(std::function<void()> job);

 private:
  void worker_loop();

  size_t max_queue_{0};
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  std::vector<std::thread> workers_;
  bool stopping_{false};
};

struct ExternalOutcome {
  SignalScore context{SignalScore::Neutral(SignalSource::Context, "unavailable")};
  SignalScore graph{SignalScore::Neutral(SignalSource::Graph, "unavailable")};
  ScorerStatus context_status{ScorerStatus::Unavailable};
  ScorerStatus graph_status{ScorerStatus::Unavailable};
};

// Bounded-latency front for the two external models. launch() starts both
// calls; collect() waits for them up to one shared deadline and converts
// anything late, failed or malformed into a neutral degraded signal.
class ExternalScorers {
 public:
  using Clock = std::chrono::steady_clock;

  struct Pending {
    Clock::time_point deadline{};
    std::future<ScorerReply> context{};
    std::future<ScorerReply> graph{};
    ScorerStatus context_launch{ScorerStatus::Unavailable};
    ScorerStatus graph_launch{ScorerStatus::Unavailable};
    double context_coverage{0.0};
    double graph_coverage{0.0};
    RiskContext risk{};
  };

  ExternalScorers(std::shared_ptr<IScorer> context, std::shared_ptr<IScorer> graph,
                  size_t threads, size_t max_queue, IMetricSink* metrics = nullptr);

  Pending launch(std::shared_ptr<const ScorerInput> input, const ScorerConfig& cfg);
  ExternalOutcome collect(Pending& p, const ScorerConfig& cfg);

  bool context_healthy() const { return context_healthy_.load(); }
  bool graph_healthy() const { return graph_healthy_.load(); }
  // Jobs dropped by a worker because their deadline passed while queued.
  uint64_t expired_jobs() const { return expired_jobs_.load(); }

 private:
  ScorerStatus start(const std::shared_ptr<IScorer>& scorer,
                     const std::shared_ptr<const ScorerInput>& input,
                     Clock::time_point deadline, std::future<ScorerReply>& out);
  SignalScore finish(SignalSource source, ScorerStatus launched, std::future<ScorerReply>& f,
                     Clock::time_point deadline, double coverage, const RiskContext& risk,
                     const ScorerConfig& cfg, ScorerStatus& status);

  std::shared_ptr<IScorer> context_;
  std::shared_ptr<IScorer> graph_;
  NoopMetricSink noop_{};
  IMetricSink* metrics_{nullptr};
  std::atomic<bool> context_healthy_{true};
  std::atomic<bool> graph_healthy_{true};
  std::atomic<uint64_t> expired_jobs_{0};
  // Last member: workers are joined before anything they touch is destroyed.
  ScorerPool pool_;
};

// Scales a model's self-reported confidence by how much the request context
// lets us trust it: sparse features, high-value transactions and failed
// device integrity all lower it.
double condition_confidence(double raw, double coverage, const RiskContext& risk,
                            const ScorerConfig& cfg);

} // namespace trustgate
