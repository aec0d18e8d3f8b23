#include "trustgate/ExternalScorer.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace trustgate;

namespace {

class FixedScorer final : public IScorer {
 public:
  FixedScorer(double score, double confidence) : score_(score), confidence_(confidence) {}
  ScorerReply score(const ScorerInput&) override { return {true, score_, confidence_, {}}; }

 private:
  double score_;
  double confidence_;
};

class SlowScorer final : public IScorer {
 public:
  explicit SlowScorer(int sleep_ms) : sleep_ms_(sleep_ms) {}
  ScorerReply score(const ScorerInput&) override {
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms_));
    return {true, 0.1, 1.0, {}};
  }

 private:
  int sleep_ms_;
};

class ThrowingScorer final : public IScorer {
 public:
  ScorerReply score(const ScorerInput&) override { throw std::runtime_error("model crashed"); }
};

class OddThrowScorer final : public IScorer {
 public:
  ScorerReply score(const ScorerInput&) override { throw 42; }
};

// Sleeps for a configurable time and counts how often the model really ran.
class LaggingScorer final : public IScorer {
 public:
  explicit LaggingScorer(int ms) : ms_(ms) {}
  void set_lag(int ms) { ms_.store(ms); }
  int calls() const { return calls_.load(); }
  ScorerReply score(const ScorerInput&) override {
    calls_.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(ms_.load()));
    return {true, 0.2, 1.0, {}};
  }

 private:
  std::atomic<int> ms_;
  std::atomic<int> calls_{0};
};

std::shared_ptr<const ScorerInput> make_input() {
  auto in = std::make_shared<ScorerInput>();
  in->user_id = "u";
  in->session_id = "s";
  in->behavioral_vector = {1.0f, 0.0f};
  in->context_features = {0.3f, 0.7f, 1.0f, 0.2f};
  in->session_graph.node_types = {1, 2};
  in->session_graph.edges = {GraphEdge{0, 1, 1.0}};
  return in;
}

} // namespace

void test_scorers() {
  ScorerConfig cfg{};
  cfg.timeout_ms = 40;

  {
    ExternalScorers s(std::make_shared<FixedScorer>(0.8, 0.9), std::make_shared<FixedScorer>(0.2, 1.0), 2, 8);
    auto p = s.launch(make_input(), cfg);
    auto out = s.collect(p, cfg);
    assert(out.context_status == ScorerStatus::Ok && out.graph_status == ScorerStatus::Ok);
    assert(!out.context.degraded && out.context.value == 0.8);
    assert(out.context.confidence > 0.89 && out.context.confidence < 0.91);
    assert(out.graph.value == 0.2 && out.graph.confidence == 1.0);
    assert(s.context_healthy() && s.graph_healthy());
  }

  {
    // A slow model costs at most the deadline and comes back neutral.
    ExternalScorers s(std::make_shared<SlowScorer>(300), std::make_shared<ThrowingScorer>(), 2, 8);
    auto started = std::chrono::steady_clock::now();
    auto p = s.launch(make_input(), cfg);
    auto out = s.collect(p, cfg);
    auto took = std::chrono::steady_clock::now() - started;
    assert(took < std::chrono::milliseconds(250));
    assert(out.context_status == ScorerStatus::Timeout);
    assert(out.context.degraded && out.context.value == 0.5 && out.context.confidence == 0.0);
    assert(out.graph_status == ScorerStatus::Failed);
    assert(out.graph.degraded);
    assert(!s.context_healthy() && !s.graph_healthy());
  }

  {
    ExternalScorers s(nullptr, std::make_shared<FixedScorer>(1.5, 1.0), 1, 8);
    assert(!s.context_healthy());
    auto p = s.launch(make_input(), cfg);
    auto out = s.collect(p, cfg);
    assert(out.context_status == ScorerStatus::Unavailable);
    assert(out.graph_status == ScorerStatus::InvalidReply);
    assert(out.graph.reason == "invalid_reply");
  }

  {
    // One worker busy and a queue of one: the next submission is refused.
    ExternalScorers s(std::make_shared<SlowScorer>(100), std::make_shared<SlowScorer>(100), 1, 1);
    auto p1 = s.launch(make_input(), cfg);
    auto p2 = s.launch(make_input(), cfg);
    assert(p2.context_launch == ScorerStatus::Saturated || p2.graph_launch == ScorerStatus::Saturated);
    (void)s.collect(p1, cfg);
    auto out = s.collect(p2, cfg);
    assert(out.context.degraded || out.graph.degraded);
  }

  {
    // Exceptions of any type become a failed reply, never a dead worker.
    ExternalScorers s(std::make_shared<OddThrowScorer>(), std::make_shared<FixedScorer>(0.3, 1.0), 1, 8);
    auto p = s.launch(make_input(), cfg);
    auto out = s.collect(p, cfg);
    assert(out.context_status == ScorerStatus::Failed && out.context.degraded);
    assert(out.graph_status == ScorerStatus::Ok);
    p = s.launch(make_input(), cfg);
    assert(s.collect(p, cfg).graph_status == ScorerStatus::Ok);
  }

  {
    // A slow model must not leave a backlog of abandoned calls behind it.
    ScorerConfig tight = cfg;
    tight.timeout_ms = 20;
    auto lagging = std::make_shared<LaggingScorer>(100);
    ExternalScorers s(lagging, nullptr, 1, 64);
    for (int i = 0; i < 10; ++i) {
      auto p = s.launch(make_input(), tight);
      auto out = s.collect(p, tight);
      assert(out.context_status == ScorerStatus::Timeout);
    }
    lagging->set_lag(0);
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    assert(s.expired_jobs() > 0);
    assert(lagging->calls() < 10);

    ScorerConfig relaxed = cfg;
    relaxed.timeout_ms = 200;
    auto p = s.launch(make_input(), relaxed);
    auto out = s.collect(p, relaxed);
    assert(out.context_status == ScorerStatus::Ok && !out.context.degraded);
    assert(s.context_healthy());
  }

  RiskContext risk{};
  assert(condition_confidence(0.8, 1.0, risk, cfg) == 0.8);
  double sparse = condition_confidence(0.8, cfg.min_feature_coverage / 2.0, risk, cfg);
  assert(sparse > 0.39 && sparse < 0.41);
  risk.high_value = true;
  assert(condition_confidence(1.0, 1.0, risk, cfg) == cfg.high_value_confidence_scale);
  risk.high_value = false;
  risk.device_integrity_ok = false;
  assert(condition_confidence(1.0, 1.0, risk, cfg) == cfg.integrity_fail_confidence_scale);
  assert(to_string(ScorerStatus::Saturated) == "saturated");
}
