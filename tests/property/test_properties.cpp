#include "trustgate/EnsembleFusion.h"
#include "trustgate/PhaseManager.h"
#include "trustgate/PolicyOrchestrator.h"
#include "trustgate/VectorStore.h"
#include <cassert>
#include <cmath>
#include <random>
#include <set>
#include <string>

using namespace trustgate;

namespace {

void fused_risk_stays_in_unit_interval(std::mt19937& rng) {
  std::uniform_real_distribution<double> any(-0.5, 1.5);
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  std::bernoulli_distribution coin(0.3);
  EnsembleFusion fusion(FusionWeights{});

  for (int i = 0; i < 5000; ++i) {
    SignalSet s{};
    for (size_t k = 0; k < kSignalCount; ++k) {
      s[k] = SignalScore{static_cast<SignalSource>(k), any(rng), unit(rng), coin(rng), {}};
    }
    auto r = fusion.fuse(s);
    assert(r.score >= 0.0 && r.score <= 1.0);
    assert(r.confidence >= 0.0 && r.confidence <= 1.0);
    double total = 0.0;
    for (const auto& c : r.breakdown) total += c.effective_weight;
    assert(std::fabs(total - 1.0) < 1e-9);
  }
}

void verdict_monotone_in_risk(std::mt19937& rng) {
  std::uniform_real_distribution<double> unit(0.0, 1.0);
  std::uniform_int_distribution<int> level(0, static_cast<int>(kPolicyLevelCount) - 1);
  PolicyOrchestrator p(PolicyConfig{});

  for (int i = 0; i < 5000; ++i) {
    PolicyInput a{};
    a.enforce_risk = true;
    a.phase = Phase::FullAuth;
    a.level = static_cast<PolicyLevel>(level(rng));
    PolicyInput b = a;
    a.fused_risk = unit(rng);
    b.fused_risk = unit(rng);
    if (a.fused_risk > b.fused_risk) std::swap(a.fused_risk, b.fused_risk);
    // More risk never earns a more permissive verdict.
    assert(p.decide(a).verdict <= p.decide(b).verdict);
  }
}

void phase_never_regresses(std::mt19937& rng) {
  PhaseConfig cfg{};
  PhaseManager pm;
  std::uniform_int_distribution<int> op(0, 2);
  std::uniform_int_distribution<int> session(0, 39);
  std::set<std::string> completed;
  Phase last = Phase::ColdStart;

  for (int i = 0; i < 3000; ++i) {
    std::string sid = "s" + std::to_string(session(rng));
    switch (op(rng)) {
      case 0: pm.record_analysis("u", sid, i, cfg); break;
      case 1: {
        auto r = pm.complete_session("u", sid, i, cfg);
        // Each session id is counted at most once, however often it is replayed.
        if (r.counted) assert(completed.insert(sid).second);
        break;
      }
      default: (void)pm.phase_of("u"); break;
    }
    Phase now = pm.phase_of("u");
    assert(now >= last);
    auto st = pm.lookup("u");
    if (st) {
      assert(st->session_count == completed.size());
      assert(now == PhaseManager::phase_for(st->session_count, cfg));
    }
    last = now;
  }
  assert(completed.size() <= 40);
}

void store_respects_cap(std::mt19937& rng) {
  VectorStoreConfig cfg{};
  cfg.dimension = 6;
  cfg.max_vectors_per_user = 17;
  VectorStore store;
  std::normal_distribution<float> noise(0.0f, 1.0f);

  for (int i = 0; i < 400; ++i) {
    std::vector<float> v(cfg.dimension);
    for (auto& x : v) x = noise(rng);
    std::string user = "u" + std::to_string(i % 3);
    auto r = store.insert(user, BehavioralVector{v, static_cast<TimeMs>(i), "s"}, cfg);
    assert(r.ok() || r.status == InsertStatus::ZeroVector);
    assert(store.size(user) <= cfg.max_vectors_per_user);
    auto q = store.query(user, v, 4, cfg);
    for (const auto& m : q.matches) assert(m.score <= 1.0 + 1e-6 && m.score >= -1.0 - 1e-6);
  }
}

} // namespace

int main() {
  std::mt19937 rng(20240917u);
  fused_risk_stays_in_unit_interval(rng);
  verdict_monotone_in_risk(rng);
  phase_never_regresses(rng);
  store_respects_cap(rng);
  return 0;
}
