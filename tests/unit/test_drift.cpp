#include "trustgate/DriftDetector.h"
#include <cassert>

using namespace trustgate;

void test_drift() {
  DriftConfig cfg{};
  cfg.window_size = 4;
  cfg.drift_threshold = 0.15;
  cfg.baseline_adaptation_threshold = 0.3;
  cfg.adaptation_rate = 0.5;
  DriftDetector d;
  const std::vector<float> home{1.0f, 0.0f, 0.0f};
  const std::vector<float> away{0.0f, 1.0f, 0.0f};

  auto a = d.assess("u", home, cfg);
  assert(!a.has_baseline && a.signal.degraded && a.signal.reason == "no_baseline");

  for (int i = 0; i < 3; ++i) {
    auto c = d.commit("u", home, 100 + i, cfg);
    assert(!c.baseline_created);
  }
  assert(!d.has_baseline("u"));
  auto created = d.commit("u", home, 200, cfg);
  assert(created.baseline_created);
  assert(d.has_baseline("u"));
  assert(d.baseline_updated_at("u").value() == 200);
  assert(d.window_fill("u") == 4);

  a = d.assess("u", home, cfg);
  assert(a.has_baseline && !a.signal.degraded);
  assert(a.signal.value < 1e-9);
  assert(!a.alert);

  // One foreign vector moves the prospective centroid by a quarter.
  a = d.assess("u", away, cfg);
  assert(a.signal.value > cfg.drift_threshold);
  assert(a.alert);
  assert(a.signal.confidence == 1.0);

  // Sustained foreign behavior freezes the baseline instead of following it.
  auto before = d.baseline("u").value();
  bool frozen = false;
  for (int i = 0; i < 4; ++i) frozen = d.commit("u", away, 300 + i, cfg).baseline_frozen || frozen;
  assert(frozen);
  assert(d.baseline("u").value() == before);
  assert(d.baseline_updated_at("u").value() == 200);

  // Stable behavior for a full window adapts it.
  DriftDetector d2;
  for (int i = 0; i < 4; ++i) d2.commit("v", home, i, cfg);
  bool adapted = false;
  for (int i = 0; i < 4; ++i) adapted = d2.commit("v", home, 10 + i, cfg).baseline_adapted || adapted;
  assert(adapted);
  assert(d2.baseline_updated_at("v").value() == 13);

  assert(d.erase("u"));
  assert(!d.has_baseline("u"));
}
