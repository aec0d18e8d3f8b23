#include "trustgate/EnsembleFusion.h"
#include <cassert>
#include <cmath>

using namespace trustgate;

namespace {
bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

SignalScore live(SignalSource s, double value, double confidence = 1.0) {
  return SignalScore{s, value, confidence, false, {}};
}
}

void test_fusion() {
  FusionWeights w{};
  assert(near(w.sum(), 1.0));
  EnsembleFusion fusion(w);

  // Perfect match and calm models: no risk.
  SignalSet calm{live(SignalSource::Similarity, 1.0), live(SignalSource::Drift, 0.0),
                 live(SignalSource::Context, 0.0), live(SignalSource::Graph, 0.0)};
  auto r = fusion.fuse(calm);
  assert(near(r.score, 0.0));
  assert(r.degraded_count == 0 && !r.all_degraded);
  assert(near(r.confidence, 1.0));

  SignalSet mixed{live(SignalSource::Similarity, 0.6), live(SignalSource::Drift, 0.2),
                  live(SignalSource::Context, 0.5), live(SignalSource::Graph, 0.9)};
  r = fusion.fuse(mixed);
  // 0.3*0.4 + 0.1*0.2 + 0.3*0.5 + 0.3*0.9
  assert(near(r.score, 0.56));
  assert(near(r.breakdown[index_of(SignalSource::Graph)].contribution, 0.27));

  // A degraded zero-confidence signal drops out and the rest renormalize.
  SignalSet missing = mixed;
  missing[index_of(SignalSource::Context)] = SignalScore::Neutral(SignalSource::Context, "timeout");
  r = fusion.fuse(missing);
  assert(r.degraded_count == 1);
  assert(near(r.breakdown[index_of(SignalSource::Context)].effective_weight, 0.0));
  assert(near(r.score, (0.3 * 0.4 + 0.1 * 0.2 + 0.3 * 0.9) / 0.7));
  double total = 0.0;
  for (const auto& c : r.breakdown) total += c.effective_weight;
  assert(near(total, 1.0));

  // Everything degraded: neutral 0.5, flagged.
  SignalSet dark{SignalScore::Neutral(SignalSource::Similarity, "x"),
                 SignalScore::Neutral(SignalSource::Drift, "x"),
                 SignalScore::Neutral(SignalSource::Context, "x"),
                 SignalScore::Neutral(SignalSource::Graph, "x")};
  r = fusion.fuse(dark);
  assert(r.all_degraded);
  assert(near(r.score, 0.5));
  assert(near(r.confidence, 0.0));

  // Values outside [0,1] are clamped before weighting.
  SignalSet wild = calm;
  wild[index_of(SignalSource::Graph)].value = 7.0;
  r = fusion.fuse(wild);
  assert(r.score <= 1.0 && near(r.score, 0.3));

  assert(EnsembleFusion::inverted(SignalSource::Similarity));
  assert(!EnsembleFusion::inverted(SignalSource::Graph));
  assert(w.of(SignalSource::Drift) == 0.1);
}
