#include "trustgate/EnsembleFusion.h"
#include "trustgate/Util.h"

namespace trustgate {

double FusionWeights::of(SignalSource s) const {
  switch (s) {
    case SignalSource::Similarity: return similarity;
    case SignalSource::Drift: return drift;
    case SignalSource::Context: return context;
    case SignalSource::Graph: return graph;
  }
  return 0.0;
}

EnsembleFusion::EnsembleFusion(const FusionWeights& w) : w_(w) {}

FusedRisk EnsembleFusion::fuse(const SignalSet& signals) const {
  FusedRisk out{};

  double mass = 0.0;
  for (size_t i = 0; i < kSignalCount; ++i) {
    const SignalScore& s = signals[i];
    SignalContribution& c = out.breakdown[i];
    c.source = static_cast<SignalSource>(i);
    c.value = clamp01(s.value);
    c.confidence = clamp01(s.confidence);
    c.degraded = s.degraded;
    c.base_weight = w_.of(c.source);
    c.effective_weight = s.degraded ? c.base_weight * c.confidence : c.base_weight;
    mass += c.effective_weight;
    if (s.degraded) ++out.degraded_count;
  }

  // Nothing trustworthy: every value is neutral, so the base split gives 0.5.
  if (mass <= 0.0) {
    out.all_degraded = true;
    mass = 0.0;
    for (auto& c : out.breakdown) {
      c.effective_weight = c.base_weight;
      mass += c.effective_weight;
    }
    if (mass <= 0.0) return out;
  }

  double score = 0.0;
  double confidence = 0.0;
  for (auto& c : out.breakdown) {
    c.effective_weight /= mass;
    double distance = inverted(c.source) ? 1.0 - c.value : c.value;
    c.contribution = c.effective_weight * distance;
    score += c.contribution;
    confidence += c.effective_weight * c.confidence;
  }
  out.score = clamp01(score);
  out.confidence = clamp01(confidence);
  return out;
}

} // namespace trustgate
