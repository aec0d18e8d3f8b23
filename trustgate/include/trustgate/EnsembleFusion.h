#pragma once
#include <array>
#include <cstddef>
#include "Common.h"

namespace trustgate {

// Default split: vector layer 0.4 (similarity 0.3, drift 0.1), model layer 0.6
// shared evenly by the context encoder and the graph scorer.
struct FusionWeights {
  double similarity{0.3};
  double drift{0.1};
  double context{0.3};
  double graph{0.3};

  double of(SignalSource s) const;
  double sum() const { return similarity + drift + context + graph; }
};

inline constexpr double kWeightSumTolerance = 1e-6;

struct FusedRisk {
  double score{0.5};
  double confidence{0.0};
  Breakdown breakdown{};
  size_t degraded_count{0};
  bool all_degraded{false};
};

using SignalSet = std::array<SignalScore, kSignalCount>;

class EnsembleFusion {
 public:
  explicit EnsembleFusion(const FusionWeights& w);

  // Signals must be indexed by their source.
  FusedRisk fuse(const SignalSet& signals) const;

  // Similarity-style signals are inverted: a close match is low risk.
  static bool inverted(SignalSource s) { return s == SignalSource::Similarity; }

 private:
  FusionWeights w_{};
};

} // namespace trustgate
