#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include "Common.h"
#include "VectorStore.h"

namespace trustgate {

struct SimilarityConfig {
  size_t top_k{5};
  double high_threshold{0.85};
  double medium_threshold{0.70};
  double low_threshold{0.50};
};

enum class SimilarityTier : uint8_t {
  None = 0,
  Low,
  Medium,
  High,
};

std::string_view to_string(SimilarityTier t);

struct SimilarityResult {
  SignalScore signal{SignalScore::Neutral(SignalSource::Similarity, "insufficient_data")};
  SimilarityTier tier{SimilarityTier::None};
  size_t stored{0};
  SessionId best_session{};
};

class SimilarityMatcher {
 public:
  explicit SimilarityMatcher(const SimilarityConfig& cfg);

  SimilarityResult match(const VectorStore& store, const UserId& user,
                         const std::vector<float>& v, const VectorStoreConfig& store_cfg) const;
  SimilarityTier tier_of(double similarity) const;

 private:
  SimilarityConfig cfg_{};
};

} // namespace trustgate
