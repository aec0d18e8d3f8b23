#include "trustgate/SimilarityMatcher.h"
#include "trustgate/Util.h"

namespace trustgate {

std::string_view to_string(SimilarityTier t) {
  switch (t) {
    case SimilarityTier::High: return "high";
    case SimilarityTier::Medium: return "medium";
    case SimilarityTier::Low: return "low";
    case SimilarityTier::None: return "none";
  }
  return "none";
}

SimilarityMatcher::SimilarityMatcher(const SimilarityConfig& cfg) : cfg_(cfg) {}

SimilarityTier SimilarityMatcher::tier_of(double similarity) const {
  if (similarity >= cfg_.high_threshold) return SimilarityTier::High;
  if (similarity >= cfg_.medium_threshold) return SimilarityTier::Medium;
  if (similarity >= cfg_.low_threshold) return SimilarityTier::Low;
  return SimilarityTier::None;
}

SimilarityResult SimilarityMatcher::match(const VectorStore& store, const UserId& user,
                                          const std::vector<float>& v,
                                          const VectorStoreConfig& store_cfg) const {
  SimilarityResult out{};
  auto q = store.query(user, v, cfg_.top_k, store_cfg);
  out.stored = q.stored;
  if (q.status == QueryStatus::DimensionMismatch) {
    out.signal = SignalScore::Neutral(SignalSource::Similarity, "dimension_mismatch");
    return out;
  }
  if (q.status != QueryStatus::Ok || q.matches.empty()) {
    return out;
  }

  // Matches arrive best-first with ties already resolved toward recency.
  const VectorMatch& best = q.matches.front();
  double similarity = clamp01(best.score);
  out.signal.source = SignalSource::Similarity;
  out.signal.value = similarity;
  out.signal.confidence = clamp01(static_cast<double>(q.matches.size()) /
                                  static_cast<double>(cfg_.top_k ? cfg_.top_k : 1));
  out.signal.degraded = false;
  out.signal.reason.clear();
  out.tier = tier_of(similarity);
  out.best_session = best.session_id;
  return out;
}

} // namespace trustgate
