#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "Common.h"

namespace trustgate {

struct DriftConfig {
  size_t window_size{20};
  double drift_threshold{0.15};
  double baseline_adaptation_threshold{0.3};
  double adaptation_rate{0.1};
};

struct DriftAssessment {
  SignalScore signal{SignalScore::Neutral(SignalSource::Drift, "no_baseline")};
  bool alert{false};
  bool has_baseline{false};
};

struct DriftCommit {
  double drift{0.0};
  bool baseline_created{false};
  bool baseline_adapted{false};
  bool baseline_frozen{false};
};

// Rolling per-user window compared against a slowly adapting centroid
// baseline. The baseline only follows the user while drift stays low, so a
// gradual takeover cannot walk it away from the genuine owner.
class DriftDetector {
 public:
  DriftDetector() = default;

  // Scores the window as it would look with v appended. Does not mutate.
  DriftAssessment assess(const UserId& user, const std::vector<float>& v,
                         const DriftConfig& cfg) const;
  DriftCommit commit(const UserId& user, const std::vector<float>& v, TimeMs now_ms,
                     const DriftConfig& cfg);

  bool has_baseline(const UserId& user) const;
  std::optional<TimeMs> baseline_updated_at(const UserId& user) const;
  std::optional<std::vector<double>> baseline(const UserId& user) const;
  size_t window_fill(const UserId& user) const;
  bool erase(const UserId& user);

 private:
  struct UserDrift {
    mutable std::mutex mu;
    std::deque<std::vector<float>> window;
    std::optional<std::vector<double>> baseline;
    size_t stable_run{0};
    TimeMs updated_ms{0};
  };

  std::shared_ptr<UserDrift> find(const UserId& user) const;
  std::shared_ptr<UserDrift> find_or_create(const UserId& user);

  mutable std::shared_mutex users_mu_;
  std::unordered_map<UserId, std::shared_ptr<UserDrift>> users_;
};

} // namespace trustgate
