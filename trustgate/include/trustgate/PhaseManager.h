#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "Common.h"

namespace trustgate {

struct PhaseConfig {
  uint32_t learning_threshold{5};
  uint32_t gradual_threshold{15};
  PolicyLevel gradual_level{PolicyLevel::Level1};
  PolicyLevel full_auth_level{PolicyLevel::Level2};
  size_t max_open_sessions{16};
  // Completed session ids remembered per user so a replayed id is not counted again.
  size_t max_closed_sessions{256};
};

struct LearningPhaseState {
  UserId user_id{};
  Phase phase{Phase::Learning};
  uint32_t session_count{0};
  TimeMs created_ms{0};
  TimeMs last_transition_ms{0};
  std::vector<SessionId> open_sessions{};
  std::vector<SessionId> closed_sessions{};
};

struct PhaseGate {
  Phase phase{Phase::ColdStart};
  bool enforce_risk{false};
  PolicyLevel level{PolicyLevel::Level1};
};

struct PhaseTransition {
  Phase from{Phase::ColdStart};
  Phase to{Phase::Learning};
};

struct SessionEndResult {
  bool counted{false};
  Phase before{Phase::ColdStart};
  Phase after{Phase::ColdStart};
  uint32_t session_count{0};
};

struct PhaseDistribution {
  std::array<size_t, 4> by_phase{};
  size_t users{0};

  size_t count(Phase p) const { return by_phase[static_cast<size_t>(p)]; }
  size_t users_in_learning() const { return count(Phase::Learning); }
};

// Progressive-trust lifecycle per user. Phase only moves forward with the
// completed-session count; reset() is the single way back to cold_start.
class PhaseManager {
 public:
  PhaseManager() = default;

  // A user without state is new: callers treat nullopt as cold_start.
  std::optional<LearningPhaseState> lookup(const UserId& user) const;
  Phase phase_of(const UserId& user) const;

  std::optional<PhaseTransition> record_analysis(const UserId& user, const SessionId& session,
                                                 TimeMs now_ms, const PhaseConfig& cfg);
  SessionEndResult complete_session(const UserId& user, const SessionId& session, TimeMs now_ms,
                                    const PhaseConfig& cfg);
  bool reset(const UserId& user);

  // Derived from the state map on every call.
  PhaseDistribution distribution() const;

  static PhaseGate gate(Phase p, const PhaseConfig& cfg);
  static Phase phase_for(uint32_t session_count, const PhaseConfig& cfg);
  static uint32_t sessions_needed(const LearningPhaseState& s, const PhaseConfig& cfg);

 private:
  static void advance(LearningPhaseState& s, TimeMs now_ms, const PhaseConfig& cfg);

  mutable std::shared_mutex mu_;
  std::unordered_map<UserId, LearningPhaseState> states_;
};

} // namespace trustgate
