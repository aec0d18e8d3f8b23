#include "trustgate/PhaseManager.h"
#include <algorithm>
#include <mutex>

namespace trustgate {

namespace {

struct GateRow {
  Phase phase;
  bool enforce_risk;
};

constexpr std::array<GateRow, 4> kGateTable{{
    {Phase::ColdStart, false},
    {Phase::Learning, false},
    {Phase::GradualRisk, true},
    {Phase::FullAuth, true},
}};

} // namespace

PhaseGate PhaseManager::gate(Phase p, const PhaseConfig& cfg) {
  const GateRow& row = kGateTable[static_cast<size_t>(p)];
  PhaseGate g{};
  g.phase = row.phase;
  g.enforce_risk = row.enforce_risk;
  g.level = p == Phase::FullAuth ? cfg.full_auth_level : cfg.gradual_level;
  return g;
}

Phase PhaseManager::phase_for(uint32_t session_count, const PhaseConfig& cfg) {
  if (session_count >= cfg.gradual_threshold) return Phase::FullAuth;
  if (session_count >= cfg.learning_threshold) return Phase::GradualRisk;
  return Phase::Learning;
}

uint32_t PhaseManager::sessions_needed(const LearningPhaseState& s, const PhaseConfig& cfg) {
  switch (s.phase) {
    case Phase::ColdStart:
    case Phase::Learning:
      return cfg.learning_threshold > s.session_count ? cfg.learning_threshold - s.session_count : 0;
    case Phase::GradualRisk:
      return cfg.gradual_threshold > s.session_count ? cfg.gradual_threshold - s.session_count : 0;
    case Phase::FullAuth:
      return 0;
  }
  return 0;
}

void PhaseManager::advance(LearningPhaseState& s, TimeMs now_ms, const PhaseConfig& cfg) {
  Phase target = phase_for(s.session_count, cfg);
  if (target > s.phase) {
    s.phase = target;
    s.last_transition_ms = now_ms;
  }
}

std::optional<LearningPhaseState> PhaseManager::lookup(const UserId& user) const {
  std::shared_lock lock(mu_);
  auto it = states_.find(user);
  if (it == states_.end()) return std::nullopt;
  return it->second;
}

Phase PhaseManager::phase_of(const UserId& user) const {
  std::shared_lock lock(mu_);
  auto it = states_.find(user);
  return it == states_.end() ? Phase::ColdStart : it->second.phase;
}

std::optional<PhaseTransition> PhaseManager::record_analysis(const UserId& user,
                                                             const SessionId& session,
                                                             TimeMs now_ms,
                                                             const PhaseConfig& cfg) {
  std::unique_lock lock(mu_);
  auto [it, created] = states_.try_emplace(user);
  LearningPhaseState& s = it->second;
  std::optional<PhaseTransition> out;
  if (created) {
    s.user_id = user;
    s.phase = Phase::Learning;
    s.created_ms = now_ms;
    s.last_transition_ms = now_ms;
    out = PhaseTransition{Phase::ColdStart, Phase::Learning};
  }

  bool closed = std::find(s.closed_sessions.begin(), s.closed_sessions.end(), session) !=
                s.closed_sessions.end();
  if (!closed &&
      std::find(s.open_sessions.begin(), s.open_sessions.end(), session) == s.open_sessions.end()) {
    s.open_sessions.push_back(session);
    size_t cap = std::max<size_t>(cfg.max_open_sessions, 1);
    while (s.open_sessions.size() > cap) s.open_sessions.erase(s.open_sessions.begin());
  }
  return out;
}

SessionEndResult PhaseManager::complete_session(const UserId& user, const SessionId& session,
                                                TimeMs now_ms, const PhaseConfig& cfg) {
  SessionEndResult res{};
  std::unique_lock lock(mu_);
  auto it = states_.find(user);
  if (it == states_.end()) return res;

  LearningPhaseState& s = it->second;
  res.before = s.phase;
  res.after = s.phase;
  res.session_count = s.session_count;

  auto open = std::find(s.open_sessions.begin(), s.open_sessions.end(), session);
  if (open == s.open_sessions.end()) return res;
  s.open_sessions.erase(open);
  s.closed_sessions.push_back(session);
  size_t cap = std::max<size_t>(cfg.max_closed_sessions, 1);
  while (s.closed_sessions.size() > cap) s.closed_sessions.erase(s.closed_sessions.begin());

  ++s.session_count;
  advance(s, now_ms, cfg);
  res.counted = true;
  res.after = s.phase;
  res.session_count = s.session_count;
  return res;
}

bool PhaseManager::reset(const UserId& user) {
  std::unique_lock lock(mu_);
  return states_.erase(user) > 0;
}

PhaseDistribution PhaseManager::distribution() const {
  PhaseDistribution d{};
  std::shared_lock lock(mu_);
  d.users = states_.size();
  for (const auto& [id, s] : states_) {
    ++d.by_phase[static_cast<size_t>(s.phase)];
  }
  return d;
}

} // namespace trustgate
