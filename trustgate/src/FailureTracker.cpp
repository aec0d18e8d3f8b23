#include "trustgate/FailureTracker.h"

namespace trustgate {

void FailureTracker::expire(std::deque<TimeMs>& q, TimeMs now_ms, uint64_t window_ms) {
  while (!q.empty()) {
    TimeMs t = q.front();
    bool expired = now_ms > t && (now_ms - t) >= window_ms;
    if (!expired) break;
    q.pop_front();
  }
}

uint32_t FailureTracker::record(const UserId& user, TimeMs now_ms, const FailureWindowConfig& cfg) {
  std::lock_guard lock(mu_);
  auto& q = failures_[user];
  expire(q, now_ms, cfg.window_ms);
  q.push_back(now_ms);
  while (q.size() > cfg.max_tracked_per_user && !q.empty()) q.pop_front();
  return static_cast<uint32_t>(q.size());
}

uint32_t FailureTracker::count(const UserId& user, TimeMs now_ms, const FailureWindowConfig& cfg) {
  std::lock_guard lock(mu_);
  auto it = failures_.find(user);
  if (it == failures_.end()) return 0;
  expire(it->second, now_ms, cfg.window_ms);
  if (it->second.empty()) {
    failures_.erase(it);
    return 0;
  }
  return static_cast<uint32_t>(it->second.size());
}

bool FailureTracker::reset(const UserId& user) {
  std::lock_guard lock(mu_);
  return failures_.erase(user) > 0;
}

} // namespace trustgate
