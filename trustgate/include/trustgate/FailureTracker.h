#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <unordered_map>
#include "Common.h"

namespace trustgate {

struct FailureWindowConfig {
  uint64_t window_ms{3600000};
  size_t max_tracked_per_user{256};
};

// Sliding per-user window of authentication failures (blocked decisions and
// failed step-up challenges) feeding the lockout rule.
class FailureTracker {
 public:
  FailureTracker() = default;

  uint32_t record(const UserId& user, TimeMs now_ms, const FailureWindowConfig& cfg);
  uint32_t count(const UserId& user, TimeMs now_ms, const FailureWindowConfig& cfg);
  bool reset(const UserId& user);

 private:
  static void expire(std::deque<TimeMs>& q, TimeMs now_ms, uint64_t window_ms);

  std::mutex mu_;
  std::unordered_map<UserId, std::deque<TimeMs>> failures_;
};

} // namespace trustgate
