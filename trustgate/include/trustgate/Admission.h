#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>
#include "Common.h"

namespace trustgate {

struct AdmissionConfig {
  uint32_t max_concurrent_sessions{1000};
  size_t user_lock_shards{64};
};

class AdmissionGuard;

// Holds one admission slot; releases it on destruction.
class AdmissionTicket {
 public:
  AdmissionTicket() = default;
  explicit AdmissionTicket(AdmissionGuard* owner) : owner_(owner) {}
  ~AdmissionTicket();
  AdmissionTicket(AdmissionTicket&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
  AdmissionTicket& operator=(AdmissionTicket&& other) noexcept;
  AdmissionTicket(const AdmissionTicket&) = delete;
  AdmissionTicket& operator=(const AdmissionTicket&) = delete;

  bool admitted() const { return owner_ != nullptr; }

 private:
  AdmissionGuard* owner_{nullptr};
};

// Rejects instead of queueing once the in-flight count reaches the limit.
class AdmissionGuard {
 public:
  AdmissionGuard() = default;

  AdmissionTicket try_admit(uint32_t max_in_flight);
  uint32_t in_flight() const { return in_flight_.load(); }

 private:
  friend class AdmissionTicket;
  void release() { in_flight_.fetch_sub(1); }

  std::atomic<uint32_t> in_flight_{0};
};

// Fixed table of mutexes; a user id always maps to the same shard, so two
// requests for one user never overlap while different users rarely collide.
class UserLockTable {
 public:
  explicit UserLockTable(size_t shards);

  std::unique_lock<std::mutex> lock(const UserId& user);
  size_t shard_of(const UserId& user) const;
  size_t shards() const { return shards_.size(); }

 private:
  std::vector<std::unique_ptr<std::mutex>> shards_;
};

} // namespace trustgate
