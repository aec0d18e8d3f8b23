#include "trustgate/Admission.h"
#include "trustgate/Util.h"

namespace trustgate {

AdmissionTicket::~AdmissionTicket() {
  if (owner_) owner_->release();
}

AdmissionTicket& AdmissionTicket::operator=(AdmissionTicket&& other) noexcept {
  if (this != &other) {
    if (owner_) owner_->release();
    owner_ = other.owner_;
    other.owner_ = nullptr;
  }
  return *this;
}

AdmissionTicket AdmissionGuard::try_admit(uint32_t max_in_flight) {
  uint32_t cur = in_flight_.load();
  while (cur < max_in_flight) {
    if (in_flight_.compare_exchange_weak(cur, cur + 1)) return AdmissionTicket(this);
  }
  return AdmissionTicket();
}

UserLockTable::UserLockTable(size_t shards) {
  if (shards == 0) shards = 1;
  shards_.reserve(shards);
  for (size_t i = 0; i < shards; ++i) shards_.push_back(std::make_unique<std::mutex>());
}

size_t UserLockTable::shard_of(const UserId& user) const {
  return static_cast<size_t>(hash_str(user) % shards_.size());
}

std::unique_lock<std::mutex> UserLockTable::lock(const UserId& user) {
  return std::unique_lock<std::mutex>(*shards_[shard_of(user)]);
}

} // namespace trustgate
