#include "trustgate/VectorStore.h"
#include "trustgate/Util.h"
#include <algorithm>
#include <cstddef>
#include <mutex>

namespace trustgate {

std::shared_ptr<VectorStore::UserVectorSet> VectorStore::find(const UserId& user) const {
  std::shared_lock lock(users_mu_);
  auto it = users_.find(user);
  if (it == users_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<VectorStore::UserVectorSet> VectorStore::find_or_create(const UserId& user) {
  if (auto existing = find(user)) return existing;
  std::unique_lock lock(users_mu_);
  auto [it, inserted] = users_.try_emplace(user, nullptr);
  if (inserted) it->second = std::make_shared<UserVectorSet>();
  return it->second;
}

InsertResult VectorStore::insert(const UserId& user, const BehavioralVector& v,
                                 const VectorStoreConfig& cfg) {
  InsertResult res{};
  if (v.values.size() != cfg.dimension) {
    res.status = InsertStatus::DimensionMismatch;
    return res;
  }
  if (!all_finite(v.values)) {
    res.status = InsertStatus::NonFinite;
    return res;
  }
  Stored s{};
  s.unit = v.values;
  if (!normalize_in_place(s.unit)) {
    res.status = InsertStatus::ZeroVector;
    return res;
  }
  s.timestamp_ms = v.timestamp_ms;
  s.session_id = v.session_id;

  auto set = find_or_create(user);
  std::unique_lock lock(set->mu);
  s.seq = set->next_seq++;
  set->vectors.push_back(std::move(s));
  size_t cap = std::max<size_t>(cfg.max_vectors_per_user, 1);
  while (set->vectors.size() > cap) {
    set->vectors.pop_front();
    ++res.evicted;
  }
  res.stored = set->vectors.size();
  return res;
}

QueryResult VectorStore::query(const UserId& user, const std::vector<float>& v, size_t k,
                               const VectorStoreConfig& cfg) const {
  QueryResult res{};
  if (v.size() != cfg.dimension) {
    res.status = QueryStatus::DimensionMismatch;
    return res;
  }
  auto set = find(user);
  if (!set) return res;

  std::vector<float> q = v;
  if (!normalize_in_place(q)) {
    res.status = QueryStatus::InsufficientData;
    return res;
  }

  std::shared_lock lock(set->mu);
  res.stored = set->vectors.size();
  if (res.stored < cfg.min_vectors_for_search) return res;

  res.matches.reserve(res.stored);
  for (const auto& s : set->vectors) {
    res.matches.push_back(VectorMatch{dot(q, s.unit), s.session_id, s.timestamp_ms, s.seq});
  }
  lock.unlock();

  auto better = [](const VectorMatch& a, const VectorMatch& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.seq > b.seq; // most recent wins a tie
  };
  size_t top = std::min(k, res.matches.size());
  std::partial_sort(res.matches.begin(), res.matches.begin() + static_cast<std::ptrdiff_t>(top),
                    res.matches.end(), better);
  res.matches.resize(top);
  res.status = QueryStatus::Ok;
  return res;
}

size_t VectorStore::size(const UserId& user) const {
  auto set = find(user);
  if (!set) return 0;
  std::shared_lock lock(set->mu);
  return set->vectors.size();
}

bool VectorStore::erase(const UserId& user) {
  std::unique_lock lock(users_mu_);
  return users_.erase(user) > 0;
}

VectorStoreStats VectorStore::stats() const {
  VectorStoreStats out{};
  std::shared_lock lock(users_mu_);
  out.users = users_.size();
  for (const auto& [id, set] : users_) {
    std::shared_lock set_lock(set->mu);
    out.total_vectors += set->vectors.size();
  }
  return out;
}

} // namespace trustgate
