#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>
#include "Common.h"

namespace trustgate {

struct VectorStoreConfig {
  size_t dimension{90};
  size_t max_vectors_per_user{200};
  size_t min_vectors_for_search{5};
};

struct BehavioralVector {
  std::vector<float> values{};
  TimeMs timestamp_ms{0};
  SessionId session_id{};
};

enum class InsertStatus : uint8_t {
  Ok = 0,
  DimensionMismatch,
  NonFinite,
  ZeroVector,
};

struct InsertResult {
  InsertStatus status{InsertStatus::Ok};
  size_t stored{0};
  size_t evicted{0};
  bool ok() const { return status == InsertStatus::Ok; }
};

enum class QueryStatus : uint8_t {
  Ok = 0,
  InsufficientData,
  DimensionMismatch,
};

struct VectorMatch {
  double score{0.0};
  SessionId session_id{};
  TimeMs timestamp_ms{0};
  uint64_t seq{0};
};

struct QueryResult {
  QueryStatus status{QueryStatus::InsufficientData};
  size_t stored{0};
  std::vector<VectorMatch> matches{};
};

struct VectorStoreStats {
  size_t users{0};
  size_t total_vectors{0};
};

// Per-user capped store of unit-length behavioral vectors with exact
// inner-product search. Writes to one user are exclusive, reads are shared.
// Limits come from the caller's config snapshot so a reload applies to the
// next request only.
class VectorStore {
 public:
  VectorStore() = default;

  InsertResult insert(const UserId& user, const BehavioralVector& v, const VectorStoreConfig& cfg);
  QueryResult query(const UserId& user, const std::vector<float>& v, size_t k,
                    const VectorStoreConfig& cfg) const;

  size_t size(const UserId& user) const;
  bool erase(const UserId& user);
  VectorStoreStats stats() const;

 private:
  struct Stored {
    std::vector<float> unit{};
    TimeMs timestamp_ms{0};
    SessionId session_id{};
    uint64_t seq{0};
  };

  struct UserVectorSet {
    mutable std::shared_mutex mu;
    std::deque<Stored> vectors;
    uint64_t next_seq{0};
  };

  std::shared_ptr<UserVectorSet> find(const UserId& user) const;
  std::shared_ptr<UserVectorSet> find_or_create(const UserId& user);

  mutable std::shared_mutex users_mu_;
  std::unordered_map<UserId, std::shared_ptr<UserVectorSet>> users_;
};

} // namespace trustgate
