#include "trustgate/Util.h"
#include <chrono>
#include <cmath>

namespace trustgate {

uint64_t fnv1a64(const uint8_t* data, size_t len) {
  const uint64_t fnv_offset = 1469598103934665603ull;
  const uint64_t fnv_prime = 1099511628211ull;
  uint64_t hash = fnv_offset;
  for (size_t i = 0; i < len; ++i) {
    hash ^= static_cast<uint64_t>(data[i]);
    hash *= fnv_prime;
  }
  return hash;
}

double dot(const std::vector<float>& a, const std::vector<float>& b) {
  size_t n = a.size() < b.size() ? a.size() : b.size();
  double acc = 0.0;
  for (size_t i = 0; i < n; ++i) acc += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  return acc;
}

double l2_norm(const std::vector<float>& v) {
  return std::sqrt(dot(v, v));
}

bool normalize_in_place(std::vector<float>& v) {
  double n = l2_norm(v);
  if (n <= 0.0 || !std::isfinite(n)) return false;
  for (auto& x : v) x = static_cast<float>(x / n);
  return true;
}

bool all_finite(const std::vector<float>& v) {
  for (float x : v) {
    if (!std::isfinite(x)) return false;
  }
  return true;
}

bool all_zero(const std::vector<float>& v) {
  for (float x : v) {
    if (x != 0.0f) return false;
  }
  return true;
}

double coverage(const std::vector<float>& v) {
  if (v.empty()) return 0.0;
  size_t informative = 0;
  for (float x : v) {
    if (std::isfinite(x) && x != 0.0f) ++informative;
  }
  return static_cast<double>(informative) / static_cast<double>(v.size());
}

TimeMs wall_clock_ms() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<TimeMs>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // namespace trustgate
