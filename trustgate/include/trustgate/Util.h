#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include "Common.h"

namespace trustgate {

uint64_t fnv1a64(const uint8_t* data, size_t len);

inline uint64_t hash_str(std::string_view s) {
  return fnv1a64(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

inline double clamp01(double v) {
  if (!(v > 0.0)) return 0.0; // also maps NaN to 0
  return v > 1.0 ? 1.0 : v;
}

double dot(const std::vector<float>& a, const std::vector<float>& b);
double l2_norm(const std::vector<float>& v);

// Scales v to unit length. Returns false (v untouched) for a zero vector.
bool normalize_in_place(std::vector<float>& v);

bool all_finite(const std::vector<float>& v);
bool all_zero(const std::vector<float>& v);

// Fraction of components that carry information (finite and non-zero).
double coverage(const std::vector<float>& v);

TimeMs wall_clock_ms();

} // namespace trustgate
