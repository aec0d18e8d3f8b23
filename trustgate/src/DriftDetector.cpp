#include "trustgate/DriftDetector.h"
#include "trustgate/Util.h"
#include <algorithm>
#include <cmath>

namespace trustgate {

namespace {

// Centroid of the newest (window_size - 1) stored vectors plus v.
std::vector<double> centroid_with(const std::deque<std::vector<float>>& window,
                                  const std::vector<float>& v, size_t window_size) {
  std::vector<double> c(v.begin(), v.end());
  size_t keep = window_size > 0 ? window_size - 1 : 0;
  size_t take = std::min(keep, window.size());
  for (size_t i = window.size() - take; i < window.size(); ++i) {
    const auto& w = window[i];
    for (size_t j = 0; j < c.size() && j < w.size(); ++j) c[j] += w[j];
  }
  double n = static_cast<double>(take + 1);
  for (auto& x : c) x /= n;
  return c;
}

std::vector<double> centroid_of(const std::deque<std::vector<float>>& window) {
  std::vector<double> c;
  if (window.empty()) return c;
  c.assign(window.front().size(), 0.0);
  for (const auto& w : window) {
    for (size_t j = 0; j < c.size() && j < w.size(); ++j) c[j] += w[j];
  }
  for (auto& x : c) x /= static_cast<double>(window.size());
  return c;
}

// Unit vectors keep centroids inside the unit ball, so the distance is in [0, 2].
double drift_between(const std::vector<double>& a, const std::vector<double>& b) {
  double acc = 0.0;
  size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; ++i) {
    double d = a[i] - b[i];
    acc += d * d;
  }
  return clamp01(std::sqrt(acc) / 2.0);
}

std::vector<float> unit_copy(const std::vector<float>& v) {
  std::vector<float> u = v;
  normalize_in_place(u);
  return u;
}

} // namespace

std::shared_ptr<DriftDetector::UserDrift> DriftDetector::find(const UserId& user) const {
  std::shared_lock lock(users_mu_);
  auto it = users_.find(user);
  if (it == users_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<DriftDetector::UserDrift> DriftDetector::find_or_create(const UserId& user) {
  if (auto existing = find(user)) return existing;
  std::unique_lock lock(users_mu_);
  auto [it, inserted] = users_.try_emplace(user, nullptr);
  if (inserted) it->second = std::make_shared<UserDrift>();
  return it->second;
}

DriftAssessment DriftDetector::assess(const UserId& user, const std::vector<float>& v,
                                      const DriftConfig& cfg) const {
  DriftAssessment out{};
  auto st = find(user);
  if (!st) return out;

  std::lock_guard lock(st->mu);
  if (!st->baseline) return out;

  auto c = centroid_with(st->window, unit_copy(v), cfg.window_size);
  double drift = drift_between(c, *st->baseline);
  out.has_baseline = true;
  out.signal = SignalScore{SignalSource::Drift, drift, 1.0, false, {}};
  out.alert = drift > cfg.drift_threshold;
  return out;
}

DriftCommit DriftDetector::commit(const UserId& user, const std::vector<float>& v, TimeMs now_ms,
                                  const DriftConfig& cfg) {
  DriftCommit out{};
  size_t window_size = std::max<size_t>(cfg.window_size, 1);
  auto st = find_or_create(user);

  std::lock_guard lock(st->mu);
  st->window.push_back(unit_copy(v));
  while (st->window.size() > window_size) st->window.pop_front();

  if (!st->baseline) {
    if (st->window.size() >= window_size) {
      st->baseline = centroid_of(st->window);
      st->stable_run = 0;
      st->updated_ms = now_ms;
      out.baseline_created = true;
    }
    return out;
  }

  auto c = centroid_of(st->window);
  out.drift = drift_between(c, *st->baseline);
  if (out.drift >= cfg.baseline_adaptation_threshold) {
    st->stable_run = 0;
    out.baseline_frozen = true;
    return out;
  }

  if (++st->stable_run >= window_size) {
    double a = cfg.adaptation_rate;
    auto& b = *st->baseline;
    for (size_t i = 0; i < b.size() && i < c.size(); ++i) b[i] = (1.0 - a) * b[i] + a * c[i];
    st->stable_run = 0;
    st->updated_ms = now_ms;
    out.baseline_adapted = true;
  }
  return out;
}

bool DriftDetector::has_baseline(const UserId& user) const {
  auto st = find(user);
  if (!st) return false;
  std::lock_guard lock(st->mu);
  return st->baseline.has_value();
}

std::optional<TimeMs> DriftDetector::baseline_updated_at(const UserId& user) const {
  auto st = find(user);
  if (!st) return std::nullopt;
  std::lock_guard lock(st->mu);
  if (!st->baseline) return std::nullopt;
  return st->updated_ms;
}

std::optional<std::vector<double>> DriftDetector::baseline(const UserId& user) const {
  auto st = find(user);
  if (!st) return std::nullopt;
  std::lock_guard lock(st->mu);
  return st->baseline;
}

size_t DriftDetector::window_fill(const UserId& user) const {
  auto st = find(user);
  if (!st) return 0;
  std::lock_guard lock(st->mu);
  return st->window.size();
}

bool DriftDetector::erase(const UserId& user) {
  std::unique_lock lock(users_mu_);
  return users_.erase(user) > 0;
}

} // namespace trustgate
