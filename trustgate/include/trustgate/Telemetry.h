#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "Common.h"

namespace trustgate {

struct MetricLabel {
  std::string key;
  std::string value;
};

using MetricLabels = std::vector<MetricLabel>;

class IMetricSink {
 public:
  virtual ~IMetricSink() = default;
  virtual void inc_counter(std::string_view name, uint64_t value = 1,
                           const MetricLabels& labels = {}) = 0;
  virtual void set_gauge(std::string_view name, double value,
                         const MetricLabels& labels = {}) = 0;
  virtual void observe_histogram(std::string_view name, double value,
                                 const MetricLabels& labels = {}) = 0;
};

class NoopMetricSink final : public IMetricSink {
 public:
  void inc_counter(std::string_view, uint64_t, const MetricLabels&) override {}
  void set_gauge(std::string_view, double, const MetricLabels&) override {}
  void observe_histogram(std::string_view, double, const MetricLabels&) override {}
};

// A signal that fell back to its neutral value.
struct DegradedEvent {
  UserId user_id{};
  SessionId session_id{};
  SignalSource source{SignalSource::Similarity};
  std::string reason{};
  TimeMs at_ms{0};
};

struct RejectEvent {
  UserId user_id{};
  SessionId session_id{};
  RejectReason reason{RejectReason::None};
  TimeMs at_ms{0};
};

// Audit trail of every emitted decision and every fallback path. Implementations
// must be thread-safe: decisions for different users are reported concurrently.
class IAuditSink {
 public:
  virtual ~IAuditSink() = default;
  virtual void on_decision(const Decision& d) = 0;
  virtual void on_degraded(const DegradedEvent& e) = 0;
  virtual void on_rejected(const RejectEvent& e) = 0;
};

class NoopAuditSink final : public IAuditSink {
 public:
  void on_decision(const Decision&) override {}
  void on_degraded(const DegradedEvent&) override {}
  void on_rejected(const RejectEvent&) override {}
};

} // namespace trustgate
