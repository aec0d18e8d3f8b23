#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trustgate {

using TimeMs = uint64_t;
using UserId = std::string;
using SessionId = std::string;

enum class Verdict : uint8_t {
  Allow = 0,
  Challenge = 1,
  Block = 2,
};

enum class SignalSource : uint8_t {
  Similarity = 0,
  Drift = 1,
  Context = 2,
  Graph = 3,
};

inline constexpr size_t kSignalCount = 4;

enum class Phase : uint8_t {
  ColdStart = 0,
  Learning = 1,
  GradualRisk = 2,
  FullAuth = 3,
};

enum class PolicyLevel : uint8_t {
  Level1 = 0,
  Level2 = 1,
  Level3 = 2,
  Level4 = 3,
};

inline constexpr size_t kPolicyLevelCount = 4;

// Which decision rule produced the verdict, in evaluation order.
enum class Rule : uint8_t {
  Lockout = 0,
  LearningAllow,
  LearningIntegrity,
  ThresholdBlock,
  ThresholdChallenge,
  ThresholdAllow,
  AmbiguousBand,
  HighValueEscalation,
  IntegrityEscalation,
  NoTelemetry,
};

enum class RejectReason : uint16_t {
  None = 0,
  MissingUser,
  MissingSession,
  DimensionMismatch,
  NonFiniteValue,
  MalformedGraph,
  BudgetExceeded,
  InvalidAmount,
  CapacityExceeded,
};

struct SignalScore {
  SignalSource source{SignalSource::Similarity};
  double value{0.5};
  double confidence{0.0};
  bool degraded{true};
  std::string reason{};

  static SignalScore Neutral(SignalSource s, std::string why) {
    return {s, 0.5, 0.0, true, std::move(why)};
  }
};

struct GraphEdge {
  uint32_t from{0};
  uint32_t to{0};
  double weight{1.0};
};

// Session event graph: node i is the i-th UI/sensor event of the session.
struct SessionGraph {
  std::vector<uint32_t> node_types{};
  std::vector<TimeMs> node_times{};
  std::vector<GraphEdge> edges{};

  bool empty() const { return node_types.empty() && edges.empty(); }
};

struct DecisionRequest {
  UserId user_id{};
  SessionId session_id{};
  std::vector<float> behavioral_vector{};
  SessionGraph session_graph{};
  std::vector<float> context_features{};
  std::optional<double> transaction_amount{};
  bool device_integrity_ok{true};
  TimeMs now_ms{0};
};

struct SignalContribution {
  SignalSource source{SignalSource::Similarity};
  double value{0.5};
  double confidence{0.0};
  bool degraded{true};
  double base_weight{0.0};
  double effective_weight{0.0};
  double contribution{0.0};
};

using Breakdown = std::array<SignalContribution, kSignalCount>;

struct Decision {
  Verdict verdict{Verdict::Challenge};
  double fused_risk{0.5};
  double confidence{0.0};
  Phase phase{Phase::ColdStart};
  PolicyLevel level{PolicyLevel::Level1};
  Rule rule{Rule::AmbiguousBand};
  bool drift_alert{false};
  Breakdown breakdown{};
  std::string explanation{};
  UserId user_id{};
  SessionId session_id{};
  TimeMs decided_at_ms{0};
};

std::string_view to_string(Verdict v);
std::string_view to_string(SignalSource s);
std::string_view to_string(Phase p);
std::string_view to_string(PolicyLevel l);
std::string_view to_string(Rule r);
std::string_view to_string(RejectReason r);

std::optional<PolicyLevel> parse_policy_level(std::string_view name);

inline size_t index_of(SignalSource s) { return static_cast<size_t>(s); }
inline size_t index_of(PolicyLevel l) { return static_cast<size_t>(l); }

} // namespace trustgate
