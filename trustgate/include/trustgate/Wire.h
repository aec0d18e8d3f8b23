#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "Common.h"
#include "Engine.h"

namespace trustgate {

// One NDJSON line at the transport boundary. A line without "op" is an
// evaluate request.
enum class WireOp : uint8_t {
  Evaluate = 0,
  EndSession,
  ChallengeOutcome,
  ResetProfile,
  Status,
  Stats,
  Health,
};

std::optional<WireOp> parse_wire_op(std::string_view name);

struct WireCommand {
  WireOp op{WireOp::Evaluate};
  DecisionRequest request{};
  bool challenge_passed{false};
};

struct WireParseResult {
  bool ok{false};
  std::string error{};
  WireCommand command{};
};

WireParseResult parse_wire_command(std::string_view line);

std::string decision_to_json(const Decision& d);
std::string rejection_to_json(const DecisionRequest& req, const EvaluateResult& r);
std::string session_end_to_json(const UserId& user, const SessionEndResult& r);
std::string user_status_to_json(const UserId& user, const std::optional<UserStatus>& s);
std::string stats_to_json(const EngineStats& s, const PhaseDistribution& phases);
std::string health_to_json(const HealthReport& h);
std::string error_to_json(std::string_view error);

} // namespace trustgate
