#include "trustgate/Wire.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace trustgate {

using json = nlohmann::json;

namespace {

struct WireFormatError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void expect(bool cond, const char* what) {
  if (!cond) throw WireFormatError(what);
}

std::string read_string(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return {};
  expect(it->is_string(), key);
  return it->get<std::string>();
}

std::vector<float> read_floats(const json& j, const char* key) {
  std::vector<float> out;
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return out;
  expect(it->is_array(), key);
  out.reserve(it->size());
  for (const auto& v : *it) {
    expect(v.is_number(), key);
    double d = v.get<double>();
    expect(std::fabs(d) <= std::numeric_limits<float>::max(), key);
    out.push_back(static_cast<float>(d));
  }
  return out;
}

uint64_t read_uint(const json& j, const char* key, uint64_t fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return fallback;
  expect(it->is_number_unsigned(), key);
  return it->get<uint64_t>();
}

SessionGraph read_graph(const json& j) {
  SessionGraph g{};
  auto it = j.find("session_graph");
  if (it == j.end() || it->is_null()) return g;
  expect(it->is_object(), "session_graph");

  auto nodes = it->find("nodes");
  if (nodes != it->end()) {
    expect(nodes->is_array(), "session_graph.nodes");
    size_t timed = 0;
    for (const auto& n : *nodes) {
      expect(n.is_object(), "session_graph.nodes");
      uint64_t type = read_uint(n, "type", 0);
      expect(type <= UINT32_MAX, "session_graph.nodes.type");
      g.node_types.push_back(static_cast<uint32_t>(type));
      if (n.contains("timestamp_ms")) {
        g.node_times.push_back(read_uint(n, "timestamp_ms", 0));
        ++timed;
      }
    }
    expect(timed == 0 || timed == g.node_types.size(), "session_graph.nodes.timestamp_ms");
  }

  auto edges = it->find("edges");
  if (edges != it->end()) {
    expect(edges->is_array(), "session_graph.edges");
    for (const auto& e : *edges) {
      expect(e.is_object(), "session_graph.edges");
      uint64_t from = read_uint(e, "from", UINT64_MAX);
      uint64_t to = read_uint(e, "to", UINT64_MAX);
      expect(from <= UINT32_MAX && to <= UINT32_MAX, "session_graph.edges");
      GraphEdge edge{static_cast<uint32_t>(from), static_cast<uint32_t>(to), 1.0};
      if (e.contains("weight")) {
        expect(e["weight"].is_number(), "session_graph.edges.weight");
        edge.weight = e["weight"].get<double>();
      }
      g.edges.push_back(edge);
    }
  }
  return g;
}

// Error text can carry raw bytes from the offending input line.
std::string dump_text(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json breakdown_json(const Breakdown& b) {
  json out = json::object();
  for (const auto& c : b) {
    out[std::string(to_string(c.source))] = {
        {"value", c.value},
        {"confidence", c.confidence},
        {"degraded", c.degraded},
        {"weight", c.effective_weight},
        {"contribution", c.contribution},
    };
  }
  return out;
}

} // namespace

std::optional<WireOp> parse_wire_op(std::string_view name) {
  if (name == "evaluate") return WireOp::Evaluate;
  if (name == "end_session") return WireOp::EndSession;
  if (name == "challenge_outcome") return WireOp::ChallengeOutcome;
  if (name == "reset_profile") return WireOp::ResetProfile;
  if (name == "status") return WireOp::Status;
  if (name == "stats") return WireOp::Stats;
  if (name == "health") return WireOp::Health;
  return std::nullopt;
}

WireParseResult parse_wire_command(std::string_view line) {
  WireParseResult res{};
  try {
    json j = json::parse(line.begin(), line.end());
    expect(j.is_object(), "expected a JSON object");

    std::string op = read_string(j, "op");
    if (!op.empty()) {
      auto parsed = parse_wire_op(op);
      expect(parsed.has_value(), "op");
      res.command.op = *parsed;
    }

    DecisionRequest& req = res.command.request;
    req.user_id = read_string(j, "user_id");
    req.session_id = read_string(j, "session_id");
    req.behavioral_vector = read_floats(j, "behavioral_vector");
    req.context_features = read_floats(j, "context_features");
    req.session_graph = read_graph(j);
    req.now_ms = read_uint(j, "timestamp_ms", 0);

    auto amount = j.find("transaction_amount");
    if (amount != j.end() && !amount->is_null()) {
      expect(amount->is_number(), "transaction_amount");
      req.transaction_amount = amount->get<double>();
    }
    auto integrity = j.find("device_integrity_ok");
    if (integrity != j.end() && !integrity->is_null()) {
      expect(integrity->is_boolean(), "device_integrity_ok");
      req.device_integrity_ok = integrity->get<bool>();
    }
    auto passed = j.find("passed");
    if (passed != j.end()) {
      expect(passed->is_boolean(), "passed");
      res.command.challenge_passed = passed->get<bool>();
    }
    res.ok = true;
  } catch (const WireFormatError& e) {
    res.error = std::string("bad field: ") + e.what();
  } catch (const json::exception& e) {
    res.error = e.what();
  }
  return res;
}

std::string decision_to_json(const Decision& d) {
  json j = {
      {"user_id", d.user_id},
      {"session_id", d.session_id},
      {"decision", std::string(to_string(d.verdict))},
      {"fused_risk", d.fused_risk},
      {"confidence", d.confidence},
      {"phase", std::string(to_string(d.phase))},
      {"level", std::string(to_string(d.level))},
      {"rule", std::string(to_string(d.rule))},
      {"drift_alert", d.drift_alert},
      {"breakdown", breakdown_json(d.breakdown)},
      {"explanation", d.explanation},
      {"timestamp_ms", d.decided_at_ms},
  };
  return dump_text(j);
}

std::string rejection_to_json(const DecisionRequest& req, const EvaluateResult& r) {
  json j = {
      {"user_id", req.user_id},
      {"session_id", req.session_id},
      {"error", std::string(to_string(r.status))},
      {"reason", std::string(to_string(r.reason))},
  };
  return dump_text(j);
}

std::string session_end_to_json(const UserId& user, const SessionEndResult& r) {
  json j = {
      {"user_id", user},
      {"counted", r.counted},
      {"phase_before", std::string(to_string(r.before))},
      {"phase", std::string(to_string(r.after))},
      {"session_count", r.session_count},
  };
  return dump_text(j);
}

std::string user_status_to_json(const UserId& user, const std::optional<UserStatus>& s) {
  json j = {{"user_id", user}};
  if (!s) {
    j["phase"] = std::string(to_string(Phase::ColdStart));
    j["known"] = false;
    return dump_text(j);
  }
  j["known"] = true;
  j["phase"] = std::string(to_string(s->phase));
  j["session_count"] = s->session_count;
  j["sessions_needed"] = s->sessions_needed;
  j["vector_count"] = s->vector_count;
  j["has_baseline"] = s->has_baseline;
  j["baseline_updated_ms"] = s->baseline_updated_ms ? json(*s->baseline_updated_ms) : json(nullptr);
  j["failure_count"] = s->failure_count;
  return dump_text(j);
}

std::string stats_to_json(const EngineStats& s, const PhaseDistribution& phases) {
  json by_phase = json::object();
  for (size_t i = 0; i < phases.by_phase.size(); ++i) {
    by_phase[std::string(to_string(static_cast<Phase>(i)))] = phases.by_phase[i];
  }
  json j = {
      {"total_requests", s.total_requests},
      {"allowed", s.allowed},
      {"challenged", s.challenged},
      {"blocked", s.blocked},
      {"rejected", s.rejected},
      {"degraded_signals", s.degraded_signals},
      {"avg_processing_ms", s.avg_processing_ms},
      {"in_flight", s.in_flight},
      {"users", s.store.users},
      {"total_vectors", s.store.total_vectors},
      {"users_in_learning", phases.users_in_learning()},
      {"phases", by_phase},
  };
  return dump_text(j);
}

std::string health_to_json(const HealthReport& h) {
  json j = {
      {"status", h.all_healthy() ? "healthy" : (h.serving() ? "degraded" : "unhealthy")},
      {"components",
       {{"vector_store", h.vector_store},
        {"similarity", h.similarity},
        {"drift", h.drift},
        {"context_scorer", h.context_scorer},
        {"graph_scorer", h.graph_scorer}}},
  };
  return dump_text(j);
}

std::string error_to_json(std::string_view error) {
  json j = {{"error", std::string(error)}};
  return dump_text(j);
}

} // namespace trustgate
