#include "trustgate/Wire.h"
#include <nlohmann/json.hpp>
#include <cassert>

using namespace trustgate;

void test_wire() {
  auto p = parse_wire_command(R"({
    "user_id": "alice", "session_id": "s-1",
    "behavioral_vector": [0.5, 0.25, 1],
    "context_features": [1, 0],
    "session_graph": {
      "nodes": [{"type": 1, "timestamp_ms": 5}, {"type": 2, "timestamp_ms": 9}],
      "edges": [{"from": 0, "to": 1, "weight": 0.5}]
    },
    "transaction_amount": 125.5,
    "device_integrity_ok": false,
    "timestamp_ms": 1700000000000
  })");
  assert(p.ok);
  const DecisionRequest& r = p.command.request;
  assert(p.command.op == WireOp::Evaluate);
  assert(r.user_id == "alice" && r.session_id == "s-1");
  assert(r.behavioral_vector.size() == 3 && r.behavioral_vector[1] == 0.25f);
  assert(r.context_features.size() == 2);
  assert(r.session_graph.node_types.size() == 2 && r.session_graph.node_times[1] == 9);
  assert(r.session_graph.edges.size() == 1 && r.session_graph.edges[0].weight == 0.5);
  assert(r.transaction_amount && *r.transaction_amount == 125.5);
  assert(!r.device_integrity_ok);
  assert(r.now_ms == 1700000000000ull);

  auto minimal = parse_wire_command(R"({"user_id": "bob", "session_id": "x", "behavioral_vector": []})");
  assert(minimal.ok);
  assert(minimal.command.request.device_integrity_ok);
  assert(!minimal.command.request.transaction_amount);
  assert(minimal.command.request.session_graph.empty());

  auto end = parse_wire_command(R"({"op": "end_session", "user_id": "bob", "session_id": "x"})");
  assert(end.ok && end.command.op == WireOp::EndSession);
  auto ch = parse_wire_command(R"({"op": "challenge_outcome", "user_id": "bob", "passed": false})");
  assert(ch.ok && ch.command.op == WireOp::ChallengeOutcome && !ch.command.challenge_passed);

  assert(!parse_wire_command("not json").ok);
  assert(!parse_wire_command("[]").ok);
  assert(!parse_wire_command(R"({"op": "explode"})").ok);
  assert(!parse_wire_command(R"({"user_id": 7})").ok);
  assert(!parse_wire_command(R"({"behavioral_vector": [1, "x"]})").ok);
  assert(!parse_wire_command(R"({"session_graph": {"edges": [{"from": -1, "to": 0}]}})").ok);
  assert(!parse_wire_command(R"({"session_graph": {"nodes": [{"type": 1, "timestamp_ms": 2}, {"type": 1}]}})").ok);
  auto huge = parse_wire_command(R"({"behavioral_vector": [0.5, 1e300]})");
  assert(!huge.ok && huge.error.find("behavioral_vector") != std::string::npos);
  assert(!parse_wire_command(R"({"context_features": [-1e39]})").ok);
  assert(parse_wire_command(R"({"behavioral_vector": [3.4e38]})").ok);

  // Parser errors echo raw input bytes; the reply must still be valid JSON.
  auto garbled = parse_wire_command("{\"user_id\":\"\xff\"}");
  assert(!garbled.ok);
  auto gj = nlohmann::json::parse(error_to_json(garbled.error));
  assert(gj["error"].is_string());
  auto raw = nlohmann::json::parse(error_to_json(std::string("bad \xfe\xff byte")));
  assert(raw["error"].get<std::string>().find("bad ") == 0);

  auto bad = parse_wire_command(R"({"transaction_amount": "lots"})");
  assert(!bad.ok && bad.error.find("transaction_amount") != std::string::npos);

  Decision d{};
  d.user_id = "alice";
  d.session_id = "s-1";
  d.verdict = Verdict::Block;
  d.fused_risk = 0.9;
  d.phase = Phase::FullAuth;
  d.level = PolicyLevel::Level2;
  d.rule = Rule::ThresholdBlock;
  d.breakdown[index_of(SignalSource::Graph)].source = SignalSource::Graph;
  d.breakdown[index_of(SignalSource::Graph)].contribution = 0.3;
  auto j = nlohmann::json::parse(decision_to_json(d));
  assert(j["decision"] == "block");
  assert(j["phase"] == "full_auth");
  assert(j["level"] == "level_2");
  assert(j["rule"] == "threshold_block");
  assert(j["breakdown"]["graph"]["contribution"] == 0.3);
  assert(j["breakdown"].contains("similarity"));

  EvaluateResult rej{};
  rej.status = EvaluateStatus::ValidationError;
  rej.reason = RejectReason::DimensionMismatch;
  auto rj = nlohmann::json::parse(rejection_to_json(r, rej));
  assert(rj["error"] == "validation_error" && rj["reason"] == "dimension_mismatch");

  HealthReport h{};
  h.graph_scorer = false;
  auto hj = nlohmann::json::parse(health_to_json(h));
  assert(hj["status"] == "degraded");
  assert(hj["components"]["graph_scorer"] == false);

  auto sj = nlohmann::json::parse(user_status_to_json("ghost", std::nullopt));
  assert(sj["known"] == false && sj["phase"] == "cold_start");
}
