#include "trustgate/Config.h"
#include "trustgate/Engine.h"
#include "trustgate/Wire.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

using namespace trustgate;

namespace {

// Stand-in for a model service: answers every request with the same score.
class FixedScorer final : public IScorer {
 public:
  FixedScorer(double score, double confidence) : score_(score), confidence_(confidence) {}
  ScorerReply score(const ScorerInput&) override { return {true, score_, confidence_, {}}; }

 private:
  double score_;
  double confidence_;
};

// NDJSON audit trail on stderr.
class StreamAuditSink final : public IAuditSink {
 public:
  explicit StreamAuditSink(std::ostream& os) : os_(os) {}

  void on_decision(const Decision& d) override {
    std::lock_guard lock(mu_);
    os_ << nlohmann::json{{"event", "decision"},
                          {"user_id", d.user_id},
                          {"session_id", d.session_id},
                          {"verdict", std::string(to_string(d.verdict))},
                          {"rule", std::string(to_string(d.rule))},
                          {"fused_risk", d.fused_risk},
                          {"at_ms", d.decided_at_ms}}
               .dump()
        << '\n';
  }
  void on_degraded(const DegradedEvent& e) override {
    std::lock_guard lock(mu_);
    os_ << nlohmann::json{{"event", "degraded"},
                          {"user_id", e.user_id},
                          {"session_id", e.session_id},
                          {"source", std::string(to_string(e.source))},
                          {"reason", e.reason},
                          {"at_ms", e.at_ms}}
               .dump()
        << '\n';
  }
  void on_rejected(const RejectEvent& e) override {
    std::lock_guard lock(mu_);
    os_ << nlohmann::json{{"event", "rejected"},
                          {"user_id", e.user_id},
                          {"session_id", e.session_id},
                          {"reason", std::string(to_string(e.reason))},
                          {"at_ms", e.at_ms}}
               .dump()
        << '\n';
  }

 private:
  std::mutex mu_;
  std::ostream& os_;
};

void usage() {
  std::cerr << "usage: trustgate_replay [--config FILE] [--dump-config] [--no-audit]\n"
               "                        [--context-score S] [--graph-score S]\n"
               "reads one JSON command per line on stdin, writes one JSON reply per line\n";
}

bool parse_score(const char* text, double& out) {
  char* end = nullptr;
  double v = std::strtod(text, &end);
  if (end == text || *end != '\0' || !(v >= 0.0 && v <= 1.0)) return false;
  out = v;
  return true;
}

std::string handle(Engine& engine, const WireCommand& cmd) {
  const DecisionRequest& req = cmd.request;
  switch (cmd.op) {
    case WireOp::Evaluate: {
      EvaluateResult r = engine.evaluate(req);
      if (!r.ok() || !r.decision) return rejection_to_json(req, r);
      return decision_to_json(*r.decision);
    }
    case WireOp::EndSession:
      return session_end_to_json(req.user_id, engine.end_session(req.user_id, req.session_id, req.now_ms));
    case WireOp::ChallengeOutcome: {
      uint32_t failures = engine.record_challenge_outcome(req.user_id, cmd.challenge_passed, req.now_ms);
      return nlohmann::json{{"user_id", req.user_id}, {"failure_count", failures}}.dump();
    }
    case WireOp::ResetProfile:
      return nlohmann::json{{"user_id", req.user_id}, {"reset", engine.reset_profile(req.user_id)}}.dump();
    case WireOp::Status:
      return user_status_to_json(req.user_id, engine.user_status(req.user_id, req.now_ms));
    case WireOp::Stats:
      return stats_to_json(engine.stats(), engine.phase_distribution());
    case WireOp::Health:
      return health_to_json(engine.health());
  }
  return error_to_json("unknown op");
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool dump_config = false;
  bool audit = true;
  double context_score = -1.0;
  double graph_score = -1.0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--dump-config") {
      dump_config = true;
    } else if (arg == "--no-audit") {
      audit = false;
    } else if (arg == "--context-score" && i + 1 < argc) {
      if (!parse_score(argv[++i], context_score)) {
        usage();
        return 2;
      }
    } else if (arg == "--graph-score" && i + 1 < argc) {
      if (!parse_score(argv[++i], graph_score)) {
        usage();
        return 2;
      }
    } else {
      usage();
      return 2;
    }
  }

  EngineConfig cfg{};
  if (!config_path.empty()) {
    ConfigLoadResult loaded = load_config_file(config_path);
    if (!loaded.status.ok) {
      std::cerr << "config error (" << to_string(loaded.status.error) << "): "
                << loaded.status.message << "\n";
      return 1;
    }
    cfg = loaded.config;
  }
  if (dump_config) {
    std::cout << config_to_json(cfg) << "\n";
    return 0;
  }

  std::shared_ptr<IScorer> context;
  std::shared_ptr<IScorer> graph;
  if (context_score >= 0.0) context = std::make_shared<FixedScorer>(context_score, 1.0);
  if (graph_score >= 0.0) graph = std::make_shared<FixedScorer>(graph_score, 1.0);

  StreamAuditSink audit_sink(std::cerr);
  EngineCreateResult created = Engine::create(cfg, context, graph, nullptr, audit ? &audit_sink : nullptr);
  if (!created.ok()) {
    std::cerr << "config error (" << to_string(created.status.error) << "): "
              << created.status.message << "\n";
    return 1;
  }
  Engine& engine = *created.engine;

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) continue;
    WireParseResult parsed = parse_wire_command(line);
    if (!parsed.ok) {
      std::cout << error_to_json(parsed.error) << "\n";
      continue;
    }
    std::cout << handle(engine, parsed.command) << "\n";
  }
  std::cout.flush();
  return 0;
}
