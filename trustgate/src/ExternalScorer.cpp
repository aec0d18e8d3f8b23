#include "trustgate/ExternalScorer.h"
#include "trustgate/Util.h"
#include <cmath>
#include <exception>

namespace trustgate {

std::string_view to_string(ScorerStatus s) {
  switch (s) {
    case ScorerStatus::Ok: return "ok";
    case ScorerStatus::Timeout: return "timeout";
    case ScorerStatus::Failed: return "failed";
    case ScorerStatus::Unavailable: return "unavailable";
    case ScorerStatus::Saturated: return "saturated";
    case ScorerStatus::InvalidReply: return "invalid_reply";
  }
  return "failed";
}

ScorerPool::ScorerPool(size_t threads, size_t max_queue) : max_queue_(max_queue) {
  if (threads == 0) threads = 1;
  workers_.reserve(threads);
  for (size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

ScorerPool::~ScorerPool() {
  {
    std::lock_guard lock(mu_);
    stopping_ = true;
    jobs_.clear();
  }
  cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

bool ScorerPool::submit(std::function<void()> job) {
  {
    std::lock_guard lock(mu_);
    if (stopping_ || jobs_.size() >= max_queue_) return false;
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

void ScorerPool::worker_loop() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (stopping_) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    job();
  }
}

double condition_confidence(double raw, double coverage, const RiskContext& risk,
                            const ScorerConfig& cfg) {
  double c = clamp01(raw);
  if (cfg.min_feature_coverage > 0.0 && coverage < cfg.min_feature_coverage) {
    c *= clamp01(coverage / cfg.min_feature_coverage);
  }
  if (risk.high_value) c *= clamp01(cfg.high_value_confidence_scale);
  if (!risk.device_integrity_ok) c *= clamp01(cfg.integrity_fail_confidence_scale);
  return clamp01(c);
}

ExternalScorers::ExternalScorers(std::shared_ptr<IScorer> context, std::shared_ptr<IScorer> graph,
                                 size_t threads, size_t max_queue, IMetricSink* metrics)
    : context_(std::move(context)),
      graph_(std::move(graph)),
      metrics_(metrics ? metrics : &noop_),
      context_healthy_(context_ != nullptr),
      graph_healthy_(graph_ != nullptr),
      pool_(threads, max_queue) {}

ScorerStatus ExternalScorers::start(const std::shared_ptr<IScorer>& scorer,
                                    const std::shared_ptr<const ScorerInput>& input,
                                    Clock::time_point deadline, std::future<ScorerReply>& out) {
  if (!scorer) return ScorerStatus::Unavailable;
  auto promise = std::make_shared<std::promise<ScorerReply>>();
  out = promise->get_future();
  bool queued = pool_.submit([this, scorer, input, promise, deadline] {
    // The caller stops waiting at the deadline; a job still queued past it
    // would only delay the requests behind it.
    if (Clock::now() >= deadline) {
      expired_jobs_.fetch_add(1);
      metrics_->inc_counter("trustgate_scorer_expired_total", 1);
      promise->set_value(ScorerReply::Failed("deadline_expired"));
      return;
    }
    ScorerReply reply;
    try {
      reply = scorer->score(*input);
    } catch (const std::exception& e) {
      reply = ScorerReply::Failed(e.what());
    } catch (...) {
      reply = ScorerReply::Failed("unknown exception");
    }
    promise->set_value(std::move(reply));
  });
  return queued ? ScorerStatus::Ok : ScorerStatus::Saturated;
}

ExternalScorers::Pending ExternalScorers::launch(std::shared_ptr<const ScorerInput> input,
                                                 const ScorerConfig& cfg) {
  Pending p{};
  p.deadline = Clock::now() + std::chrono::milliseconds(cfg.timeout_ms);
  p.risk = input->risk;
  p.context_coverage = coverage(input->context_features);
  p.graph_coverage = input->session_graph.empty() ? 0.0 : 1.0;
  p.context_launch = start(context_, input, p.deadline, p.context);
  p.graph_launch = start(graph_, input, p.deadline, p.graph);
  return p;
}

SignalScore ExternalScorers::finish(SignalSource source, ScorerStatus launched,
                                    std::future<ScorerReply>& f, Clock::time_point deadline,
                                    double coverage, const RiskContext& risk,
                                    const ScorerConfig& cfg, ScorerStatus& status) {
  std::atomic<bool>& healthy = source == SignalSource::Context ? context_healthy_ : graph_healthy_;
  MetricLabels labels{{"scorer", std::string(to_string(source))}};

  status = launched;
  if (launched == ScorerStatus::Ok) {
    if (f.wait_until(deadline) != std::future_status::ready) {
      status = ScorerStatus::Timeout;
    } else {
      ScorerReply reply = f.get();
      if (!reply.ok) {
        status = ScorerStatus::Failed;
      } else if (!std::isfinite(reply.score) || reply.score < 0.0 || reply.score > 1.0 ||
                 !std::isfinite(reply.confidence) || reply.confidence < 0.0 || reply.confidence > 1.0) {
        status = ScorerStatus::InvalidReply;
      } else {
        healthy.store(true);
        metrics_->inc_counter("trustgate_scorer_ok_total", 1, labels);
        return SignalScore{source, reply.score,
                           condition_confidence(reply.confidence, coverage, risk, cfg), false, {}};
      }
    }
  }

  healthy.store(false);
  labels.push_back({"status", std::string(to_string(status))});
  metrics_->inc_counter("trustgate_scorer_fallback_total", 1, labels);
  return SignalScore::Neutral(source, std::string(to_string(status)));
}

ExternalOutcome ExternalScorers::collect(Pending& p, const ScorerConfig& cfg) {
  ExternalOutcome out{};
  out.context = finish(SignalSource::Context, p.context_launch, p.context, p.deadline,
                       p.context_coverage, p.risk, cfg, out.context_status);
  out.graph = finish(SignalSource::Graph, p.graph_launch, p.graph, p.deadline,
                     p.graph_coverage, p.risk, cfg, out.graph_status);
  return out;
}

} // namespace trustgate
