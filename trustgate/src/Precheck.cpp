#include "trustgate/Precheck.h"
#include "trustgate/Util.h"
#include <cmath>

namespace trustgate {

namespace {
PrecheckResult reject(RejectReason r) { return PrecheckResult{false, r}; }
}

bool graph_well_formed(const SessionGraph& g) {
  if (!g.node_times.empty() && g.node_times.size() != g.node_types.size()) return false;
  for (size_t i = 1; i < g.node_times.size(); ++i) {
    if (g.node_times[i] < g.node_times[i - 1]) return false;
  }
  size_t nodes = g.node_types.size();
  for (const auto& e : g.edges) {
    if (e.from >= nodes || e.to >= nodes) return false;
    if (!std::isfinite(e.weight) || e.weight < 0.0) return false;
  }
  return true;
}

PrecheckResult precheck_request(const DecisionRequest& req, size_t dimension,
                                 const RequestLimits& limits) {
  if (req.user_id.empty() || req.user_id.size() > limits.max_id_len) {
    return reject(RejectReason::MissingUser);
  }
  if (req.session_id.empty() || req.session_id.size() > limits.max_id_len) {
    return reject(RejectReason::MissingSession);
  }
  if (req.behavioral_vector.size() != dimension) return reject(RejectReason::DimensionMismatch);
  if (!all_finite(req.behavioral_vector) || !all_finite(req.context_features)) {
    return reject(RejectReason::NonFiniteValue);
  }
  if (req.context_features.size() > limits.max_context_features ||
      req.session_graph.node_types.size() > limits.max_graph_nodes ||
      req.session_graph.edges.size() > limits.max_graph_edges) {
    return reject(RejectReason::BudgetExceeded);
  }
  if (!graph_well_formed(req.session_graph)) return reject(RejectReason::MalformedGraph);
  if (req.transaction_amount &&
      (!std::isfinite(*req.transaction_amount) || *req.transaction_amount < 0.0)) {
    return reject(RejectReason::InvalidAmount);
  }
  return PrecheckResult{true, RejectReason::None};
}

} // namespace trustgate
