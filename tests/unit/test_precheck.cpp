#include "trustgate/Precheck.h"
#include <cassert>
#include <cmath>
#include <limits>

using namespace trustgate;

namespace {
DecisionRequest valid_request() {
  DecisionRequest r{};
  r.user_id = "u";
  r.session_id = "s";
  r.behavioral_vector = {0.1f, 0.2f, 0.3f};
  r.context_features = {1.0f};
  r.session_graph.node_types = {1, 2, 3};
  r.session_graph.node_times = {10, 10, 20};
  r.session_graph.edges = {GraphEdge{0, 1, 1.0}, GraphEdge{1, 2, 0.5}};
  return r;
}
}

void test_precheck() {
  RequestLimits limits{};
  limits.max_graph_nodes = 3;
  limits.max_id_len = 8;

  assert(precheck_request(valid_request(), 3, limits).ok);

  auto r = valid_request();
  r.user_id.clear();
  assert(precheck_request(r, 3, limits).reason == RejectReason::MissingUser);
  r = valid_request();
  r.session_id = "much-too-long-session";
  assert(precheck_request(r, 3, limits).reason == RejectReason::MissingSession);
  assert(precheck_request(valid_request(), 4, limits).reason == RejectReason::DimensionMismatch);

  r = valid_request();
  r.behavioral_vector[1] = std::numeric_limits<float>::infinity();
  assert(precheck_request(r, 3, limits).reason == RejectReason::NonFiniteValue);
  r = valid_request();
  r.context_features.push_back(NAN);
  assert(precheck_request(r, 3, limits).reason == RejectReason::NonFiniteValue);

  r = valid_request();
  r.session_graph.node_types.push_back(4);
  r.session_graph.node_times.push_back(30);
  assert(precheck_request(r, 3, limits).reason == RejectReason::BudgetExceeded);

  r = valid_request();
  r.session_graph.edges.push_back(GraphEdge{0, 3, 1.0});
  assert(precheck_request(r, 3, limits).reason == RejectReason::MalformedGraph);
  r = valid_request();
  r.session_graph.node_times = {20, 10, 30};
  assert(precheck_request(r, 3, limits).reason == RejectReason::MalformedGraph);
  r = valid_request();
  r.session_graph.edges[0].weight = -1.0;
  assert(!graph_well_formed(r.session_graph));

  r = valid_request();
  r.transaction_amount = -5.0;
  assert(precheck_request(r, 3, limits).reason == RejectReason::InvalidAmount);
  r.transaction_amount = 0.0;
  assert(precheck_request(r, 3, limits).ok);

  // Empty graph and features are legal.
  r = valid_request();
  r.session_graph = SessionGraph{};
  r.context_features.clear();
  assert(precheck_request(r, 3, limits).ok);
}
