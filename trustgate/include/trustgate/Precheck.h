#pragma once
#include <cstddef>
#include <cstdint>
#include "Common.h"

namespace trustgate {

// Size budgets for untrusted request parts; requests beyond them never reach
// the pipeline.
struct RequestLimits {
  size_t max_id_len{128};
  size_t max_graph_nodes{512};
  size_t max_graph_edges{4096};
  size_t max_context_features{256};
};

struct PrecheckResult {
  bool ok{false};
  RejectReason reason{RejectReason::None};
};

PrecheckResult precheck_request(const DecisionRequest& req, size_t dimension,
                                 const RequestLimits& limits);

// Edges must reference existing nodes and node timestamps must not go backwards.
bool graph_well_formed(const SessionGraph& g);

} // namespace trustgate
