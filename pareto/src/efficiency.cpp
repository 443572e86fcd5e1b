#include "pareto/efficiency.hpp"
#include "pareto/negative_cycle.hpp"
#include <spdlog/spdlog.h>

namespace pareto {

EfficiencyChecker::EfficiencyChecker(const Config &config) : config_(config) {}

bool EfficiencyChecker::isEfficient(const Valuations &valuations,
                                    const Allocation &allocations) const {
  return isEfficient(ExchangeGraph::build(valuations, allocations));
}

// Every node with an outgoing edge has an edge to every other node, so any
// cycle is reachable from the first edge's source.
bool EfficiencyChecker::isEfficient(const ExchangeGraph &graph) const {
  auto source = graph.firstSource();
  if (!source)
    return true;

  auto cycle = BellmanFord::findNegativeCycle(graph.graph(), *source,
                                              config_.relax_tolerance);
  if (cycle) {
    spdlog::debug("[Efficiency] Profitable cycle of length {} found",
                  cycle->size() - 1);
  }
  return !cycle.has_value();
}

bool isParetoEfficient(const Valuations &valuations,
                       const Allocation &allocations, const Config &config) {
  return EfficiencyChecker(config).isEfficient(valuations, allocations);
}

} // namespace pareto
