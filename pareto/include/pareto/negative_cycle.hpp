#pragma once
#include "pareto/common.hpp"
#include <optional>
#include <vector>

namespace pareto {

// ── Weighted digraph ─────────────────────────────────────────────────
struct WeightedEdge {
  size_t from;
  size_t to;
  double weight;
};

struct Digraph {
  size_t num_nodes = 0;
  std::vector<WeightedEdge> edges;
};

class BellmanFord {
public:
  // Negative cycle reachable from `source`, or nullopt.
  // The cycle is closed (front() == back()) and starts at `source` when
  // `source` lies on it.
  static std::optional<Cycle> findNegativeCycle(const Digraph &graph,
                                                size_t source,
                                                double tolerance = 1e-12);

  // Any negative cycle anywhere in the graph.
  static bool hasNegativeCycle(const Digraph &graph, double tolerance = 1e-12);

  // Floyd-Warshall: negative diagonal after closure.
  static bool allPairsHasNegativeCycle(const Digraph &graph,
                                       double tolerance = 1e-12);

  // Sum of edge weights along a closed walk; throws if an edge is missing.
  static double cycleWeight(const Digraph &graph, const Cycle &cycle);
};

} // namespace pareto
