#pragma once
#include "pareto/common.hpp"
#include "pareto/negative_cycle.hpp"
#include <optional>
#include <unordered_map>

namespace pareto {

// Directed exchange graph over players.
//
// Edge (i, j) exists iff player i holds a positive share of some item.
// Its weight is min_k ln(V[i][k] / V[j][k]) over the items i holds, and the
// minimising item (lowest index on ties) is the edge's critical item.
// A negative cycle is exactly a profitable trading cycle.
class ExchangeGraph {
public:
  // Throws ShapeError / DomainError on invalid input.
  static ExchangeGraph build(const Valuations &valuations,
                             const Allocation &allocations);

  // Rejects mismatched shapes, non-positive or non-finite valuations and
  // non-finite allocations.
  static void validate(const Valuations &valuations,
                       const Allocation &allocations);

  const Digraph &graph() const { return graph_; }
  size_t numPlayers() const { return graph_.num_nodes; }
  size_t numEdges() const { return graph_.edges.size(); }
  bool empty() const { return graph_.edges.empty(); }

  // Source of the first edge built; nullopt for an edgeless graph.
  std::optional<size_t> firstSource() const;

  std::optional<size_t> criticalItem(size_t from, size_t to) const;

private:
  Digraph graph_;
  std::unordered_map<size_t, size_t> critical_; // from * n + to -> item

  size_t key(size_t from, size_t to) const {
    return from * graph_.num_nodes + to;
  }
};

} // namespace pareto
