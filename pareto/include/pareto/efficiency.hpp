#pragma once
#include "pareto/common.hpp"
#include "pareto/exchange_graph.hpp"

namespace pareto {

class EfficiencyChecker {
public:
  explicit EfficiencyChecker(const Config &config = Config());

  // True iff the exchange graph has no negative cycle.
  bool isEfficient(const Valuations &valuations,
                   const Allocation &allocations) const;

  // Same check on an already built graph.
  bool isEfficient(const ExchangeGraph &graph) const;

private:
  Config config_;
};

// Pareto efficiency of a fractional allocation under additive valuations.
bool isParetoEfficient(const Valuations &valuations,
                       const Allocation &allocations,
                       const Config &config = Config());

} // namespace pareto
