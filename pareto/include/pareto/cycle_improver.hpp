#pragma once
#include "pareto/common.hpp"
#include "pareto/exchange_graph.hpp"

namespace pareto {

// One cycle-canceling step: find a profitable trading cycle and shift a
// sliver of each edge's critical item around it.
class CycleImprover {
public:
  explicit CycleImprover(const Config &config = Config());

  // Updates `allocations` in place unless the result is efficient.
  ImproveResult improve(const Valuations &valuations,
                        Allocation &allocations) const;

  // Transfers for `cycle` under the configured rule, without applying them.
  std::vector<Transfer> planTransfers(const Valuations &valuations,
                                      const Allocation &allocations,
                                      const ExchangeGraph &graph,
                                      const Cycle &cycle,
                                      double &step_scale) const;

private:
  Config config_;

  std::vector<Transfer> compensated(const Valuations &valuations,
                                    const Allocation &allocations,
                                    const Cycle &cycle,
                                    const std::vector<size_t> &items,
                                    double &step_scale) const;
  std::vector<Transfer> itemRatio(const Valuations &valuations,
                                  const Cycle &cycle,
                                  const std::vector<size_t> &items) const;
};

// Returns result.efficient == true (allocation untouched) or the allocation
// after one improving step.
ImproveResult checkAndImprove(const Valuations &valuations,
                              Allocation &allocations,
                              const Config &config = Config());

// Σ_k A[i][k] * V[i][k] for every player.
Eigen::VectorXd utilities(const Valuations &valuations,
                          const Allocation &allocations);

} // namespace pareto
