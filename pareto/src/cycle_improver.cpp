#include "pareto/cycle_improver.hpp"
#include "pareto/negative_cycle.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace pareto {

CycleImprover::CycleImprover(const Config &config) : config_(config) {
  if (!std::isfinite(config_.step_epsilon) || config_.step_epsilon <= 0.0)
    throw std::invalid_argument("step_epsilon must be positive");
}

// ── Compensated rule ─────────────────────────────────────────────────
//
// Hop i moves d_i of item k_i from c_i to c_{i+1}.  Player c_{i+1} receives
// d_i * V[c_{i+1}][k_i] and pays d_{i+1} * V[c_{i+1}][k_{i+1}], so with
//
//   d_{i+1} = d_i * V[c_{i+1}][k_i] / V[c_{i+1}][k_{i+1}] / rho,
//   rho     = exp(-W / m),
//
// every intermediate player keeps a (1 - 1/rho) share of what it receives
// and the first player ends up rho times better on its own trade.  W < 0
// is the cycle weight, m its length.
std::vector<Transfer>
CycleImprover::compensated(const Valuations &valuations,
                           const Allocation &allocations, const Cycle &cycle,
                           const std::vector<size_t> &items,
                           double &step_scale) const {
  const size_t m = items.size();

  double weight = 0.0;
  for (size_t i = 0; i < m; i++)
    weight += std::log(valuations(cycle[i], items[i]) /
                       valuations(cycle[i + 1], items[i]));
  const double rho = std::exp(-weight / static_cast<double>(m));

  std::vector<Transfer> transfers;
  double eps = config_.step_epsilon;
  for (size_t i = 0; i < m; i++) {
    transfers.push_back({cycle[i], cycle[i + 1], items[i], eps});
    if (i + 1 < m) {
      size_t v = cycle[i + 1];
      eps *= valuations(v, items[i]) / valuations(v, items[i + 1]) / rho;
    }
  }

  // Scale the whole step so no giver hands over more than it holds.
  step_scale = 1.0;
  for (const auto &t : transfers) {
    double held = std::max(0.0, allocations(t.from, t.item));
    if (t.amount > held)
      step_scale = std::min(step_scale, held / t.amount);
  }
  if (step_scale < 1.0) {
    for (auto &t : transfers)
      t.amount = std::min(t.amount * step_scale,
                          std::max(0.0, allocations(t.from, t.item)));
  }
  return transfers;
}

// ── Item-ratio rule ──────────────────────────────────────────────────
std::vector<Transfer>
CycleImprover::itemRatio(const Valuations &valuations, const Cycle &cycle,
                         const std::vector<size_t> &items) const {
  std::vector<Transfer> transfers;
  double eps = config_.step_epsilon;
  for (size_t i = 0; i < items.size(); i++) {
    size_t u = cycle[i], v = cycle[i + 1], item = items[i];
    double delta = eps * valuations(v, item) / valuations(u, item);
    transfers.push_back({u, v, item, delta});
    eps *= valuations(u, item) / valuations(v, item);
  }
  return transfers;
}

std::vector<Transfer> CycleImprover::planTransfers(
    const Valuations &valuations, const Allocation &allocations,
    const ExchangeGraph &graph, const Cycle &cycle, double &step_scale) const {
  std::vector<size_t> items;
  for (size_t i = 0; i + 1 < cycle.size(); i++) {
    auto item = graph.criticalItem(cycle[i], cycle[i + 1]);
    if (!item)
      throw std::invalid_argument("cycle uses a missing edge " +
                                  std::to_string(cycle[i]) + "->" +
                                  std::to_string(cycle[i + 1]));
    items.push_back(*item);
  }

  step_scale = 1.0;
  switch (config_.step_rule) {
  case StepRule::COMPENSATED:
    return compensated(valuations, allocations, cycle, items, step_scale);
  case StepRule::ITEM_RATIO:
    return itemRatio(valuations, cycle, items);
  }
  return {};
}

// ── One improvement step ─────────────────────────────────────────────
ImproveResult CycleImprover::improve(const Valuations &valuations,
                                     Allocation &allocations) const {
  ImproveResult result;
  auto graph = ExchangeGraph::build(valuations, allocations);

  auto source = graph.firstSource();
  std::optional<Cycle> cycle;
  if (source) {
    cycle = BellmanFord::findNegativeCycle(graph.graph(), *source,
                                           config_.relax_tolerance);
  }

  if (!cycle) {
    result.efficient = true;
    result.allocation = allocations;
    return result;
  }

  result.cycle = *cycle;
  result.cycle_weight = BellmanFord::cycleWeight(graph.graph(), *cycle);
  result.transfers = planTransfers(valuations, allocations, graph, *cycle,
                                   result.step_scale);

  for (const auto &t : result.transfers) {
    allocations(t.to, t.item) += t.amount;
    allocations(t.from, t.item) -= t.amount;
  }

  if (result.step_scale < 1.0) {
    spdlog::warn("[Improver] Step scaled by {:.4g} to respect holdings",
                 result.step_scale);
  }
  spdlog::info("[Improver] Canceled cycle of length {} (weight={:.6f}, "
               "rule={})",
               result.cycle.size() - 1, result.cycle_weight,
               stepRuleName(config_.step_rule));

  result.allocation = allocations;
  return result;
}

ImproveResult checkAndImprove(const Valuations &valuations,
                              Allocation &allocations, const Config &config) {
  return CycleImprover(config).improve(valuations, allocations);
}

Eigen::VectorXd utilities(const Valuations &valuations,
                          const Allocation &allocations) {
  return valuations.cwiseProduct(allocations).rowwise().sum();
}

} // namespace pareto
