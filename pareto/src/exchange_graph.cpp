#include "pareto/exchange_graph.hpp"
#include <cmath>
#include <limits>
#include <sstream>
#include <spdlog/spdlog.h>

namespace pareto {

// ── Input validation ─────────────────────────────────────────────────
void ExchangeGraph::validate(const Valuations &valuations,
                             const Allocation &allocations) {
  if (valuations.rows() != allocations.rows() ||
      valuations.cols() != allocations.cols()) {
    std::ostringstream msg;
    msg << "valuations are " << valuations.rows() << "x" << valuations.cols()
        << " but allocations are " << allocations.rows() << "x"
        << allocations.cols();
    throw ShapeError(msg.str());
  }

  for (Eigen::Index i = 0; i < valuations.rows(); i++) {
    for (Eigen::Index k = 0; k < valuations.cols(); k++) {
      double v = valuations(i, k);
      if (!std::isfinite(v) || v <= 0.0) {
        std::ostringstream msg;
        msg << "valuation[" << i << "][" << k << "] = " << v
            << " must be positive and finite";
        throw DomainError(msg.str());
      }
      if (!std::isfinite(allocations(i, k))) {
        std::ostringstream msg;
        msg << "allocation[" << i << "][" << k << "] is not finite";
        throw DomainError(msg.str());
      }
    }
  }
}

// ── Build ────────────────────────────────────────────────────────────
ExchangeGraph ExchangeGraph::build(const Valuations &valuations,
                                   const Allocation &allocations) {
  validate(valuations, allocations);

  ExchangeGraph g;
  const size_t players = valuations.rows();
  const size_t items = valuations.cols();
  g.graph_.num_nodes = players;

  for (size_t i = 0; i < players; i++) {
    for (size_t j = 0; j < players; j++) {
      if (i == j)
        continue;

      // Weight and critical item in one pass; strict < keeps the first
      // index on ties.
      double best = std::numeric_limits<double>::infinity();
      size_t best_item = items;
      for (size_t k = 0; k < items; k++) {
        if (allocations(i, k) == 0.0)
          continue;
        double w = std::log(valuations(i, k) / valuations(j, k));
        if (w < best) {
          best = w;
          best_item = k;
        }
      }
      if (best_item == items)
        continue; // player i holds nothing to offer

      g.graph_.edges.push_back({i, j, best});
      g.critical_[g.key(i, j)] = best_item;
    }
  }

  spdlog::debug("[ExchangeGraph] {} players, {} items -> {} edges", players,
                items, g.graph_.edges.size());
  return g;
}

std::optional<size_t> ExchangeGraph::firstSource() const {
  if (graph_.edges.empty())
    return std::nullopt;
  return graph_.edges.front().from;
}

std::optional<size_t> ExchangeGraph::criticalItem(size_t from,
                                                  size_t to) const {
  if (from >= graph_.num_nodes || to >= graph_.num_nodes)
    return std::nullopt;
  auto it = critical_.find(key(from, to));
  if (it == critical_.end())
    return std::nullopt;
  return it->second;
}

} // namespace pareto
