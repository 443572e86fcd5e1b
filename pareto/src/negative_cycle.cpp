#include "pareto/negative_cycle.hpp"
#include <algorithm>
#include <limits>
#include <spdlog/spdlog.h>

namespace pareto {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();
constexpr size_t NONE = std::numeric_limits<size_t>::max();

// One pass over all edges. Returns true if any distance changed.
bool relaxAll(const Digraph &graph, std::vector<double> &dist,
              std::vector<size_t> &pred, double tolerance) {
  bool changed = false;
  for (const auto &e : graph.edges) {
    if (dist[e.from] == INF)
      continue;
    double cand = dist[e.from] + e.weight;
    if (cand < dist[e.to] - tolerance) {
      dist[e.to] = cand;
      pred[e.to] = e.from;
      changed = true;
    }
  }
  return changed;
}

// Walk predecessors back from `start` until a node repeats, then emit the
// cycle through that node in forward order.
std::optional<Cycle> extractCycle(const std::vector<size_t> &pred,
                                  size_t start) {
  std::vector<bool> seen(pred.size(), false);
  size_t x = start;
  while (!seen[x]) {
    seen[x] = true;
    x = pred[x];
    if (x == NONE)
      return std::nullopt;
  }

  Cycle cycle{x};
  for (size_t y = pred[x]; y != x; y = pred[y])
    cycle.push_back(y);
  cycle.push_back(x);
  std::reverse(cycle.begin(), cycle.end());
  return cycle;
}

void rotateToStart(Cycle &cycle, size_t source) {
  cycle.pop_back();
  auto it = std::find(cycle.begin(), cycle.end(), source);
  if (it != cycle.end())
    std::rotate(cycle.begin(), it, cycle.end());
  cycle.push_back(cycle.front());
}

} // namespace

// ── Single-source detection with cycle extraction ────────────────────
std::optional<Cycle> BellmanFord::findNegativeCycle(const Digraph &graph,
                                                    size_t source,
                                                    double tolerance) {
  const size_t n = graph.num_nodes;
  if (graph.edges.empty() || source >= n)
    return std::nullopt;

  std::vector<double> dist(n, INF);
  std::vector<size_t> pred(n, NONE);
  dist[source] = 0.0;

  for (size_t round = 0; round + 1 < n; round++) {
    if (!relaxAll(graph, dist, pred, tolerance))
      return std::nullopt;
  }

  // Extra round: any edge that still relaxes closes a negative cycle.
  for (const auto &e : graph.edges) {
    if (dist[e.from] == INF)
      continue;
    double cand = dist[e.from] + e.weight;
    if (cand >= dist[e.to] - tolerance)
      continue;

    dist[e.to] = cand;
    pred[e.to] = e.from;
    auto cycle = extractCycle(pred, e.to);
    if (!cycle)
      continue;

    rotateToStart(*cycle, source);
    spdlog::debug("[BellmanFord] Negative cycle of length {} via edge {}->{}",
                  cycle->size() - 1, e.from, e.to);
    return cycle;
  }
  return std::nullopt;
}

// ── Whole-graph check (virtual source at distance 0 to every node) ───
bool BellmanFord::hasNegativeCycle(const Digraph &graph, double tolerance) {
  const size_t n = graph.num_nodes;
  if (graph.edges.empty())
    return false;

  std::vector<double> dist(n, 0.0);
  std::vector<size_t> pred(n, NONE);

  for (size_t round = 0; round + 1 < n; round++) {
    if (!relaxAll(graph, dist, pred, tolerance))
      return false;
  }
  return relaxAll(graph, dist, pred, tolerance);
}

// ── Floyd-Warshall ───────────────────────────────────────────────────
bool BellmanFord::allPairsHasNegativeCycle(const Digraph &graph,
                                           double tolerance) {
  const size_t n = graph.num_nodes;
  std::vector<std::vector<double>> d(n, std::vector<double>(n, INF));
  for (size_t i = 0; i < n; i++)
    d[i][i] = 0.0;
  for (const auto &e : graph.edges)
    d[e.from][e.to] = std::min(d[e.from][e.to], e.weight);

  for (size_t k = 0; k < n; k++)
    for (size_t i = 0; i < n; i++) {
      if (d[i][k] == INF)
        continue;
      for (size_t j = 0; j < n; j++) {
        if (d[k][j] == INF)
          continue;
        // Same acceptance rule as relaxAll, so round-off 2-cycles never
        // compound into a reported cycle.
        double cand = d[i][k] + d[k][j];
        if (cand < d[i][j] - tolerance)
          d[i][j] = cand;
      }
    }

  for (size_t i = 0; i < n; i++)
    if (d[i][i] < -tolerance)
      return true;
  return false;
}

double BellmanFord::cycleWeight(const Digraph &graph, const Cycle &cycle) {
  double total = 0.0;
  for (size_t i = 0; i + 1 < cycle.size(); i++) {
    double best = INF;
    for (const auto &e : graph.edges)
      if (e.from == cycle[i] && e.to == cycle[i + 1])
        best = std::min(best, e.weight);
    if (best == INF)
      throw std::invalid_argument("cycle uses a missing edge " +
                                  std::to_string(cycle[i]) + "->" +
                                  std::to_string(cycle[i + 1]));
    total += best;
  }
  return total;
}

} // namespace pareto
