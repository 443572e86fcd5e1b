#pragma once
#include <Eigen/Dense>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace pareto {

// ── Step rule for the cycle-canceling move ───────────────────────────
enum class StepRule {
  COMPENSATED, // every player on the cycle strictly gains, clamped to holdings
  ITEM_RATIO   // delta = eps * V[v]/V[u], eps *= V[u]/V[v] (no clamping)
};

// ── Configuration ────────────────────────────────────────────────────
struct Config {
  double step_epsilon = 0.001; // nominal trade at the first hop
  StepRule step_rule = StepRule::COMPENSATED;
  double relax_tolerance = 1e-12; // minimum improvement for a relaxation
  int max_steps = 1;              // CLI: improvement steps per run
  bool verify_lp = false;         // CLI: cross-check with the welfare LP
  bool quiet = false;
  std::string log_dir = "logs";
};

// ── Matrices ─────────────────────────────────────────────────────────
// Rows are players, columns are items.
using Valuations = Eigen::MatrixXd;
using Allocation = Eigen::MatrixXd;

// ── Errors ───────────────────────────────────────────────────────────
class ParetoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A value that makes a ratio or logarithm undefined.
class DomainError : public ParetoError {
public:
  using ParetoError::ParetoError;
};

// Dimensions of the inputs disagree.
class ShapeError : public ParetoError {
public:
  using ParetoError::ParetoError;
};

// ── Cycles and improvement steps ─────────────────────────────────────
// Closed walk n0, n1, ..., nm == n0.
using Cycle = std::vector<size_t>;

struct Transfer {
  size_t from;
  size_t to;
  size_t item;
  double amount;
};

struct ImproveResult {
  bool efficient = false;
  Allocation allocation;          // allocation after the step
  Cycle cycle;                    // empty when efficient
  std::vector<Transfer> transfers;
  double cycle_weight = 0.0;      // sum of log-ratio weights (< 0)
  double step_scale = 1.0;        // < 1 when clamped to a holding
};

std::string stepRuleName(StepRule rule);
StepRule parseStepRule(const std::string &name);

// ── Timing helper ────────────────────────────────────────────────────
inline double elapsed_ms(std::chrono::steady_clock::time_point start) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration<double, std::milli>(now - start).count();
}

} // namespace pareto
