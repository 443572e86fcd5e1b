#pragma once
#include "pareto/common.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pareto {

// ── Problem instance ─────────────────────────────────────────────────
struct Problem {
  Valuations valuations;
  Allocation allocations;
  std::optional<double> epsilon;  // overrides Config::step_epsilon
  std::optional<StepRule> rule;   // overrides Config::step_rule
};

// Nested rows -> matrix; throws ShapeError on ragged rows.
Eigen::MatrixXd toMatrix(const std::vector<std::vector<double>> &rows);
std::vector<std::vector<double>> toRows(const Eigen::MatrixXd &m);

// {"valuations": [[...]], "allocations": [[...]], "epsilon"?, "rule"?}
Problem parseProblem(const std::string &text);
Problem loadProblem(const std::string &path);

// Largest |Σ_i A[i][k] - 1| over items.
double columnSumDeviation(const Allocation &allocations);

nlohmann::json resultToJson(const ImproveResult &result);

} // namespace pareto
