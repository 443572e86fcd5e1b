#include "pareto/problem_io.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace pareto {

Eigen::MatrixXd toMatrix(const std::vector<std::vector<double>> &rows) {
  const size_t n = rows.size();
  const size_t m = n == 0 ? 0 : rows.front().size();
  Eigen::MatrixXd out(n, m);
  for (size_t i = 0; i < n; i++) {
    if (rows[i].size() != m) {
      throw ShapeError("row " + std::to_string(i) + " has " +
                       std::to_string(rows[i].size()) + " entries, expected " +
                       std::to_string(m));
    }
    for (size_t k = 0; k < m; k++)
      out(i, k) = rows[i][k];
  }
  return out;
}

std::vector<std::vector<double>> toRows(const Eigen::MatrixXd &m) {
  std::vector<std::vector<double>> rows(m.rows(),
                                        std::vector<double>(m.cols()));
  for (Eigen::Index i = 0; i < m.rows(); i++)
    for (Eigen::Index k = 0; k < m.cols(); k++)
      rows[i][k] = m(i, k);
  return rows;
}

// ── Parse problem document ───────────────────────────────────────────
Problem parseProblem(const std::string &text) {
  Problem problem;
  try {
    auto doc = json::parse(text);
    if (!doc.contains("valuations") || !doc.contains("allocations"))
      throw ShapeError("problem needs \"valuations\" and \"allocations\"");

    problem.valuations =
        toMatrix(doc["valuations"].get<std::vector<std::vector<double>>>());
    problem.allocations =
        toMatrix(doc["allocations"].get<std::vector<std::vector<double>>>());

    if (doc.contains("epsilon"))
      problem.epsilon = doc["epsilon"].get<double>();
    if (doc.contains("rule"))
      problem.rule = parseStepRule(doc["rule"].get<std::string>());
  } catch (const json::exception &e) {
    throw ShapeError(std::string("malformed problem: ") + e.what());
  } catch (const std::invalid_argument &e) {
    throw ShapeError(std::string("malformed problem: ") + e.what());
  }

  if (problem.valuations.rows() != problem.allocations.rows() ||
      problem.valuations.cols() != problem.allocations.cols()) {
    std::ostringstream msg;
    msg << "valuations are " << problem.valuations.rows() << "x"
        << problem.valuations.cols() << " but allocations are "
        << problem.allocations.rows() << "x" << problem.allocations.cols();
    throw ShapeError(msg.str());
  }
  return problem;
}

Problem loadProblem(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throw std::runtime_error("cannot open problem file: " + path);
  std::stringstream buf;
  buf << in.rdbuf();
  spdlog::debug("[ProblemIO] Read {} bytes from {}", buf.str().size(), path);
  return parseProblem(buf.str());
}

double columnSumDeviation(const Allocation &allocations) {
  double worst = 0.0;
  for (Eigen::Index k = 0; k < allocations.cols(); k++)
    worst = std::max(worst, std::abs(allocations.col(k).sum() - 1.0));
  return worst;
}

// ── Render result ────────────────────────────────────────────────────
json resultToJson(const ImproveResult &result) {
  json out;
  out["efficient"] = result.efficient;
  out["allocation"] = toRows(result.allocation);
  if (!result.efficient) {
    out["cycle"] = result.cycle;
    out["cycle_weight"] = result.cycle_weight;
    out["step_scale"] = result.step_scale;
    json transfers = json::array();
    for (const auto &t : result.transfers) {
      transfers.push_back(
          {{"from", t.from}, {"to", t.to}, {"item", t.item}, {"amount", t.amount}});
    }
    out["transfers"] = transfers;
  }
  return out;
}

} // namespace pareto
