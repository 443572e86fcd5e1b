#pragma once
#include "pareto/common.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace pareto {

// CSV audit trail of efficiency checks and improvement steps.
class Logger {
public:
  explicit Logger(const std::string &log_dir = "logs");
  ~Logger();

  void logCheck(size_t players, size_t items, size_t edges, bool efficient,
                double elapsed_ms);
  void logImprovement(int step, const ImproveResult &result);
  void logRun(int steps, bool efficient, double elapsed_ms);

private:
  std::string log_dir_;
  std::ofstream check_csv_;
  std::ofstream step_csv_;
  std::mutex mtx_;

  void ensureHeaders();
};

} // namespace pareto
