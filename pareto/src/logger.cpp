#include "pareto/logger.hpp"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>

namespace pareto {

static std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::ostringstream ss;
  ss << std::put_time(std::localtime(&t), "%Y-%m-%dT%H:%M:%S") << '.'
     << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

static std::string joinCycle(const Cycle &cycle) {
  std::ostringstream ss;
  for (size_t i = 0; i < cycle.size(); i++) {
    if (i > 0)
      ss << '-';
    ss << cycle[i];
  }
  return ss.str();
}

Logger::Logger(const std::string &log_dir) : log_dir_(log_dir) {
  std::filesystem::create_directories(log_dir_);

  check_csv_.open(log_dir_ + "/checks.csv", std::ios::app);
  step_csv_.open(log_dir_ + "/improvements.csv", std::ios::app);
  if (!check_csv_.is_open() || !step_csv_.is_open())
    throw std::runtime_error("cannot open audit logs in " + log_dir_);
  ensureHeaders();
}

Logger::~Logger() {
  if (check_csv_.is_open())
    check_csv_.close();
  if (step_csv_.is_open())
    step_csv_.close();
}

void Logger::ensureHeaders() {
  // tellp() is unreliable with ios::app
  auto check_path = std::filesystem::path(log_dir_) / "checks.csv";
  auto step_path = std::filesystem::path(log_dir_) / "improvements.csv";

  if (std::filesystem::file_size(check_path) == 0) {
    check_csv_ << "timestamp,players,items,edges,efficient,elapsed_ms\n";
    check_csv_.flush();
  }
  if (std::filesystem::file_size(step_path) == 0) {
    step_csv_ << "timestamp,step,cycle,cycle_length,cycle_weight,"
                 "step_scale,num_transfers\n";
    step_csv_.flush();
  }
}

void Logger::logCheck(size_t players, size_t items, size_t edges,
                      bool efficient, double elapsed) {
  std::lock_guard<std::mutex> lock(mtx_);
  check_csv_ << timestamp() << "," << players << "," << items << "," << edges
             << "," << (efficient ? "true" : "false") << "," << std::fixed
             << std::setprecision(3) << elapsed << "\n";
  check_csv_.flush();

  spdlog::info("Allocation over {} players x {} items is {}", players, items,
               efficient ? "Pareto efficient" : "NOT Pareto efficient");
}

void Logger::logImprovement(int step, const ImproveResult &result) {
  std::lock_guard<std::mutex> lock(mtx_);
  step_csv_ << timestamp() << "," << step << "," << joinCycle(result.cycle)
            << "," << (result.cycle.empty() ? 0 : result.cycle.size() - 1)
            << "," << std::fixed << std::setprecision(6) << result.cycle_weight
            << "," << std::fixed << std::setprecision(6) << result.step_scale
            << "," << result.transfers.size() << "\n";
  step_csv_.flush();

  for (const auto &t : result.transfers) {
    spdlog::info("  ├─ player {} -> player {}: item {} x {:.6g}", t.from, t.to,
                 t.item, t.amount);
  }
}

void Logger::logRun(int steps, bool efficient, double elapsed) {
  spdlog::info("── Run done ── steps={}, efficient={}, elapsed={:.1f}ms ──",
               steps, efficient, elapsed);
}

} // namespace pareto
