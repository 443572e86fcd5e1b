#include "pareto/common.hpp"
#include "pareto/cycle_improver.hpp"
#include "pareto/efficiency.hpp"
#include "pareto/exchange_graph.hpp"
#include "pareto/logger.hpp"
#include "pareto/problem_io.hpp"
#include "pareto/welfare_lp.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace pareto;
using json = nlohmann::json;

struct CliOptions {
  Config cfg;
  std::string input;
  std::optional<double> epsilon; // command line wins over the problem file
  std::optional<StepRule> rule;
};

static void printUsage() {
  std::cout << R"(
Usage: pareto --input <FILE> [OPTIONS]

Checks whether a fractional allocation is Pareto efficient and, if not,
applies cycle-canceling improvement steps. Prints a JSON report.

Options:
  --input <FILE>        Problem JSON: {"valuations": [[..]], "allocations": [[..]]}
  --steps <N>           Improvement steps to apply (default: 1)
  --epsilon <E>         Nominal trade size at the first hop (default: 0.001)
  --rule <NAME>         compensated | item_ratio (default: compensated)
  --tolerance <T>       Bellman-Ford relaxation tolerance (default: 1e-12)
  --verify              Cross-check with the welfare LP (GLPK)
  --log-dir <DIR>       Audit CSV directory (default: logs)
  --quiet               Only print warnings and errors
  --help, -h            Show this help

Environment:
  PARETO_LOG_DIR        Default audit CSV directory
)";
}

// ── Parse CLI args ──────────────────────────────────────────────────
static CliOptions parseArgs(int argc, char *argv[]) {
  CliOptions opts;

  if (auto *v = std::getenv("PARETO_LOG_DIR"))
    opts.cfg.log_dir = v;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];

    if (arg == "--input" && i + 1 < argc)
      opts.input = argv[++i];
    else if (arg == "--steps" && i + 1 < argc)
      opts.cfg.max_steps = std::stoi(argv[++i]);
    else if (arg == "--epsilon" && i + 1 < argc)
      opts.epsilon = std::stod(argv[++i]);
    else if (arg == "--rule" && i + 1 < argc)
      opts.rule = parseStepRule(argv[++i]);
    else if (arg == "--tolerance" && i + 1 < argc)
      opts.cfg.relax_tolerance = std::stod(argv[++i]);
    else if (arg == "--verify")
      opts.cfg.verify_lp = true;
    else if (arg == "--log-dir" && i + 1 < argc)
      opts.cfg.log_dir = argv[++i];
    else if (arg == "--quiet")
      opts.cfg.quiet = true;
    else if (arg == "--help" || arg == "-h") {
      printUsage();
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown or incomplete option: " + arg);
    }
  }

  if (opts.input.empty())
    throw std::invalid_argument("--input is required");
  if (opts.cfg.max_steps < 0)
    throw std::invalid_argument("--steps must be non-negative");
  return opts;
}

static json certificateToJson(const std::optional<WelfareCertificate> &cert) {
  if (!cert)
    return json{{"solved", false}};
  return json{{"solved", true},
              {"efficient", cert->efficient},
              {"surplus", cert->surplus}};
}

// ── Main ─────────────────────────────────────────────────────────────
int main(int argc, char *argv[]) {
  // Logs go to stderr; stdout carries the JSON report
  auto console = spdlog::stderr_color_mt("pareto");
  spdlog::set_default_logger(console);
  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  CliOptions opts;
  try {
    opts = parseArgs(argc, argv);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    printUsage();
    return 2;
  }
  Config &cfg = opts.cfg;
  if (cfg.quiet)
    spdlog::set_level(spdlog::level::warn);

  try {
    auto start = std::chrono::steady_clock::now();
    Problem problem = loadProblem(opts.input);

    if (problem.epsilon)
      cfg.step_epsilon = *problem.epsilon;
    if (problem.rule)
      cfg.step_rule = *problem.rule;
    if (opts.epsilon)
      cfg.step_epsilon = *opts.epsilon;
    if (opts.rule)
      cfg.step_rule = *opts.rule;

    const Valuations &V = problem.valuations;
    Allocation A = problem.allocations;

    spdlog::info("Players: {}, items: {}", V.rows(), V.cols());
    spdlog::info("Step rule: {}, epsilon: {}", stepRuleName(cfg.step_rule),
                 cfg.step_epsilon);

    double deviation = columnSumDeviation(A);
    if (deviation > 1e-6) {
      spdlog::warn("Item shares do not sum to 1 (max deviation {:.3g})",
                   deviation);
    }

    Logger logger(cfg.log_dir);
    EfficiencyChecker checker(cfg);
    CycleImprover improver(cfg);

    auto check_start = std::chrono::steady_clock::now();
    auto graph = ExchangeGraph::build(V, A);
    bool efficient = checker.isEfficient(graph);
    logger.logCheck(V.rows(), V.cols(), graph.numEdges(), efficient,
                    elapsed_ms(check_start));

    json report;
    report["initially_efficient"] = efficient;
    if (cfg.verify_lp) {
      auto cert = WelfareLP().certify(V, A);
      if (cert && cert->efficient != efficient) {
        spdlog::warn("Welfare LP disagrees with the exchange graph "
                     "(surplus={:.6g})",
                     cert->surplus);
      }
      report["initial_lp"] = certificateToJson(cert);
    }

    json steps = json::array();
    int taken = 0;
    while (!efficient && taken < cfg.max_steps) {
      auto result = improver.improve(V, A);
      if (result.efficient) {
        efficient = true;
        break;
      }
      taken++;
      logger.logImprovement(taken, result);
      steps.push_back(resultToJson(result));
    }
    if (!efficient && taken > 0)
      efficient = checker.isEfficient(V, A);

    report["steps"] = steps;
    report["efficient"] = efficient;
    report["allocation"] = toRows(A);
    if (cfg.verify_lp && taken > 0)
      report["final_lp"] = certificateToJson(WelfareLP().certify(V, A));

    logger.logRun(taken, efficient, elapsed_ms(start));
    std::cout << report.dump(2) << std::endl;
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  return 0;
}
