#include "pareto/welfare_lp.hpp"
#include "pareto/exchange_graph.hpp"
#include <cmath>
#include <glpk.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace pareto {

// ── Solve the welfare LP using GLPK ─────────────────────────────────
std::optional<WelfareCertificate>
WelfareLP::certify(const Valuations &valuations,
                   const Allocation &allocations) {
  ExchangeGraph::validate(valuations, allocations);

  const int players = static_cast<int>(valuations.rows());
  const int items = static_cast<int>(valuations.cols());
  const Eigen::VectorXd current =
      valuations.cwiseProduct(allocations).rowwise().sum();
  const double total = current.sum();

  if (players == 0 || items == 0) {
    return WelfareCertificate{true, 0.0, allocations};
  }

  auto col = [items](int i, int k) { return i * items + k + 1; };

  glp_prob *lp = glp_create_prob();
  glp_set_obj_dir(lp, GLP_MAX);

  // Suppress GLPK terminal output
  glp_term_out(GLP_OFF);

  // Variables X[i][k] >= 0
  glp_add_cols(lp, players * items);
  for (int i = 0; i < players; i++) {
    for (int k = 0; k < items; k++) {
      glp_set_col_bnds(lp, col(i, k), GLP_LO, 0.0, 0.0);
      glp_set_obj_coef(lp, col(i, k), valuations(i, k));
    }
  }

  // Rows 1..items: item totals; rows items+1..items+players: utilities
  glp_add_rows(lp, items + players);
  for (int k = 0; k < items; k++) {
    double supply = allocations.col(k).sum();
    glp_set_row_bnds(lp, k + 1, GLP_FX, supply, supply);
  }
  for (int i = 0; i < players; i++) {
    glp_set_row_bnds(lp, items + i + 1, GLP_LO, current[i], 0.0);
  }

  // Constraint matrix (GLPK uses 1-indexed arrays)
  const int nnz = 2 * players * items;
  std::vector<int> ia(nnz + 1), ja(nnz + 1);
  std::vector<double> ar(nnz + 1);
  int pos = 1;
  for (int i = 0; i < players; i++) {
    for (int k = 0; k < items; k++) {
      ia[pos] = k + 1;
      ja[pos] = col(i, k);
      ar[pos] = 1.0;
      pos++;
      ia[pos] = items + i + 1;
      ja[pos] = col(i, k);
      ar[pos] = valuations(i, k);
      pos++;
    }
  }
  glp_load_matrix(lp, nnz, ia.data(), ja.data(), ar.data());

  // Solve
  glp_smcp parm;
  glp_init_smcp(&parm);
  parm.msg_lev = GLP_MSG_OFF;

  int status = glp_simplex(lp, &parm);

  if (status != 0 || glp_get_status(lp) != GLP_OPT) {
    spdlog::warn("[WelfareLP] No optimum (simplex status {})", status);
    glp_delete_prob(lp);
    return std::nullopt;
  }

  WelfareCertificate cert;
  cert.surplus = glp_get_obj_val(lp) - total;
  cert.allocation = Allocation(players, items);
  for (int i = 0; i < players; i++)
    for (int k = 0; k < items; k++)
      cert.allocation(i, k) = glp_get_col_prim(lp, col(i, k));
  glp_delete_prob(lp);

  cert.efficient = cert.surplus <= tolerance_ * (1.0 + std::abs(total));
  spdlog::debug("[WelfareLP] surplus={:.6g} efficient={}", cert.surplus,
                cert.efficient);
  return cert;
}

} // namespace pareto
