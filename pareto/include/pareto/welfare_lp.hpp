#pragma once
#include "pareto/common.hpp"
#include <optional>

namespace pareto {

struct WelfareCertificate {
  bool efficient;        // no reallocation raises total utility
  double surplus;        // optimal total utility minus current
  Allocation allocation; // an optimal reallocation
};

// Independent efficiency check by linear programming:
//
//   max  Σ_i Σ_k V[i][k] X[i][k]
//   s.t. Σ_i X[i][k] = Σ_i A[i][k]     for every item k
//        Σ_k V[i][k] X[i][k] >= U_i(A) for every player i
//        X >= 0
//
// A is Pareto efficient iff the optimum equals Σ_i U_i(A).
class WelfareLP {
public:
  explicit WelfareLP(double tolerance = 1e-7) : tolerance_(tolerance) {}

  // nullopt if GLPK does not reach an optimum.
  std::optional<WelfareCertificate> certify(const Valuations &valuations,
                                            const Allocation &allocations);

private:
  double tolerance_; // relative to 1 + Σ_i U_i(A)
};

} // namespace pareto
