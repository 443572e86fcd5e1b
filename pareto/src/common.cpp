#include "pareto/common.hpp"

namespace pareto {

std::string stepRuleName(StepRule rule) {
  switch (rule) {
  case StepRule::COMPENSATED:
    return "compensated";
  case StepRule::ITEM_RATIO:
    return "item_ratio";
  }
  return "unknown";
}

StepRule parseStepRule(const std::string &name) {
  if (name == "compensated")
    return StepRule::COMPENSATED;
  if (name == "item_ratio" || name == "item-ratio")
    return StepRule::ITEM_RATIO;
  throw std::invalid_argument("unknown step rule: " + name);
}

} // namespace pareto
