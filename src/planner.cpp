#include "sortie/planner.hpp"

#include "sortie/hash.hpp"

namespace sortie {

std::vector<Plan> StaticPlanOracle::propose_plans(const PlanningContext& ctx) {
  std::vector<Plan> out = plans_;
  for (auto& p : out) p.goal_id = ctx.goal.id;
  return out;
}

void normalize_plans(std::vector<Plan>& plans, const std::string& goal_id) {
  for (auto& p : plans) {
    p.goal_id = goal_id;
    if (p.id.empty()) p.id = make_id("plan", goal_id);
    for (std::size_t i = 0; i < p.steps.size(); ++i) {
      if (p.steps[i].id.empty()) p.steps[i].id = "step-" + std::to_string(i + 1);
    }
  }
}

}  // namespace sortie
