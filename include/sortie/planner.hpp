#pragma once

// sortie/planner.hpp: Plan oracle and success-criteria seams.
//
// The engine never decides which tools a plan uses. An IPlanOracle turns a
// goal plus execution history into a finite set of candidate plans; an
// optional ICriteriaEvaluator decides when a candidate has met the goal's
// success criteria.
//
// INVARIANT: propose_plans() may be called concurrently for different goals.
// It may throw; the engine treats an exception as a planning failure.

#include <memory>
#include <string>
#include <vector>

#include "sortie/types.hpp"

namespace sortie {

struct PlanningContext {
  Goal goal;
  std::vector<MemoryEntry> recent_history;  // most recent first
  std::vector<Strategy> strategies;
};

class IPlanOracle {
 public:
  virtual ~IPlanOracle() = default;
  virtual std::vector<Plan> propose_plans(const PlanningContext& ctx) = 0;
};

// Serves a fixed plan set to every goal. Plan goal_id fields are rewritten to
// the requesting goal.
class StaticPlanOracle : public IPlanOracle {
 public:
  explicit StaticPlanOracle(std::vector<Plan> plans) : plans_(std::move(plans)) {}
  std::vector<Plan> propose_plans(const PlanningContext& ctx) override;

 private:
  const std::vector<Plan> plans_;
};

// What a criteria evaluator sees of a running candidate.
struct CandidateView {
  const Goal* goal{nullptr};
  const Plan* plan{nullptr};
  const std::vector<ToolExecutionResult>* results{nullptr};
};

class ICriteriaEvaluator {
 public:
  virtual ~ICriteriaEvaluator() = default;
  virtual bool criterion_met(const std::string& criterion, const CandidateView& view) = 0;
};

// Fills blank plan and step ids and sets goal_id on every plan.
void normalize_plans(std::vector<Plan>& plans, const std::string& goal_id);

}  // namespace sortie
