#include "sortie/executor.hpp"

#include <exception>
#include <set>
#include <thread>

#include "sortie/log.hpp"
#include "sortie/serialize.hpp"

namespace sortie {

namespace {

using Clock = std::chrono::steady_clock;

std::uint64_t elapsed_ms(Clock::time_point since) {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count());
}

bool is_zero(const ResourceUsage& u) {
  return u.cpu_percent == 0.0 && u.memory_mb == 0.0 && u.network_mbps == 0.0 && u.storage_mb == 0.0;
}

// Returns the name of the first dimension of `u` above `l`, or nullptr.
const char* exceeds(const ResourceUsage& u, const ResourceLimits& l) {
  if (u.cpu_percent > l.max_cpu_percent) return "cpu_percent";
  if (u.memory_mb > l.max_memory_mb) return "memory_mb";
  if (u.network_mbps > l.max_network_mbps) return "network_mbps";
  if (u.storage_mb > l.max_storage_mb) return "storage_mb";
  return nullptr;
}

// Working memory is best-effort: a failed write is logged and dropped.
void remember(WorkingMemory& memory, const std::string& event, jsonlite::Value data, double importance) {
  try {
    memory.add(event, std::move(data), importance);
  } catch (const std::exception& e) {
    log_warn("executor", "dropped memory entry " + event + ": " + e.what());
  }
}

ToolExecutionResult rejected_step(const PlanStep& step, ErrorCode code, const std::string& detail) {
  ToolExecutionResult r;
  r.tool_id = step.tool_id;
  r.step_id = step.id;
  r.success = false;
  r.error = to_string(code) + ": " + detail;
  return r;
}

}  // namespace

std::optional<Clock::time_point> effective_deadline(const Goal& goal, Clock::time_point start) {
  std::optional<Clock::time_point> out;
  auto tighten = [&out](Clock::time_point t) {
    if (!out || t < *out) out = t;
  };
  if (goal.deadline_unix_ms) {
    const std::uint64_t now = now_unix_ms();
    const std::uint64_t remaining = *goal.deadline_unix_ms > now ? *goal.deadline_unix_ms - now : 0;
    tighten(start + std::chrono::milliseconds(remaining));
  }
  for (const auto& c : goal.constraints) {
    if (c.kind == ConstraintKind::time_limit && c.time_limit_ms > 0) {
      tighten(start + std::chrono::milliseconds(c.time_limit_ms));
    }
  }
  return out;
}

bool CandidateExecutor::all_criteria_met(const Goal& goal, const Plan& plan,
                                         const std::vector<ToolExecutionResult>& results) const {
  if (!criteria_ || goal.success_criteria.empty()) return false;
  CandidateView view{&goal, &plan, &results};
  for (const auto& criterion : goal.success_criteria) {
    try {
      if (!criteria_->criterion_met(criterion, view)) return false;
    } catch (const std::exception& e) {
      log_warn("executor", "criteria evaluation failed for plan " + plan.id + ": " + e.what());
      return false;
    }
  }
  return true;
}

CandidateOutcome CandidateExecutor::run(const Goal& goal, const Plan& plan,
                                        const ExecutorOptions& options,
                                        const CancellationToken& cancel,
                                        const StepSink& sink) const {
  const auto started = Clock::now();
  CandidateOutcome out;
  ExecutionResult& res = out.result;
  res.plan_id = plan.id;

  emit_engine_event(stats_, EngineEvent{EventKind::candidate_started, goal.id, plan.id, {}, {}, true,
                                        0, {}, 0});

  auto finish = [&]() -> CandidateOutcome {
    res.execution_time_ms = elapsed_ms(started);
    emit_engine_event(stats_, EngineEvent{EventKind::candidate_finished, goal.id, plan.id, {}, {},
                                          res.success, res.execution_time_ms * 1000000ULL,
                                          res.error.value_or(""), 0});
    return std::move(out);
  };

  if (cancel.cancelled()) {
    out.cancelled = true;
    res.error = to_string(ErrorCode::cancelled);
    return finish();
  }

  std::string sandbox_error;
  out.sandbox = sandboxes_.create_sandbox(options.use_isolated_branch, &sandbox_error);
  if (!out.sandbox) {
    log_error("executor", "plan " + plan.id + ": " + sandbox_error);
    res.error = sandbox_error;
    return finish();
  }
  if (stats_) stats_->sandboxes_created.fetch_add(1, std::memory_order_relaxed);
  res.sandbox_id = out.sandbox->id;

  const ToolContext tool_ctx{goal.id, plan.id, out.sandbox->id, out.sandbox->working_dir()};
  std::set<std::string> succeeded;
  std::optional<double> total_cost;
  bool stopped_early = false;

  auto record = [&](ToolExecutionResult r) {
    if (r.success) {
      ++res.steps_completed;
      succeeded.insert(r.step_id);
      res.output = r.result;
    } else {
      ++res.steps_failed;
      if (r.error) res.error = r.error;
    }
    if (r.cost_usd) total_cost = total_cost.value_or(0.0) + *r.cost_usd;
    if (sink) sink(plan.id, r);
    out.steps.push_back(std::move(r));
  };

  for (std::size_t i = 0; i < plan.steps.size(); ++i) {
    const PlanStep& step = plan.steps[i];

    if (cancel.cancelled()) {
      out.cancelled = true;
      res.error = to_string(ErrorCode::cancelled);
      stopped_early = true;
      break;
    }
    if (options.deadline && Clock::now() >= *options.deadline) {
      res.error = to_string(ErrorCode::deadline_exceeded) + ": " +
                  std::to_string(plan.steps.size() - i) + " step(s) not run";
      stopped_early = true;
      break;
    }

    std::string missing;
    for (const auto& dep : step.dependencies) {
      if (!succeeded.contains(dep)) {
        missing = dep;
        break;
      }
    }
    if (!missing.empty()) {
      record(rejected_step(step, ErrorCode::dependency_failed, "step " + step.id + " needs " + missing));
      continue;
    }

    const char* violated = nullptr;
    std::string constraint_name;
    for (const auto& c : goal.constraints) {
      if (c.kind != ConstraintKind::resource_limit) continue;
      if ((violated = exceeds(step.estimated_resources, c.limits))) {
        constraint_name = c.name;
        break;
      }
    }
    if (violated) {
      record(rejected_step(step, ErrorCode::constraint_violation,
                           std::string(violated) + " above constraint \"" + constraint_name + "\""));
      continue;
    }

    std::string reserve_error;
    std::optional<ResourceManager::Ticket> ticket;
    if (resources_.can_ever_fit(step.estimated_resources)) {
      for (std::uint32_t attempt = 0; attempt <= options.reservation_retries; ++attempt) {
        ticket = resources_.reserve(step.estimated_resources, &reserve_error);
        if (ticket || cancel.cancelled() || attempt == options.reservation_retries) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(options.reservation_backoff_ms));
      }
    } else {
      resources_.reserve(step.estimated_resources, &reserve_error);
    }
    if (!ticket) {
      emit_engine_event(stats_, EngineEvent{EventKind::step_rejected, goal.id, plan.id, step.id,
                                            step.tool_id, false, 0, reserve_error, 0});
      std::string detail = reserve_error;
      const std::string prefix = to_string(ErrorCode::resource_limit_exceeded) + ": ";
      if (detail.rfind(prefix, 0) == 0) detail.erase(0, prefix.size());
      record(rejected_step(step, ErrorCode::resource_limit_exceeded, detail));
      continue;
    }
    ReservationGuard guard(resources_, *ticket);

    remember(memory_, "step_started",
             jsonlite::Object{{"goal_id", goal.id},
                              {"plan_id", plan.id},
                              {"step_id", step.id},
                              {"tool_id", step.tool_id},
                              {"description", step.description}},
             0.5);
    emit_engine_event(stats_, EngineEvent{EventKind::step_started, goal.id, plan.id, step.id,
                                          step.tool_id, true, 0, {}, 0});

    ToolExecutionResult result;
    std::uint64_t step_ns = 0;
    {
      ScopeTimer timer(step_ns);
      try {
        result = tools_.execute(step, tool_ctx);
      } catch (const std::exception& e) {
        result = rejected_step(step, ErrorCode::tool_failed, e.what());
      }
    }
    result.tool_id = step.tool_id;
    result.step_id = step.id;
    if (result.execution_time_ms == 0) result.execution_time_ms = step_ns / 1000000ULL;

    guard.release(is_zero(result.resources_used) ? std::nullopt
                                                 : std::optional<ResourceUsage>(result.resources_used));
    if (is_zero(result.resources_used)) result.resources_used = step.estimated_resources;

    remember(memory_, "step_completed",
             jsonlite::Object{{"goal_id", goal.id},
                              {"plan_id", plan.id},
                              {"step_id", step.id},
                              {"tool_id", step.tool_id},
                              {"success", result.success},
                              {"execution_time_ms", jsonlite::Value{result.execution_time_ms}}},
             result.success ? 0.5 : 0.8);
    learning_.record_experience(step.description.empty() ? goal.description : step.description,
                                step.tool_id, result.success, result.execution_time_ms,
                                result.resources_used);
    emit_engine_event(stats_, EngineEvent{EventKind::step_completed, goal.id, plan.id, step.id,
                                          step.tool_id, result.success, step_ns,
                                          result.error.value_or(""), 0});

    const bool ok = result.success;
    record(std::move(result));

    if (!ok && options.abort_on_step_failure) {
      stopped_early = true;
      break;
    }
    if (ok && all_criteria_met(goal, plan, out.steps)) {
      out.criteria_met = true;
      break;
    }
  }

  res.cost = total_cost;
  if (out.criteria_met) {
    res.success = true;
  } else {
    res.success = !stopped_early && res.steps_failed == 0 && res.steps_completed > 0;
  }
  if (res.success) res.error.reset();
  return finish();
}

}  // namespace sortie
