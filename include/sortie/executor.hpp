#pragma once

// sortie/executor.hpp: Runs one candidate plan inside its own sandbox.
//
// STEP PROTOCOL (declared order, one step at a time):
//   1. cooperative checks: cancellation, then the effective deadline. Once
//      either fires no further steps are dispatched.
//   2. dependencies: a step whose dependency did not succeed fails with
//      dependency_failed and is not dispatched.
//   3. goal resource_limit constraints: an estimate above any of them fails
//      with constraint_violation.
//   4. reservation: an estimate that can never fit fails at once; otherwise
//      up to reservation_retries retries with a fixed backoff. A final
//      rejection fails the step with resource_limit_exceeded.
//   5. dispatch: working-memory entries, tool call, release with measured
//      usage, learning record, step sink.
//
// Failures of kind 2-4 count as failed steps but never reach the tool and are
// not recorded as experiences.
//
// INVARIANT: run() never throws and never aborts sibling candidates. A
// sandbox creation failure is reported in the outcome's ExecutionResult.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "sortie/learning.hpp"
#include "sortie/memory.hpp"
#include "sortie/observability.hpp"
#include "sortie/planner.hpp"
#include "sortie/resources.hpp"
#include "sortie/sandbox.hpp"
#include "sortie/tools.hpp"
#include "sortie/types.hpp"

namespace sortie {

class CancellationToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

struct ExecutorOptions {
  bool use_isolated_branch{false};
  bool abort_on_step_failure{false};
  std::uint32_t reservation_retries{3};
  std::uint64_t reservation_backoff_ms{20};
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

struct CandidateOutcome {
  ExecutionResult result;
  std::optional<Sandbox> sandbox;
  std::vector<ToolExecutionResult> steps;
  bool cancelled{false};
  bool criteria_met{false};
};

// Called once per step outcome, from the candidate's worker thread.
using StepSink = std::function<void(const std::string& plan_id, const ToolExecutionResult&)>;

class CandidateExecutor {
 public:
  CandidateExecutor(SandboxManager& sandboxes, ResourceManager& resources, LearningSystem& learning,
                    WorkingMemory& memory, IToolRegistry& tools, ICriteriaEvaluator* criteria,
                    EngineStats* stats)
      : sandboxes_(sandboxes),
        resources_(resources),
        learning_(learning),
        memory_(memory),
        tools_(tools),
        criteria_(criteria),
        stats_(stats) {}

  CandidateOutcome run(const Goal& goal, const Plan& plan, const ExecutorOptions& options,
                       const CancellationToken& cancel, const StepSink& sink) const;

 private:
  bool all_criteria_met(const Goal& goal, const Plan& plan,
                        const std::vector<ToolExecutionResult>& results) const;

  SandboxManager& sandboxes_;
  ResourceManager& resources_;
  LearningSystem& learning_;
  WorkingMemory& memory_;
  IToolRegistry& tools_;
  ICriteriaEvaluator* criteria_;
  EngineStats* stats_;
};

// Tightest of the goal deadline and its time_limit constraints, measured
// from `start`. nullopt when the goal sets neither.
std::optional<std::chrono::steady_clock::time_point> effective_deadline(
    const Goal& goal, std::chrono::steady_clock::time_point start);

}  // namespace sortie
