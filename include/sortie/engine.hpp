#pragma once

// sortie/engine.hpp: Goal execution orchestrator.
//
// STATE MACHINE:
//   submitted -> planning -> executing -> comparing -> completed | failed
//   cancelled is reachable from every non-terminal state.
//
// DESIGN:
//   One owner thread holds the goal table exclusively. Callers and goal
//   drivers talk to it over a Channel of commands; queries are answered
//   through promises, so no caller ever holds engine state or a lock across
//   a wait. Goal drivers run on their own pool (max_concurrent_goals) and
//   fan candidates out to a separate candidate pool (worker_threads), so a
//   driver blocked on its candidates can never starve them.
//
//   Waiting goals are dispatched highest priority first, FIFO within a
//   priority.
//
// OUTCOME RULES:
//   - zero candidate plans, or an oracle exception: failed.
//   - no candidate completed a single step or met the success criteria
//     (every sandbox failed, every step was refused, or every tool call
//     failed): failed with all_candidates_failed. Ranked results are kept.
//   - otherwise: completed with the rank-1 result, even when all candidates
//     partially failed.
//   Losing sandboxes are torn down after ranking. The winner's sandbox is
//   kept for inspection when retain_winning_sandbox is set and removed by
//   stop().
//
// CANCELLATION: cooperative. No further steps are dispatched; a step already
// inside a tool runs to completion. In-flight sandboxes are torn down
// (best-effort) and the goal ends in cancelled.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "sortie/channel.hpp"
#include "sortie/config.hpp"
#include "sortie/executor.hpp"
#include "sortie/learning.hpp"
#include "sortie/memory.hpp"
#include "sortie/observability.hpp"
#include "sortie/planner.hpp"
#include "sortie/resources.hpp"
#include "sortie/sandbox.hpp"
#include "sortie/tools.hpp"
#include "sortie/types.hpp"
#include "sortie/worker_pool.hpp"

namespace sortie {

class Engine {
 public:
  Engine(EngineConfig config, std::shared_ptr<IPlanOracle> oracle,
         std::shared_ptr<IToolRegistry> tools, std::shared_ptr<ICriteriaEvaluator> criteria = nullptr);
  ~Engine();
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Validates the configuration and launches the owner thread.
  bool start(std::string* error = nullptr);

  // Returns the goal id. An empty Goal::id is replaced with a generated one.
  std::optional<std::string> submit_goal(Goal goal, std::string* error = nullptr);
  std::optional<ExecutionContext> get_goal_status(const std::string& goal_id);
  std::vector<Goal> list_goals();
  // False when the goal is unknown or already terminal.
  bool cancel_goal(const std::string& goal_id);
  // Terminal state, or nullopt on timeout or unknown goal.
  std::optional<GoalState> wait_for_goal(const std::string& goal_id, std::chrono::milliseconds timeout);

  // Cancels every goal, waits for drivers to finish, joins all threads and
  // removes every remaining sandbox. Idempotent.
  void stop();

  bool running() const;

  const EngineConfig& config() const { return config_; }
  SandboxManager& sandboxes() { return sandboxes_; }
  ResourceManager& resources() { return resources_; }
  LearningSystem& learning() { return learning_; }
  WorkingMemory& memory() { return memory_; }
  EngineStats& stats() { return stats_; }

 private:
  // --- caller -> owner ---
  struct SubmitReply { std::string goal_id; std::string error; };
  struct SubmitCmd { Goal goal; std::promise<SubmitReply> reply; };
  struct QueryCmd { std::string goal_id; std::promise<std::optional<ExecutionContext>> reply; };
  struct ListCmd { std::promise<std::vector<Goal>> reply; };
  struct CancelCmd { std::string goal_id; std::promise<bool> reply; };
  struct WaitCmd { std::string goal_id; std::promise<std::optional<GoalState>> reply; };
  struct ShutdownCmd {};
  // --- goal driver -> owner ---
  struct StateChanged { std::string goal_id; GoalState state; };
  struct HistoryAppended { std::string goal_id; ContextEntry entry; };
  struct StepRecorded { std::string goal_id; ToolExecutionResult result; };
  struct Finished {
    std::string goal_id;
    GoalState state;
    std::vector<ScoredResult> ranked;
    std::optional<std::string> error;
    std::map<std::string, jsonlite::Value> state_updates;
  };

  using Command = std::variant<SubmitCmd, QueryCmd, ListCmd, CancelCmd, WaitCmd, ShutdownCmd,
                               StateChanged, HistoryAppended, StepRecorded, Finished>;

  struct GoalRecord {
    ExecutionContext ctx;
    std::shared_ptr<CancellationToken> cancel;
    std::uint64_t seq{0};
    bool dispatched{false};
    std::size_t steps_seen{0};
    std::vector<std::promise<std::optional<GoalState>>> waiters;
  };

  void owner_loop();
  void handle(Command& cmd);
  void handle_submit(SubmitCmd& cmd);
  void handle_cancel(CancelCmd& cmd);
  void handle_finished(Finished& msg);
  void dispatch_pending();
  void finalize(GoalRecord& rec, GoalState state, std::optional<std::string> error);
  void reply_stopped(Command& cmd);
  void release_sandbox(const Sandbox& sb);

  // Runs on the goal pool.
  void drive_goal(Goal goal, std::shared_ptr<CancellationToken> cancel);
  void post(Command cmd);

  EngineConfig config_;
  std::shared_ptr<IPlanOracle> oracle_;
  std::shared_ptr<IToolRegistry> tools_;
  std::shared_ptr<ICriteriaEvaluator> criteria_;

  EngineStats stats_;
  SandboxManager sandboxes_;
  ResourceManager resources_;
  LearningSystem learning_;
  WorkingMemory memory_;
  CandidateExecutor executor_;

  Channel<Command> inbox_;
  std::unique_ptr<WorkerPool> goal_pool_;
  std::unique_ptr<WorkerPool> candidate_pool_;
  std::thread owner_;

  mutable std::mutex lifecycle_mu_;
  bool started_{false};
  bool stopped_{false};

  // Owner-thread state. Never touched from any other thread.
  std::map<std::string, GoalRecord> goals_;
  std::vector<std::string> order_;
  std::uint64_t next_seq_{0};
  std::size_t running_goals_{0};
  bool shutting_down_{false};
};

}  // namespace sortie
