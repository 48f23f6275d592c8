#pragma once

// sortie/types.hpp: Boundary data types for the goal-execution engine.
//
// MEMORY OWNERSHIP:
//   - Every type here is a value type. No borrowed references, no raw pointers.
//   - Snapshots returned by the engine are copies; callers own them.
//
// CONCURRENCY NOTES:
//   - Goal is immutable after submission. The engine copies it into the
//     ExecutionContext and never mutates it again.
//   - ExecutionContext is owned by the engine's owner thread; the public API
//     only ever hands out copies.
//
// All timestamps are unix epoch milliseconds.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sortie/jsonlite.hpp"

namespace sortie {

enum class ErrorCode {
  none,
  json_parse_error,
  invalid_goal,
  no_plans,
  planning_failed,
  sandbox_create_failed,
  sandbox_cleanup_failed,
  resource_limit_exceeded,
  constraint_violation,
  dependency_failed,
  unknown_tool,
  tool_failed,
  deadline_exceeded,
  cancelled,
  all_candidates_failed,
  engine_stopped,
  spawn_failed,
  timeout,
};

std::string to_string(ErrorCode code);

std::uint64_t now_unix_ms();

enum class Priority { low = 0, medium = 1, high = 2, critical = 3 };

std::string to_string(Priority p);
std::optional<Priority> priority_from_string(const std::string& s);

enum class GoalState { submitted, planning, executing, comparing, completed, failed, cancelled };

std::string to_string(GoalState s);
bool is_terminal(GoalState s);

enum class ConstraintKind { resource_limit, time_limit, quality_threshold, custom };

std::string to_string(ConstraintKind k);
std::optional<ConstraintKind> constraint_kind_from_string(const std::string& s);

struct ResourceUsage {
  double cpu_percent{0.0};
  double memory_mb{0.0};
  double network_mbps{0.0};
  double storage_mb{0.0};

  ResourceUsage& operator+=(const ResourceUsage& o) {
    cpu_percent += o.cpu_percent;
    memory_mb += o.memory_mb;
    network_mbps += o.network_mbps;
    storage_mb += o.storage_mb;
    return *this;
  }
};

struct ResourceLimits {
  double max_cpu_percent{80.0};
  double max_memory_mb{2048.0};
  double max_network_mbps{100.0};
  double max_storage_mb{10240.0};
};

struct ResourceState {
  ResourceUsage in_use;
  ResourceLimits limits;
  std::size_t active_reservations{0};
  std::vector<std::string> available_tools;
};

// A named, typed restriction attached to a goal.
//   resource_limit:    `limits` caps what any single step may request.
//   time_limit:        `time_limit_ms` bounds execution from its start.
//   quality_threshold: `threshold` is compared with the winning score.
//   custom:            opaque key/value kept for the plan oracle.
struct Constraint {
  std::string name;
  ConstraintKind kind{ConstraintKind::custom};
  ResourceLimits limits;
  std::uint64_t time_limit_ms{0};
  double threshold{0.0};
  std::string value;
};

struct Goal {
  std::string id;
  std::string description;
  Priority priority{Priority::medium};
  std::optional<std::uint64_t> deadline_unix_ms;
  std::vector<Constraint> constraints;
  std::vector<std::string> success_criteria;
};

struct ToolExecutionResult {
  std::string tool_id;
  std::string step_id;
  bool success{false};
  jsonlite::Value result;
  std::optional<std::string> error;
  std::uint64_t execution_time_ms{0};
  ResourceUsage resources_used;
  std::optional<double> cost_usd;
};

struct ContextEntry {
  std::uint64_t timestamp_ms{0};
  std::string event;
  jsonlite::Value data;
};

struct ExecutionResult {
  std::string plan_id;
  std::string sandbox_id;
  bool success{false};
  jsonlite::Value output;
  std::uint64_t execution_time_ms{0};
  std::size_t steps_completed{0};
  std::size_t steps_failed{0};
  std::optional<std::string> error;
  std::optional<double> cost;
};

// Produced only by the comparator. rank is 1-based and assigned after sorting.
struct ScoredResult {
  ExecutionResult result;
  double score{0.0};
  std::size_t rank{0};
  std::vector<std::string> reasons;
};

struct ExecutionContext {
  Goal goal;
  GoalState state{GoalState::submitted};
  std::map<std::string, jsonlite::Value> state_map;
  ResourceState resources;
  std::vector<ToolExecutionResult> tool_results;
  std::vector<ContextEntry> history;
  std::vector<ScoredResult> ranked_results;
  std::optional<std::string> error;
  std::uint64_t submitted_at_ms{0};
  std::uint64_t finished_at_ms{0};
};

struct Experience {
  std::string goal_description;
  std::string tool_id;
  bool success{false};
  std::uint64_t execution_time_ms{0};
  ResourceUsage resources_used;
  std::uint64_t timestamp_ms{0};
};

// Per-tool aggregate. avg_resource_usage holds the most recent observation,
// not a mean.
struct Strategy {
  std::string tool_id;
  double success_rate{0.0};
  double avg_execution_time_ms{0.0};
  ResourceUsage avg_resource_usage;
  std::uint64_t usage_count{0};
};

struct MemoryEntry {
  std::uint64_t timestamp_ms{0};
  std::string event;
  jsonlite::Value data;
  double importance{0.0};
};

struct PlanStep {
  std::string id;
  std::string tool_id;
  std::string description;
  jsonlite::Object parameters;
  ResourceUsage estimated_resources;
  std::vector<std::string> dependencies;
};

struct Plan {
  std::string id;
  std::string goal_id;
  std::vector<PlanStep> steps;
  std::uint64_t estimated_duration_ms{0};
};

}  // namespace sortie
