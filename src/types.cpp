#include "sortie/types.hpp"

#include <chrono>

namespace sortie {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::invalid_goal: return "invalid_goal";
    case ErrorCode::no_plans: return "no_plans";
    case ErrorCode::planning_failed: return "planning_failed";
    case ErrorCode::sandbox_create_failed: return "sandbox_create_failed";
    case ErrorCode::sandbox_cleanup_failed: return "sandbox_cleanup_failed";
    case ErrorCode::resource_limit_exceeded: return "resource_limit_exceeded";
    case ErrorCode::constraint_violation: return "constraint_violation";
    case ErrorCode::dependency_failed: return "dependency_failed";
    case ErrorCode::unknown_tool: return "unknown_tool";
    case ErrorCode::tool_failed: return "tool_failed";
    case ErrorCode::deadline_exceeded: return "deadline_exceeded";
    case ErrorCode::cancelled: return "cancelled";
    case ErrorCode::all_candidates_failed: return "all_candidates_failed";
    case ErrorCode::engine_stopped: return "engine_stopped";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::timeout: return "timeout";
  }
  return "unknown";
}

std::uint64_t now_unix_ms() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string to_string(Priority p) {
  switch (p) {
    case Priority::low: return "low";
    case Priority::medium: return "medium";
    case Priority::high: return "high";
    case Priority::critical: return "critical";
  }
  return "medium";
}

std::optional<Priority> priority_from_string(const std::string& s) {
  if (s == "low") return Priority::low;
  if (s == "medium") return Priority::medium;
  if (s == "high") return Priority::high;
  if (s == "critical") return Priority::critical;
  return std::nullopt;
}

std::string to_string(GoalState s) {
  switch (s) {
    case GoalState::submitted: return "submitted";
    case GoalState::planning: return "planning";
    case GoalState::executing: return "executing";
    case GoalState::comparing: return "comparing";
    case GoalState::completed: return "completed";
    case GoalState::failed: return "failed";
    case GoalState::cancelled: return "cancelled";
  }
  return "unknown";
}

bool is_terminal(GoalState s) {
  return s == GoalState::completed || s == GoalState::failed || s == GoalState::cancelled;
}

std::string to_string(ConstraintKind k) {
  switch (k) {
    case ConstraintKind::resource_limit: return "resource_limit";
    case ConstraintKind::time_limit: return "time_limit";
    case ConstraintKind::quality_threshold: return "quality_threshold";
    case ConstraintKind::custom: return "custom";
  }
  return "custom";
}

std::optional<ConstraintKind> constraint_kind_from_string(const std::string& s) {
  if (s == "resource_limit") return ConstraintKind::resource_limit;
  if (s == "time_limit") return ConstraintKind::time_limit;
  if (s == "quality_threshold") return ConstraintKind::quality_threshold;
  if (s == "custom") return ConstraintKind::custom;
  return std::nullopt;
}

}  // namespace sortie
