#pragma once

// sortie/serialize.hpp: Field-named JSON form of every boundary type.
//
// Field names are snake_case and stable. Optional fields are omitted when
// empty. Parsers never throw; they return nullopt and set *error.

#include <optional>
#include <string>
#include <vector>

#include "sortie/jsonlite.hpp"
#include "sortie/types.hpp"

namespace sortie {

jsonlite::Value to_value(const ResourceUsage& u);
jsonlite::Value to_value(const ResourceLimits& l);
jsonlite::Value to_value(const ResourceState& s);
jsonlite::Value to_value(const Constraint& c);
jsonlite::Value to_value(const Goal& g);
jsonlite::Value to_value(const ToolExecutionResult& r);
jsonlite::Value to_value(const ContextEntry& e);
jsonlite::Value to_value(const ExecutionResult& r);
jsonlite::Value to_value(const ScoredResult& s);
jsonlite::Value to_value(const ExecutionContext& c);
jsonlite::Value to_value(const Strategy& s);
jsonlite::Value to_value(const MemoryEntry& m);
jsonlite::Value to_value(const PlanStep& s);
jsonlite::Value to_value(const Plan& p);

template <typename T>
std::string to_json(const T& v) {
  return jsonlite::to_json(to_value(v));
}

ResourceUsage resource_usage_from_object(const jsonlite::Object& o);
ResourceLimits resource_limits_from_object(const jsonlite::Object& o, const ResourceLimits& defaults);

std::optional<Goal> goal_from_object(const jsonlite::Object& o, std::string* error);
std::optional<Plan> plan_from_object(const jsonlite::Object& o, std::string* error);
std::optional<ExecutionResult> execution_result_from_object(const jsonlite::Object& o, std::string* error);

std::optional<Goal> parse_goal_json(const std::string& text, std::string* error);
// Accepts either an array of plans or {"plans": [...]}.
std::optional<std::vector<Plan>> parse_plans_json(const std::string& text, std::string* error);
// Accepts either an array of results or {"results": [...]}.
std::optional<std::vector<ExecutionResult>> parse_execution_results_json(const std::string& text,
                                                                         std::string* error);

}  // namespace sortie
