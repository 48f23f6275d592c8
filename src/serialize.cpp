#include "sortie/serialize.hpp"

namespace sortie {

using jsonlite::Array;
using jsonlite::Object;
using jsonlite::Value;

namespace {

Value strings(const std::vector<std::string>& v) {
  Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.emplace_back(s);
  return Value{std::move(a)};
}

Value field(const Object& o, const std::string& key) {
  auto it = o.find(key);
  return it == o.end() ? Value{} : it->second;
}

template <typename T, typename Fn>
std::optional<std::vector<T>> parse_list(const std::string& text, const std::string& wrapper_key,
                                         Fn&& from_object, std::string* error) {
  std::optional<jsonlite::JsonError> jerr;
  auto root = jsonlite::parse_value(text, &jerr);
  if (!root) {
    if (error) *error = jerr ? jerr->code + ": " + jerr->message : "json_parse_error";
    return std::nullopt;
  }
  Array items;
  if (root->is_array()) {
    items = std::get<Array>(root->v);
  } else if (root->is_object()) {
    const auto& obj = std::get<Object>(root->v);
    auto it = obj.find(wrapper_key);
    if (it == obj.end() || !it->second.is_array()) {
      if (error) *error = "expected an array or an object with \"" + wrapper_key + "\"";
      return std::nullopt;
    }
    items = std::get<Array>(it->second.v);
  } else {
    if (error) *error = "expected an array or an object with \"" + wrapper_key + "\"";
    return std::nullopt;
  }

  std::vector<T> out;
  out.reserve(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (!items[i].is_object()) {
      if (error) *error = wrapper_key + "[" + std::to_string(i) + "]: expected object";
      return std::nullopt;
    }
    std::string item_err;
    auto parsed = from_object(std::get<Object>(items[i].v), &item_err);
    if (!parsed) {
      if (error) *error = wrapper_key + "[" + std::to_string(i) + "]: " + item_err;
      return std::nullopt;
    }
    out.push_back(std::move(*parsed));
  }
  return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

Value to_value(const ResourceUsage& u) {
  return Object{{"cpu_percent", u.cpu_percent},
                {"memory_mb", u.memory_mb},
                {"network_mbps", u.network_mbps},
                {"storage_mb", u.storage_mb}};
}

Value to_value(const ResourceLimits& l) {
  return Object{{"max_cpu_percent", l.max_cpu_percent},
                {"max_memory_mb", l.max_memory_mb},
                {"max_network_mbps", l.max_network_mbps},
                {"max_storage_mb", l.max_storage_mb}};
}

Value to_value(const ResourceState& s) {
  return Object{{"in_use", to_value(s.in_use)},
                {"limits", to_value(s.limits)},
                {"active_reservations", Value{static_cast<std::uint64_t>(s.active_reservations)}},
                {"available_tools", strings(s.available_tools)}};
}

Value to_value(const Constraint& c) {
  Object o{{"name", c.name}, {"kind", to_string(c.kind)}};
  switch (c.kind) {
    case ConstraintKind::resource_limit: o["limits"] = to_value(c.limits); break;
    case ConstraintKind::time_limit: o["time_limit_ms"] = Value{c.time_limit_ms}; break;
    case ConstraintKind::quality_threshold: o["threshold"] = c.threshold; break;
    case ConstraintKind::custom: o["value"] = c.value; break;
  }
  return o;
}

Value to_value(const Goal& g) {
  Array constraints;
  for (const auto& c : g.constraints) constraints.push_back(to_value(c));
  Object o{{"id", g.id},
           {"description", g.description},
           {"priority", to_string(g.priority)},
           {"constraints", std::move(constraints)},
           {"success_criteria", strings(g.success_criteria)}};
  if (g.deadline_unix_ms) o["deadline_unix_ms"] = Value{*g.deadline_unix_ms};
  return o;
}

Value to_value(const ToolExecutionResult& r) {
  Object o{{"tool_id", r.tool_id},
           {"step_id", r.step_id},
           {"success", r.success},
           {"result", r.result},
           {"execution_time_ms", Value{r.execution_time_ms}},
           {"resources_used", to_value(r.resources_used)}};
  if (r.error) o["error"] = *r.error;
  if (r.cost_usd) o["cost_usd"] = *r.cost_usd;
  return o;
}

Value to_value(const ContextEntry& e) {
  return Object{{"timestamp_ms", Value{e.timestamp_ms}}, {"event", e.event}, {"data", e.data}};
}

Value to_value(const ExecutionResult& r) {
  Object o{{"plan_id", r.plan_id},
           {"sandbox_id", r.sandbox_id},
           {"success", r.success},
           {"output", r.output},
           {"execution_time_ms", Value{r.execution_time_ms}},
           {"steps_completed", Value{static_cast<std::uint64_t>(r.steps_completed)}},
           {"steps_failed", Value{static_cast<std::uint64_t>(r.steps_failed)}}};
  if (r.error) o["error"] = *r.error;
  if (r.cost) o["cost"] = *r.cost;
  return o;
}

Value to_value(const ScoredResult& s) {
  return Object{{"result", to_value(s.result)},
                {"score", s.score},
                {"rank", Value{static_cast<std::uint64_t>(s.rank)}},
                {"reasons", strings(s.reasons)}};
}

Value to_value(const ExecutionContext& c) {
  Array tool_results;
  for (const auto& r : c.tool_results) tool_results.push_back(to_value(r));
  Array history;
  for (const auto& e : c.history) history.push_back(to_value(e));
  Array ranked;
  for (const auto& s : c.ranked_results) ranked.push_back(to_value(s));
  Object state_map(c.state_map.begin(), c.state_map.end());

  Object o{{"goal", to_value(c.goal)},
           {"state", to_string(c.state)},
           {"state_map", std::move(state_map)},
           {"resources", to_value(c.resources)},
           {"tool_results", std::move(tool_results)},
           {"history", std::move(history)},
           {"ranked_results", std::move(ranked)},
           {"submitted_at_ms", Value{c.submitted_at_ms}},
           {"finished_at_ms", Value{c.finished_at_ms}}};
  if (c.error) o["error"] = *c.error;
  return o;
}

Value to_value(const Strategy& s) {
  return Object{{"tool_id", s.tool_id},
                {"success_rate", s.success_rate},
                {"avg_execution_time_ms", s.avg_execution_time_ms},
                {"avg_resource_usage", to_value(s.avg_resource_usage)},
                {"usage_count", Value{s.usage_count}}};
}

Value to_value(const MemoryEntry& m) {
  return Object{{"timestamp_ms", Value{m.timestamp_ms}},
                {"event", m.event},
                {"data", m.data},
                {"importance", m.importance}};
}

Value to_value(const PlanStep& s) {
  return Object{{"id", s.id},
                {"tool_id", s.tool_id},
                {"description", s.description},
                {"parameters", s.parameters},
                {"estimated_resources", to_value(s.estimated_resources)},
                {"dependencies", strings(s.dependencies)}};
}

Value to_value(const Plan& p) {
  Array steps;
  for (const auto& s : p.steps) steps.push_back(to_value(s));
  return Object{{"id", p.id},
                {"goal_id", p.goal_id},
                {"steps", std::move(steps)},
                {"estimated_duration_ms", Value{p.estimated_duration_ms}}};
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

ResourceUsage resource_usage_from_object(const Object& o) {
  ResourceUsage u;
  u.cpu_percent = jsonlite::get_double(o, "cpu_percent", 0.0);
  u.memory_mb = jsonlite::get_double(o, "memory_mb", 0.0);
  u.network_mbps = jsonlite::get_double(o, "network_mbps", 0.0);
  u.storage_mb = jsonlite::get_double(o, "storage_mb", 0.0);
  return u;
}

ResourceLimits resource_limits_from_object(const Object& o, const ResourceLimits& defaults) {
  ResourceLimits l;
  l.max_cpu_percent = jsonlite::get_double(o, "max_cpu_percent", defaults.max_cpu_percent);
  l.max_memory_mb = jsonlite::get_double(o, "max_memory_mb", defaults.max_memory_mb);
  l.max_network_mbps = jsonlite::get_double(o, "max_network_mbps", defaults.max_network_mbps);
  l.max_storage_mb = jsonlite::get_double(o, "max_storage_mb", defaults.max_storage_mb);
  return l;
}

std::optional<Goal> goal_from_object(const Object& o, std::string* error) {
  Goal g;
  g.id = jsonlite::get_string(o, "id");
  g.description = jsonlite::get_string(o, "description");
  if (g.description.empty()) {
    if (error) *error = "invalid_goal: description is required";
    return std::nullopt;
  }
  const std::string priority = jsonlite::get_string(o, "priority", "medium");
  auto p = priority_from_string(priority);
  if (!p) {
    if (error) *error = "invalid_goal: unknown priority \"" + priority + "\"";
    return std::nullopt;
  }
  g.priority = *p;
  if (o.contains("deadline_unix_ms")) g.deadline_unix_ms = jsonlite::get_u64(o, "deadline_unix_ms");
  g.success_criteria = jsonlite::get_string_array(o, "success_criteria");

  const Array constraints = jsonlite::get_array(o, "constraints");
  for (std::size_t i = 0; i < constraints.size(); ++i) {
    if (!constraints[i].is_object()) {
      if (error) *error = "invalid_goal: constraints[" + std::to_string(i) + "] is not an object";
      return std::nullopt;
    }
    const auto& co = std::get<Object>(constraints[i].v);
    Constraint c;
    c.name = jsonlite::get_string(co, "name");
    const std::string kind = jsonlite::get_string(co, "kind", "custom");
    auto k = constraint_kind_from_string(kind);
    if (!k) {
      if (error) *error = "invalid_goal: unknown constraint kind \"" + kind + "\"";
      return std::nullopt;
    }
    c.kind = *k;
    c.limits = resource_limits_from_object(jsonlite::get_object(co, "limits"), ResourceLimits{});
    c.time_limit_ms = jsonlite::get_u64(co, "time_limit_ms");
    c.threshold = jsonlite::get_double(co, "threshold");
    c.value = jsonlite::get_string(co, "value");
    g.constraints.push_back(std::move(c));
  }
  return g;
}

std::optional<Plan> plan_from_object(const Object& o, std::string* error) {
  Plan p;
  p.id = jsonlite::get_string(o, "id");
  p.goal_id = jsonlite::get_string(o, "goal_id");
  p.estimated_duration_ms = jsonlite::get_u64(o, "estimated_duration_ms");
  const Array steps = jsonlite::get_array(o, "steps");
  for (std::size_t i = 0; i < steps.size(); ++i) {
    if (!steps[i].is_object()) {
      if (error) *error = "steps[" + std::to_string(i) + "] is not an object";
      return std::nullopt;
    }
    const auto& so = std::get<Object>(steps[i].v);
    PlanStep s;
    s.id = jsonlite::get_string(so, "id");
    s.tool_id = jsonlite::get_string(so, "tool_id");
    if (s.tool_id.empty()) {
      if (error) *error = "steps[" + std::to_string(i) + "]: tool_id is required";
      return std::nullopt;
    }
    s.description = jsonlite::get_string(so, "description");
    s.parameters = jsonlite::get_object(so, "parameters");
    s.estimated_resources = resource_usage_from_object(jsonlite::get_object(so, "estimated_resources"));
    s.dependencies = jsonlite::get_string_array(so, "dependencies");
    p.steps.push_back(std::move(s));
  }
  return p;
}

std::optional<ExecutionResult> execution_result_from_object(const Object& o, std::string* error) {
  ExecutionResult r;
  r.plan_id = jsonlite::get_string(o, "plan_id");
  if (r.plan_id.empty()) {
    if (error) *error = "plan_id is required";
    return std::nullopt;
  }
  r.sandbox_id = jsonlite::get_string(o, "sandbox_id");
  r.success = jsonlite::get_bool(o, "success");
  r.output = field(o, "output");
  r.execution_time_ms = jsonlite::get_u64(o, "execution_time_ms");
  r.steps_completed = static_cast<std::size_t>(jsonlite::get_u64(o, "steps_completed"));
  r.steps_failed = static_cast<std::size_t>(jsonlite::get_u64(o, "steps_failed"));
  if (o.contains("error")) r.error = jsonlite::get_string(o, "error");
  r.cost = jsonlite::get_optional_double(o, "cost");
  return r;
}

std::optional<Goal> parse_goal_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> jerr;
  auto obj = jsonlite::parse(text, &jerr);
  if (jerr) {
    if (error) *error = jerr->code + ": " + jerr->message;
    return std::nullopt;
  }
  return goal_from_object(obj, error);
}

std::optional<std::vector<Plan>> parse_plans_json(const std::string& text, std::string* error) {
  return parse_list<Plan>(text, "plans", plan_from_object, error);
}

std::optional<std::vector<ExecutionResult>> parse_execution_results_json(const std::string& text,
                                                                         std::string* error) {
  return parse_list<ExecutionResult>(text, "results", execution_result_from_object, error);
}

}  // namespace sortie
