#include "sortie/tools.hpp"

#include <chrono>
#include <exception>

#include "sortie/process.hpp"

namespace sortie {

void FunctionToolRegistry::register_tool(const std::string& tool_id, Handler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  handlers_[tool_id] = std::move(handler);
}

bool FunctionToolRegistry::has_tool(const std::string& tool_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return handlers_.contains(tool_id);
}

std::vector<std::string> FunctionToolRegistry::list_tools() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(handlers_.size());
  for (const auto& [id, h] : handlers_) out.push_back(id);
  return out;
}

ToolExecutionResult FunctionToolRegistry::execute(const PlanStep& step, const ToolContext& ctx) {
  Handler handler;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = handlers_.find(step.tool_id);
    if (it != handlers_.end()) handler = it->second;
  }

  ToolExecutionResult result;
  const auto start = std::chrono::steady_clock::now();
  if (!handler) {
    result.success = false;
    result.error = to_string(ErrorCode::unknown_tool) + ": " + step.tool_id;
  } else {
    try {
      result = handler(step, ctx);
    } catch (const std::exception& e) {
      result = ToolExecutionResult{};
      result.success = false;
      result.error = to_string(ErrorCode::tool_failed) + ": " + e.what();
    }
  }
  result.tool_id = step.tool_id;
  result.step_id = step.id;
  result.execution_time_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
          .count());
  return result;
}

FunctionToolRegistry::Handler make_process_tool(std::string command, std::uint64_t timeout_ms) {
  return [command = std::move(command), timeout_ms](const PlanStep& step, const ToolContext& ctx) {
    ToolExecutionResult r;
    ProcessSpec spec;
    spec.command = command.empty() ? jsonlite::get_string(step.parameters, "command") : command;
    spec.argv = jsonlite::get_string_array(step.parameters, "argv");
    spec.cwd = ctx.working_dir;
    spec.timeout_ms = jsonlite::get_u64(step.parameters, "timeout_ms", timeout_ms);
    spec.env["SORTIE_GOAL_ID"] = ctx.goal_id;
    spec.env["SORTIE_PLAN_ID"] = ctx.plan_id;
    spec.env["SORTIE_SANDBOX_ID"] = ctx.sandbox_id;
    if (spec.command.empty()) {
      r.error = "parameters.command is required";
      return r;
    }

    ProcessResult pr = run_process(spec);
    r.success = pr.ok();
    r.result = jsonlite::Object{{"exit_code", pr.exit_code},
                                {"stdout", pr.stdout_text},
                                {"stderr", pr.stderr_text}};
    if (!pr.error_message.empty()) {
      r.error = pr.error_message;
    } else if (pr.timed_out) {
      r.error = to_string(ErrorCode::timeout);
    } else if (pr.exit_code != 0) {
      r.error = "exit code " + std::to_string(pr.exit_code);
    }
    return r;
  };
}

}  // namespace sortie
