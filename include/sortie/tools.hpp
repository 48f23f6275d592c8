#pragma once

// sortie/tools.hpp: Tool registry seam.
//
// A tool is an opaque, possibly slow, possibly failing black box: OS
// automation, shell execution, document or browser operations, model calls.
// The engine only sees ToolExecutionResult.
//
// INVARIANT: IToolRegistry::execute() may be called concurrently from every
// candidate worker. It must not throw; FunctionToolRegistry converts handler
// exceptions into a failed result.

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sortie/types.hpp"

namespace sortie {

struct ToolContext {
  std::string goal_id;
  std::string plan_id;
  std::string sandbox_id;
  std::string working_dir;
};

class IToolRegistry {
 public:
  virtual ~IToolRegistry() = default;
  virtual ToolExecutionResult execute(const PlanStep& step, const ToolContext& ctx) = 0;
  virtual bool has_tool(const std::string& tool_id) const = 0;
  virtual std::vector<std::string> list_tools() const = 0;
};

class FunctionToolRegistry : public IToolRegistry {
 public:
  // Handlers fill in success/result/error/resources_used/cost_usd. tool_id,
  // step_id and execution_time_ms are set by the registry.
  using Handler = std::function<ToolExecutionResult(const PlanStep&, const ToolContext&)>;

  void register_tool(const std::string& tool_id, Handler handler);

  ToolExecutionResult execute(const PlanStep& step, const ToolContext& ctx) override;
  bool has_tool(const std::string& tool_id) const override;
  std::vector<std::string> list_tools() const override;

 private:
  mutable std::mutex mu_;
  std::map<std::string, Handler> handlers_;
};

// Runs `command` with the string array parameters.argv inside the sandbox
// working directory. Success is exit code 0; the result payload is
// {"exit_code", "stdout", "stderr"}. An empty `command` takes the
// executable from parameters.command.
FunctionToolRegistry::Handler make_process_tool(std::string command = {},
                                                std::uint64_t timeout_ms = 30000);

}  // namespace sortie
