#pragma once

// sortie/learning.hpp: Per-tool experience log and derived strategies.
//
// DESIGN:
//   record_experience() appends to a bounded log and updates running
//   counters (count, successes, time sum) for that tool in O(1). The
//   Strategy for a tool is derived from those counters:
//     success_rate          = successes / count
//     avg_execution_time_ms = time_sum / count
//     avg_resource_usage    = usage of the most recent experience (not a mean)
//   Counters cover every experience ever recorded for the tool; truncating
//   the raw log does not rewind them.
//
// CONCURRENCY:
//   The experience log and the strategy map each have their own mutex and
//   are never held together.
//
// FAILURE SEMANTICS: no method throws. Internal errors are logged and the
// observation is dropped.
//
// EXTENSION_POINT: strategy_optimizer
//   update() calls the optimizer hook when self-improvement is enabled. The
//   default hook does nothing; pattern mining, resource-usage tuning and tool
//   selection adaptation plug in here.

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sortie/types.hpp"

namespace sortie {

struct LearningConfig {
  bool enable_learning{true};
  bool enable_self_improvement{true};
  std::size_t max_experiences{10000};
};

class LearningSystem {
 public:
  // Receives the retained experience log and the current strategies.
  using OptimizerHook =
      std::function<void(const std::vector<Experience>&, const std::vector<Strategy>&)>;

  explicit LearningSystem(LearningConfig config = {});

  void record_experience(const std::string& step_description, const std::string& tool_id,
                         bool success, std::uint64_t execution_time_ms,
                         const ResourceUsage& resources_used);

  std::optional<Strategy> get_best_strategy(const std::string& tool_id) const;
  std::vector<Strategy> get_all_strategies() const;

  // Truncates the log to max_experiences and runs the optimizer hook.
  void update();

  void set_optimizer_hook(OptimizerHook hook);

  std::size_t experience_count() const;
  std::vector<Experience> experiences_snapshot() const;
  const LearningConfig& config() const { return config_; }

 private:
  struct ToolCounters {
    std::uint64_t count{0};
    std::uint64_t successes{0};
    std::uint64_t time_sum_ms{0};
    ResourceUsage last_usage;
  };

  static Strategy to_strategy(const std::string& tool_id, const ToolCounters& c);

  const LearningConfig config_;

  mutable std::mutex experiences_mu_;
  std::deque<Experience> experiences_;

  mutable std::mutex strategies_mu_;
  std::map<std::string, ToolCounters> counters_;

  std::mutex hook_mu_;
  OptimizerHook optimizer_hook_;
};

}  // namespace sortie
