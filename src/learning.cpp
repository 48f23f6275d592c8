#include "sortie/learning.hpp"

#include <exception>

#include "sortie/log.hpp"

namespace sortie {

LearningSystem::LearningSystem(LearningConfig config) : config_(config) {}

Strategy LearningSystem::to_strategy(const std::string& tool_id, const ToolCounters& c) {
  Strategy s;
  s.tool_id = tool_id;
  s.usage_count = c.count;
  if (c.count > 0) {
    s.success_rate = static_cast<double>(c.successes) / static_cast<double>(c.count);
    s.avg_execution_time_ms = static_cast<double>(c.time_sum_ms) / static_cast<double>(c.count);
  }
  s.avg_resource_usage = c.last_usage;
  return s;
}

void LearningSystem::record_experience(const std::string& step_description,
                                       const std::string& tool_id, bool success,
                                       std::uint64_t execution_time_ms,
                                       const ResourceUsage& resources_used) {
  if (!config_.enable_learning) return;
  try {
    Experience exp{step_description, tool_id, success, execution_time_ms, resources_used,
                   now_unix_ms()};
    {
      std::lock_guard<std::mutex> lock(experiences_mu_);
      experiences_.push_back(std::move(exp));
      while (experiences_.size() > config_.max_experiences) experiences_.pop_front();
    }
    std::lock_guard<std::mutex> lock(strategies_mu_);
    auto& c = counters_[tool_id];
    ++c.count;
    if (success) ++c.successes;
    c.time_sum_ms += execution_time_ms;
    c.last_usage = resources_used;
  } catch (const std::exception& e) {
    log_warn("learning", "dropped experience for tool " + tool_id + ": " + e.what());
  }
}

std::optional<Strategy> LearningSystem::get_best_strategy(const std::string& tool_id) const {
  std::lock_guard<std::mutex> lock(strategies_mu_);
  auto it = counters_.find(tool_id);
  if (it == counters_.end()) return std::nullopt;
  return to_strategy(it->first, it->second);
}

std::vector<Strategy> LearningSystem::get_all_strategies() const {
  std::lock_guard<std::mutex> lock(strategies_mu_);
  std::vector<Strategy> out;
  out.reserve(counters_.size());
  for (const auto& [tool_id, c] : counters_) out.push_back(to_strategy(tool_id, c));
  return out;
}

void LearningSystem::update() {
  try {
    {
      std::lock_guard<std::mutex> lock(experiences_mu_);
      while (experiences_.size() > config_.max_experiences) experiences_.pop_front();
    }
    if (!config_.enable_self_improvement) return;

    OptimizerHook hook;
    {
      std::lock_guard<std::mutex> lock(hook_mu_);
      hook = optimizer_hook_;
    }
    if (hook) hook(experiences_snapshot(), get_all_strategies());
  } catch (const std::exception& e) {
    log_warn("learning", std::string("update failed: ") + e.what());
  }
}

void LearningSystem::set_optimizer_hook(OptimizerHook hook) {
  std::lock_guard<std::mutex> lock(hook_mu_);
  optimizer_hook_ = std::move(hook);
}

std::size_t LearningSystem::experience_count() const {
  std::lock_guard<std::mutex> lock(experiences_mu_);
  return experiences_.size();
}

std::vector<Experience> LearningSystem::experiences_snapshot() const {
  std::lock_guard<std::mutex> lock(experiences_mu_);
  return {experiences_.begin(), experiences_.end()};
}

}  // namespace sortie
