#pragma once

// sortie/config.hpp: Engine configuration.
//
// Sources, lowest precedence first: built-in defaults, a JSON document
// (from_json), SORTIE_* environment variables (apply_env). Values are
// checked by validate(); the engine refuses to start on errors.
//
// Recognised environment variables:
//   SORTIE_MAX_CPU_PERCENT, SORTIE_MAX_MEMORY_MB, SORTIE_MAX_NETWORK_MBPS,
//   SORTIE_MAX_STORAGE_MB, SORTIE_ENABLE_LEARNING, SORTIE_ENABLE_SELF_IMPROVEMENT,
//   SORTIE_MEMORY_MAX_ENTRIES, SORTIE_WORKER_THREADS, SORTIE_MAX_CONCURRENT_GOALS,
//   SORTIE_ISOLATED_BRANCH, SORTIE_SANDBOX_ROOT

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sortie/types.hpp"

namespace sortie {

struct ConfigValidationResult {
  bool ok{false};
  std::string config_version;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

struct EngineConfig {
  ResourceLimits resource_limits;
  bool enable_learning{true};
  bool enable_self_improvement{true};
  std::size_t max_experiences{10000};
  std::size_t memory_max_entries{1000};
  std::size_t worker_threads{4};
  std::size_t max_concurrent_goals{2};
  std::uint64_t learning_update_interval_ms{1000};

  bool use_isolated_branch{false};
  std::string sandbox_root;  // empty = <temp dir>/sortie-sandboxes
  std::string repo_dir;      // empty = current working directory
  bool retain_winning_sandbox{true};

  bool abort_candidate_on_step_failure{false};
  std::uint32_t reservation_retries{3};
  std::uint64_t reservation_backoff_ms{20};

  static EngineConfig defaults() { return EngineConfig{}; }
  static EngineConfig from_env();
  // Unknown keys are ignored. Returns nullopt on malformed JSON.
  static std::optional<EngineConfig> from_json(const std::string& text, std::string* error);

  void apply_env();
  ConfigValidationResult validate() const;
  std::string to_json() const;
};

}  // namespace sortie
