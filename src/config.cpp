#include "sortie/config.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>

#include "sortie/jsonlite.hpp"
#include "sortie/log.hpp"
#include "sortie/serialize.hpp"
#include "sortie/version.hpp"

namespace sortie {

namespace {

const char* env(const char* name) {
  const char* v = std::getenv(name);
  return v && v[0] ? v : nullptr;
}

void env_double(const char* name, double& out) {
  const char* v = env(name);
  if (!v) return;
  char* end = nullptr;
  const double d = std::strtod(v, &end);
  if (end == v || *end != '\0') {
    log_warn("config", std::string("ignoring malformed ") + name + "=" + v);
    return;
  }
  out = d;
}

template <typename T>
void env_unsigned(const char* name, T& out) {
  const char* v = env(name);
  if (!v) return;
  char* end = nullptr;
  const unsigned long long u = std::strtoull(v, &end, 10);
  if (end == v || *end != '\0' || v[0] == '-') {
    log_warn("config", std::string("ignoring malformed ") + name + "=" + v);
    return;
  }
  out = static_cast<T>(u);
}

void env_bool(const char* name, bool& out) {
  const char* v = env(name);
  if (!v) return;
  if (std::strcmp(v, "1") == 0 || std::strcmp(v, "true") == 0 || std::strcmp(v, "yes") == 0) {
    out = true;
  } else if (std::strcmp(v, "0") == 0 || std::strcmp(v, "false") == 0 || std::strcmp(v, "no") == 0) {
    out = false;
  } else {
    log_warn("config", std::string("ignoring malformed ") + name + "=" + v);
  }
}

}  // namespace

EngineConfig EngineConfig::from_env() {
  EngineConfig cfg;
  cfg.apply_env();
  return cfg;
}

void EngineConfig::apply_env() {
  env_double("SORTIE_MAX_CPU_PERCENT", resource_limits.max_cpu_percent);
  env_double("SORTIE_MAX_MEMORY_MB", resource_limits.max_memory_mb);
  env_double("SORTIE_MAX_NETWORK_MBPS", resource_limits.max_network_mbps);
  env_double("SORTIE_MAX_STORAGE_MB", resource_limits.max_storage_mb);
  env_bool("SORTIE_ENABLE_LEARNING", enable_learning);
  env_bool("SORTIE_ENABLE_SELF_IMPROVEMENT", enable_self_improvement);
  env_unsigned("SORTIE_MEMORY_MAX_ENTRIES", memory_max_entries);
  env_unsigned("SORTIE_WORKER_THREADS", worker_threads);
  env_unsigned("SORTIE_MAX_CONCURRENT_GOALS", max_concurrent_goals);
  env_bool("SORTIE_ISOLATED_BRANCH", use_isolated_branch);
  if (const char* v = env("SORTIE_SANDBOX_ROOT")) sandbox_root = v;
}

std::optional<EngineConfig> EngineConfig::from_json(const std::string& text, std::string* error) {
  std::optional<jsonlite::JsonError> jerr;
  auto o = jsonlite::parse(text, &jerr);
  if (jerr) {
    if (error) *error = jerr->code + ": " + jerr->message;
    return std::nullopt;
  }

  EngineConfig cfg;
  cfg.resource_limits =
      resource_limits_from_object(jsonlite::get_object(o, "resource_limits"), cfg.resource_limits);
  cfg.enable_learning = jsonlite::get_bool(o, "enable_learning", cfg.enable_learning);
  cfg.enable_self_improvement =
      jsonlite::get_bool(o, "enable_self_improvement", cfg.enable_self_improvement);
  cfg.max_experiences = jsonlite::get_u64(o, "max_experiences", cfg.max_experiences);
  cfg.memory_max_entries = jsonlite::get_u64(o, "memory_max_entries", cfg.memory_max_entries);
  cfg.worker_threads = jsonlite::get_u64(o, "worker_threads", cfg.worker_threads);
  cfg.max_concurrent_goals = jsonlite::get_u64(o, "max_concurrent_goals", cfg.max_concurrent_goals);
  cfg.learning_update_interval_ms =
      jsonlite::get_u64(o, "learning_update_interval_ms", cfg.learning_update_interval_ms);
  cfg.use_isolated_branch = jsonlite::get_bool(o, "use_isolated_branch", cfg.use_isolated_branch);
  cfg.sandbox_root = jsonlite::get_string(o, "sandbox_root", cfg.sandbox_root);
  cfg.repo_dir = jsonlite::get_string(o, "repo_dir", cfg.repo_dir);
  cfg.retain_winning_sandbox =
      jsonlite::get_bool(o, "retain_winning_sandbox", cfg.retain_winning_sandbox);
  cfg.abort_candidate_on_step_failure =
      jsonlite::get_bool(o, "abort_candidate_on_step_failure", cfg.abort_candidate_on_step_failure);
  cfg.reservation_retries = static_cast<std::uint32_t>(
      jsonlite::get_u64(o, "reservation_retries", cfg.reservation_retries));
  cfg.reservation_backoff_ms =
      jsonlite::get_u64(o, "reservation_backoff_ms", cfg.reservation_backoff_ms);
  return cfg;
}

ConfigValidationResult EngineConfig::validate() const {
  ConfigValidationResult r;
  r.config_version = std::to_string(version::CONFIG_VERSION);

  auto check_limit = [&](const char* name, double v) {
    if (!std::isfinite(v) || v < 0.0) {
      r.errors.push_back(std::string("resource_limits.") + name + " must be a finite value >= 0");
    } else if (v == 0.0) {
      r.warnings.push_back(std::string("resource_limits.") + name +
                           " is 0; only steps estimating no usage can run");
    }
  };
  check_limit("max_cpu_percent", resource_limits.max_cpu_percent);
  check_limit("max_memory_mb", resource_limits.max_memory_mb);
  check_limit("max_network_mbps", resource_limits.max_network_mbps);
  check_limit("max_storage_mb", resource_limits.max_storage_mb);

  if (worker_threads == 0) r.errors.push_back("worker_threads must be >= 1");
  if (max_concurrent_goals == 0) r.errors.push_back("max_concurrent_goals must be >= 1");
  if (memory_max_entries == 0) r.errors.push_back("memory_max_entries must be >= 1");
  if (max_experiences == 0) r.errors.push_back("max_experiences must be >= 1");
  if (learning_update_interval_ms == 0) r.errors.push_back("learning_update_interval_ms must be >= 1");
  if (!enable_learning && enable_self_improvement) {
    r.warnings.push_back("enable_self_improvement has no effect while enable_learning is false");
  }
  if (worker_threads > 256) r.warnings.push_back("worker_threads above 256");

  r.ok = r.errors.empty();
  return r;
}

std::string EngineConfig::to_json() const {
  jsonlite::Object o{
      {"config_version", jsonlite::Value{static_cast<std::uint64_t>(version::CONFIG_VERSION)}},
      {"resource_limits", to_value(resource_limits)},
      {"enable_learning", enable_learning},
      {"enable_self_improvement", enable_self_improvement},
      {"max_experiences", jsonlite::Value{static_cast<std::uint64_t>(max_experiences)}},
      {"memory_max_entries", jsonlite::Value{static_cast<std::uint64_t>(memory_max_entries)}},
      {"worker_threads", jsonlite::Value{static_cast<std::uint64_t>(worker_threads)}},
      {"max_concurrent_goals", jsonlite::Value{static_cast<std::uint64_t>(max_concurrent_goals)}},
      {"learning_update_interval_ms", jsonlite::Value{learning_update_interval_ms}},
      {"use_isolated_branch", use_isolated_branch},
      {"sandbox_root", sandbox_root},
      {"repo_dir", repo_dir},
      {"retain_winning_sandbox", retain_winning_sandbox},
      {"abort_candidate_on_step_failure", abort_candidate_on_step_failure},
      {"reservation_retries", jsonlite::Value{static_cast<std::uint64_t>(reservation_retries)}},
      {"reservation_backoff_ms", jsonlite::Value{reservation_backoff_ms}},
  };
  return jsonlite::to_json(jsonlite::Value{std::move(o)});
}

}  // namespace sortie
