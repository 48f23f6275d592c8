#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "sortie/comparator.hpp"
#include "sortie/config.hpp"
#include "sortie/engine.hpp"
#include "sortie/hash.hpp"
#include "sortie/jsonlite.hpp"
#include "sortie/log.hpp"
#include "sortie/planner.hpp"
#include "sortie/process.hpp"
#include "sortie/serialize.hpp"
#include "sortie/tools.hpp"
#include "sortie/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  out->assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return true;
}

void print_error(const std::string& message) {
  std::cerr << "{\"error\":\"" << sortie::jsonlite::escape(message) << "\"}\n";
}

int usage() {
  std::cerr << "usage:\n"
               "  sortie run --goal <goal.json> --plans <plans.json> [--config <cfg.json>] [--timeout-ms N]\n"
               "  sortie rank --results <results.json>\n"
               "  sortie config --check <cfg.json>\n"
               "  sortie doctor\n"
               "  sortie version\n";
  return kExitUsage;
}

std::string flag_value(int argc, char** argv, const std::string& flag) {
  for (int i = 2; i < argc; ++i) {
    if (std::string(argv[i]) == flag && i + 1 < argc) return argv[i + 1];
  }
  return {};
}

std::shared_ptr<sortie::FunctionToolRegistry> builtin_tools() {
  auto registry = std::make_shared<sortie::FunctionToolRegistry>();
  registry->register_tool("exec", sortie::make_process_tool());
  registry->register_tool("echo", [](const sortie::PlanStep& step, const sortie::ToolContext&) {
    sortie::ToolExecutionResult r;
    r.success = true;
    r.result = sortie::jsonlite::get_string(step.parameters, "message", step.description);
    return r;
  });
  return registry;
}

int cmd_run(int argc, char** argv) {
  const std::string goal_path = flag_value(argc, argv, "--goal");
  const std::string plans_path = flag_value(argc, argv, "--plans");
  const std::string config_path = flag_value(argc, argv, "--config");
  const std::string timeout = flag_value(argc, argv, "--timeout-ms");
  if (goal_path.empty() || plans_path.empty()) return usage();

  std::string text;
  std::string err;
  sortie::EngineConfig cfg;
  if (!config_path.empty()) {
    if (!read_file(config_path, &text)) {
      print_error("cannot read " + config_path);
      return kExitFailed;
    }
    auto parsed = sortie::EngineConfig::from_json(text, &err);
    if (!parsed) {
      print_error("config: " + err);
      return kExitFailed;
    }
    cfg = *parsed;
  }
  cfg.apply_env();

  if (!read_file(goal_path, &text)) {
    print_error("cannot read " + goal_path);
    return kExitFailed;
  }
  auto goal = sortie::parse_goal_json(text, &err);
  if (!goal) {
    print_error("goal: " + err);
    return kExitFailed;
  }
  if (!read_file(plans_path, &text)) {
    print_error("cannot read " + plans_path);
    return kExitFailed;
  }
  auto plans = sortie::parse_plans_json(text, &err);
  if (!plans) {
    print_error("plans: " + err);
    return kExitFailed;
  }

  sortie::Engine engine(cfg, std::make_shared<sortie::StaticPlanOracle>(std::move(*plans)),
                        builtin_tools());
  if (!engine.start(&err)) {
    print_error(err);
    return kExitFailed;
  }
  auto id = engine.submit_goal(std::move(*goal), &err);
  if (!id) {
    print_error(err);
    return kExitFailed;
  }

  const auto wait_ms = timeout.empty() ? 600000ULL : std::strtoull(timeout.c_str(), nullptr, 10);
  auto state = engine.wait_for_goal(*id, std::chrono::milliseconds(wait_ms));
  if (!state) {
    engine.cancel_goal(*id);
    state = engine.wait_for_goal(*id, std::chrono::milliseconds(wait_ms));
  }
  auto ctx = engine.get_goal_status(*id);
  if (ctx) {
    std::cout << sortie::to_json(*ctx) << "\n";
    if (!ctx->ranked_results.empty()) std::cerr << sortie::format_comparison(ctx->ranked_results);
  }
  // stop() removes every sandbox, the winning workspace included.
  engine.stop();
  return state && *state == sortie::GoalState::completed ? kExitOk : kExitFailed;
}

int cmd_rank(int argc, char** argv) {
  const std::string path = flag_value(argc, argv, "--results");
  if (path.empty()) return usage();
  std::string text;
  if (!read_file(path, &text)) {
    print_error("cannot read " + path);
    return kExitFailed;
  }
  std::string err;
  auto results = sortie::parse_execution_results_json(text, &err);
  if (!results) {
    print_error("results: " + err);
    return kExitFailed;
  }
  const auto ranked = sortie::compare_and_rank(std::move(*results));
  std::cerr << sortie::format_comparison(ranked);
  sortie::jsonlite::Array arr;
  for (const auto& s : ranked) arr.push_back(sortie::to_value(s));
  sortie::jsonlite::Object out{{"ranked", std::move(arr)},
                               {"ranking_digest", sortie::ranking_digest(ranked)},
                               {"scoring_version",
                                sortie::jsonlite::Value{static_cast<std::uint64_t>(sortie::version::SCORING_VERSION)}}};
  std::cout << sortie::jsonlite::to_json(sortie::jsonlite::Value{std::move(out)}) << "\n";
  return kExitOk;
}

int cmd_config(int argc, char** argv) {
  const std::string path = flag_value(argc, argv, "--check");
  sortie::EngineConfig cfg;
  if (!path.empty()) {
    std::string text;
    std::string err;
    if (!read_file(path, &text)) {
      print_error("cannot read " + path);
      return kExitFailed;
    }
    auto parsed = sortie::EngineConfig::from_json(text, &err);
    if (!parsed) {
      print_error("config: " + err);
      return kExitFailed;
    }
    cfg = *parsed;
  }
  cfg.apply_env();
  const auto r = cfg.validate();
  sortie::jsonlite::Array errors;
  for (const auto& e : r.errors) errors.emplace_back(e);
  sortie::jsonlite::Array warnings;
  for (const auto& w : r.warnings) warnings.emplace_back(w);
  sortie::jsonlite::Object out{{"ok", r.ok},
                               {"config_version", r.config_version},
                               {"errors", std::move(errors)},
                               {"warnings", std::move(warnings)}};
  std::cout << sortie::jsonlite::to_json(sortie::jsonlite::Value{std::move(out)}) << "\n";
  std::cout << cfg.to_json() << "\n";
  return r.ok ? kExitOk : kExitFailed;
}

int cmd_doctor() {
  namespace fs = std::filesystem;
  bool ok = true;
  // BLAKE3 known-answer check on "hello".
  const bool hash_ok = sortie::blake3_hex("hello") ==
                       "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f";
  ok = ok && hash_ok;

  const auto git = sortie::find_executable("git");

  sortie::SandboxManager sandboxes(sortie::SandboxConfig{sortie::EngineConfig::from_env().sandbox_root, {}});
  std::string err;
  bool sandbox_ok = false;
  if (auto sb = sandboxes.create_sandbox(false, &err)) {
    sandbox_ok = fs::is_directory(sb->workspace_path) && sandboxes.cleanup_sandbox(*sb, &err);
  }
  ok = ok && sandbox_ok;

  sortie::jsonlite::Object out{{"ok", ok},
                               {"blake3", hash_ok},
                               {"blake3_version", sortie::blake3_library_version()},
                               {"git", git ? *git : std::string()},
                               {"sandbox_root", sandboxes.root()},
                               {"sandbox_roundtrip", sandbox_ok}};
  if (!err.empty()) out["sandbox_error"] = err;
  std::cout << sortie::jsonlite::to_json(sortie::jsonlite::Value{std::move(out)}) << "\n";
  return ok ? kExitOk : kExitFailed;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) return usage();
  const std::string cmd = argv[1];

  if (cmd == "run") return cmd_run(argc, argv);
  if (cmd == "rank") return cmd_rank(argc, argv);
  if (cmd == "config") return cmd_config(argc, argv);
  if (cmd == "doctor") return cmd_doctor();
  if (cmd == "version") {
    std::cout << sortie::version::manifest_to_json(sortie::version::current_manifest()) << "\n";
    return kExitOk;
  }
  return usage();
}
