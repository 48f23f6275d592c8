#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "sortie/channel.hpp"
#include "sortie/comparator.hpp"
#include "sortie/config.hpp"
#include "sortie/engine.hpp"
#include "sortie/hash.hpp"
#include "sortie/jsonlite.hpp"
#include "sortie/learning.hpp"
#include "sortie/log.hpp"
#include "sortie/memory.hpp"
#include "sortie/observability.hpp"
#include "sortie/planner.hpp"
#include "sortie/process.hpp"
#include "sortie/resources.hpp"
#include "sortie/sandbox.hpp"
#include "sortie/serialize.hpp"
#include "sortie/tools.hpp"
#include "sortie/version.hpp"
#include "sortie/worker_pool.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

// Log capture. The default sink stays quiet during the suite.
std::mutex g_log_mu;
std::vector<sortie::LogRecord> g_logs;

void capture_log(const sortie::LogRecord& rec) {
  std::lock_guard<std::mutex> lock(g_log_mu);
  g_logs.push_back(rec);
}

std::size_t count_logs(sortie::LogLevel level, const std::string& component) {
  std::lock_guard<std::mutex> lock(g_log_mu);
  std::size_t n = 0;
  for (const auto& r : g_logs) {
    if (r.level == level && r.component == component) ++n;
  }
  return n;
}

void clear_logs() {
  std::lock_guard<std::mutex> lock(g_log_mu);
  g_logs.clear();
}

fs::path scratch_dir(const std::string& tag) {
  fs::path p = fs::temp_directory_path() / sortie::make_id("sortie-test-" + tag);
  fs::create_directories(p);
  return p;
}

sortie::ExecutionResult make_result(const std::string& plan_id, bool success, std::size_t completed,
                                    std::size_t failed, std::uint64_t time_ms,
                                    std::optional<double> cost) {
  sortie::ExecutionResult r;
  r.plan_id = plan_id;
  r.sandbox_id = "sbx-" + plan_id;
  r.success = success;
  r.steps_completed = completed;
  r.steps_failed = failed;
  r.execution_time_ms = time_ms;
  r.cost = cost;
  return r;
}

// ============================================================================
// Hashing and JSON
// ============================================================================

void test_blake3_known_vectors() {
  expect(sortie::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(sortie::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  expect(sortie::hash_domain("rank:", "x") != sortie::hash_domain("id:", "x"),
         "domains must produce distinct digests");
  expect(sortie::hash_domain("rank:", "x") == sortie::hash_domain("rank:", "x"), "domain hash stable");
}

void test_make_id_unique() {
  const std::string a = sortie::make_id("goal", "same seed");
  const std::string b = sortie::make_id("goal", "same seed");
  expect(a != b, "make_id must not repeat for identical seeds");
  expect(a.rfind("goal-", 0) == 0, "make_id keeps prefix");
  expect(a.size() == std::string("goal-").size() + 16, "make_id suffix is 16 hex chars");
}

void test_json_roundtrip_canonical() {
  std::optional<sortie::jsonlite::JsonError> err;
  auto o = sortie::jsonlite::parse(R"({"b":1,"a":"xA","c":[true,null,2.5]})", &err);
  expect(!err, "valid JSON parses");
  expect(sortie::jsonlite::to_json(sortie::jsonlite::Value{o}) == R"({"a":"xA","b":1,"c":[true,null,2.5]})",
         "keys are emitted in sorted order");
}

void test_json_rejects_malformed() {
  std::optional<sortie::jsonlite::JsonError> err;
  sortie::jsonlite::parse(R"({"a":1,"a":2})", &err);
  expect(err.has_value(), "duplicate keys rejected");
  err.reset();
  sortie::jsonlite::parse(R"({"a":NaN})", &err);
  expect(err.has_value(), "NaN rejected");
  err.reset();
  std::string deep(200, '[');
  deep += std::string(200, ']');
  sortie::jsonlite::parse_value(deep, &err);
  expect(err.has_value(), "nesting depth is capped");
}

void test_json_non_finite_written_as_null() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  expect(sortie::jsonlite::to_json(sortie::jsonlite::Value{nan}) == "null", "NaN serializes as null");
}

void test_log_level_and_hook() {
  const sortie::LogLevel saved = sortie::log_level();
  sortie::set_log_level(sortie::LogLevel::warn);
  expect(sortie::log_level() == sortie::LogLevel::warn, "level set");
  clear_logs();
  sortie::log_info("unit", "below threshold");
  sortie::log_warn("unit", "delivered");
  sortie::set_log_level(saved);

  std::lock_guard<std::mutex> lock(g_log_mu);
  expect(g_logs.size() == 1, "info dropped below the warn threshold");
  expect(g_logs[0].level == sortie::LogLevel::warn, "record carries its level");
  expect(g_logs[0].component == "unit" && g_logs[0].message == "delivered", "record reaches the hook intact");
  expect(g_logs[0].timestamp_ms > 0, "record is timestamped");
}

// ============================================================================
// Comparator
// ============================================================================

void test_score_reference_success() {
  auto s = sortie::score_result(make_result("p", true, 8, 2, 10000, 0.005));
  expect(near(s.score, 94.0), "success/8 of 10/10s/$0.005 scores 94, got " + std::to_string(s.score));
  expect(s.reasons.front() == "Task completed successfully", "first reason names success");
}

void test_score_reference_failure() {
  auto s = sortie::score_result(make_result("p", false, 0, 0, 90000, std::nullopt));
  expect(near(s.score, 10.0), "failed/no steps/90s/no cost scores 10");
  expect(s.reasons.size() == 1 && s.reasons[0] == "Task failed", "only the base reason applies");
}

void test_score_moderate_tiers() {
  auto s = sortie::score_result(make_result("p", true, 1, 0, 45000, 0.02));
  expect(near(s.score, 50.0 + 30.0 + 5.0 + 5.0), "moderate time and cost tiers");
}

void test_rank_order_and_ranks() {
  std::vector<sortie::ExecutionResult> in{
      make_result("slow", true, 1, 0, 50000, std::nullopt),
      make_result("best", true, 4, 0, 100, 0.001),
      make_result("bad", false, 0, 3, 100, std::nullopt),
  };
  auto ranked = sortie::compare_and_rank(in);
  expect(ranked.size() == 3, "ranking keeps every result");
  for (std::size_t i = 0; i < ranked.size(); ++i) {
    expect(ranked[i].rank == i + 1, "ranks are 1..N");
    if (i > 0) expect(ranked[i - 1].score >= ranked[i].score, "scores non-increasing by rank");
  }
  expect(ranked[0].result.plan_id == "best", "highest score first");
  expect(ranked[2].result.plan_id == "bad", "lowest score last");
}

void test_rank_ties_are_deterministic() {
  std::vector<sortie::ExecutionResult> a{make_result("b", true, 1, 0, 10, std::nullopt),
                                         make_result("a", true, 1, 0, 10, std::nullopt)};
  std::vector<sortie::ExecutionResult> b{a[1], a[0]};
  auto ra = sortie::compare_and_rank(a);
  auto rb = sortie::compare_and_rank(b);
  expect(ra[0].result.plan_id == "a" && rb[0].result.plan_id == "a", "ties break by plan id");
  expect(sortie::ranking_digest(ra) == sortie::ranking_digest(rb), "digest independent of input order");
}

void test_nan_cost_earns_no_bonus() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  auto s = sortie::score_result(make_result("p", true, 1, 0, 10, nan));
  expect(std::isfinite(s.score), "score stays finite");
  expect(near(s.score, 90.0), "NaN cost adds nothing");
  bool noted = false;
  for (const auto& r : s.reasons) noted = noted || r.find("non-finite") != std::string::npos;
  expect(noted, "NaN cost is reported as a reason");
}

void test_best_result_and_empty() {
  expect(!sortie::get_best_result({}).has_value(), "empty input has no best");
  expect(sortie::compare_and_rank({}).empty(), "empty input ranks to empty");
  auto best = sortie::get_best_result({make_result("x", false, 0, 1, 10, std::nullopt),
                                       make_result("y", true, 1, 0, 10, std::nullopt)});
  expect(best && best->result.plan_id == "y" && best->rank == 1, "best is rank 1");
}

void test_format_comparison_mentions_plans() {
  auto ranked = sortie::compare_and_rank({make_result("alpha", true, 1, 0, 10, std::nullopt)});
  const std::string text = sortie::format_comparison(ranked);
  expect(text.find("alpha") != std::string::npos, "report names the plan");
}

// ============================================================================
// Learning, memory, resources
// ============================================================================

void test_learning_success_rate() {
  sortie::LearningSystem ls;
  for (int i = 0; i < 10; ++i) {
    ls.record_experience("step", "browser", i < 8, 100 + i * 10, sortie::ResourceUsage{});
  }
  auto s = ls.get_best_strategy("browser");
  expect(s.has_value(), "strategy exists after recording");
  expect(near(s->success_rate, 0.8), "8 of 10 successes");
  expect(near(s->avg_execution_time_ms, 145.0), "mean execution time");
  expect(s->usage_count == 10, "usage count");
  expect(!ls.get_best_strategy("unknown").has_value(), "unknown tool has no strategy");
}

void test_learning_usage_is_most_recent() {
  sortie::LearningSystem ls;
  sortie::ResourceUsage first{10.0, 100.0, 0.0, 0.0};
  sortie::ResourceUsage second{40.0, 300.0, 0.0, 0.0};
  ls.record_experience("a", "shell", true, 5, first);
  ls.record_experience("b", "shell", true, 5, second);
  auto s = ls.get_best_strategy("shell");
  expect(near(s->avg_resource_usage.cpu_percent, 40.0) && near(s->avg_resource_usage.memory_mb, 300.0),
         "avg_resource_usage tracks the latest observation");
}

void test_learning_disabled() {
  sortie::LearningSystem ls(sortie::LearningConfig{false, false, 100});
  ls.record_experience("a", "shell", true, 5, {});
  expect(ls.experience_count() == 0, "nothing recorded when learning is off");
  expect(ls.get_all_strategies().empty(), "no strategies when learning is off");
}

void test_learning_cap_and_hook() {
  sortie::LearningSystem ls(sortie::LearningConfig{true, true, 5});
  std::size_t seen_experiences = 0;
  std::size_t seen_strategies = 0;
  ls.set_optimizer_hook([&](const std::vector<sortie::Experience>& e, const std::vector<sortie::Strategy>& s) {
    seen_experiences = e.size();
    seen_strategies = s.size();
  });
  for (int i = 0; i < 12; ++i) ls.record_experience("x", i % 2 ? "a" : "b", true, 1, {});
  ls.update();
  expect(ls.experience_count() == 5, "experience log bounded");
  expect(seen_experiences == 5 && seen_strategies == 2, "optimizer hook sees retained log");
  expect(ls.get_best_strategy("a")->usage_count == 6, "counters survive truncation");
}

void test_memory_eviction() {
  sortie::WorkingMemory mem;
  for (int i = 0; i < 1001; ++i) {
    mem.add("event_" + std::to_string(i), sortie::jsonlite::Object{{"i", i}}, 0.5);
  }
  expect(mem.size() == 1000, "memory bounded at 1000");
  expect(mem.get_recent(1000).back().event == "event_1", "oldest entry evicted");
  auto recent = mem.get_recent(3);
  expect(recent.size() == 3 && recent[0].event == "event_1000" && recent[2].event == "event_998",
         "get_recent is most recent first");
}

void test_memory_search() {
  sortie::WorkingMemory mem(10);
  mem.add("step_started", sortie::jsonlite::Object{{"tool_id", "browser"}}, 0.5);
  mem.add("step_completed", sortie::jsonlite::Object{{"tool_id", "shell"}}, 0.5);
  expect(mem.search("browser").size() == 1, "search matches data");
  expect(mem.search("step_").size() == 2, "search matches event name");
  expect(mem.search("Browser").empty(), "search is case-sensitive");
  mem.clear();
  expect(mem.size() == 0, "clear empties memory");
}

void test_resource_reserve_release() {
  sortie::ResourceManager rm(sortie::ResourceLimits{});
  auto t1 = rm.reserve(sortie::ResourceUsage{50.0, 1000.0, 0.0, 0.0});
  expect(t1.has_value(), "first reservation granted");
  std::string err;
  auto t2 = rm.reserve(sortie::ResourceUsage{40.0, 0.0, 0.0, 0.0}, &err);
  expect(!t2.has_value(), "cpu overage rejected");
  expect(err.find("cpu_percent") != std::string::npos, "error names the dimension");
  expect(rm.get_state().active_reservations == 1, "rejection records nothing");
  expect(rm.release(*t1), "release succeeds");
  expect(!rm.release(*t1), "double release refused");
  expect(rm.check_availability(sortie::ResourceUsage{40.0, 0.0, 0.0, 0.0}), "capacity returns after release");
  expect(!rm.can_ever_fit(sortie::ResourceUsage{81.0, 0.0, 0.0, 0.0}), "above limit never fits");
  auto stats = rm.stats();
  expect(stats.granted == 1 && stats.rejected == 1 && stats.released == 1, "stats track outcomes");
}

void test_resource_rejects_invalid_usage() {
  sortie::ResourceManager rm(sortie::ResourceLimits{});
  expect(!rm.reserve(sortie::ResourceUsage{-1.0, 0.0, 0.0, 0.0}).has_value(), "negative usage rejected");
  expect(!rm.reserve(sortie::ResourceUsage{std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0, 0.0})
              .has_value(),
         "NaN usage rejected");
}

void test_resource_concurrent_never_overcommits() {
  sortie::ResourceManager rm(sortie::ResourceLimits{80.0, 2048.0, 100.0, 10240.0});
  std::atomic<int> overcommit{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 500; ++i) {
        auto ticket = rm.reserve(sortie::ResourceUsage{30.0, 0.0, 0.0, 0.0});
        if (!ticket) continue;
        if (rm.get_state().in_use.cpu_percent > 80.0) overcommit.fetch_add(1);
        sortie::ReservationGuard guard(rm, *ticket);
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(overcommit.load() == 0, "sum of reservations never exceeds limit");
  expect(rm.get_state().active_reservations == 0, "guards release every ticket");
  expect(near(rm.get_state().in_use.cpu_percent, 0.0), "in-use returns to zero");
}

// ============================================================================
// Sandboxes and processes
// ============================================================================

void test_sandbox_concurrent_unique() {
  const fs::path root = scratch_dir("sbx");
  sortie::SandboxManager mgr(sortie::SandboxConfig{root.string(), {}});
  std::mutex mu;
  std::vector<sortie::Sandbox> made;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 4; ++i) {
        auto sb = mgr.create_sandbox(false);
        std::lock_guard<std::mutex> lock(mu);
        if (sb) made.push_back(*sb);
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(made.size() == 32, "every concurrent create succeeds");
  expect(mgr.get_active_count() == 32, "all sandboxes active");
  for (std::size_t i = 0; i < made.size(); ++i) {
    expect(fs::is_directory(made[i].workspace_path), "workspace exists");
    for (std::size_t j = i + 1; j < made.size(); ++j) {
      expect(made[i].id != made[j].id, "sandbox ids are distinct");
    }
  }
  expect(mgr.cleanup_sandbox(made[0]), "cleanup succeeds");
  expect(!fs::exists(made[0].workspace_path), "cleanup removes the workspace");
  expect(mgr.get_active_count() == 31, "cleanup decrements the active count");
  expect(mgr.cleanup_all() == 0, "cleanup_all reports no failures");
  expect(mgr.get_active_count() == 0, "cleanup_all empties the active set");
  fs::remove_all(root);
}

void test_sandbox_non_git_degrades() {
  const fs::path root = scratch_dir("sbx-nogit");
  const fs::path repo = scratch_dir("plain");
  sortie::SandboxManager mgr(sortie::SandboxConfig{root.string(), repo.string()});
  clear_logs();
  auto sb = mgr.create_sandbox(true);
  expect(sb.has_value(), "isolated request still yields a sandbox");
  expect(!sb->uses_isolated_branch && sb->worktree_path.empty(), "falls back to plain directory");
  expect(sb->working_dir() == sb->workspace_path, "tools run in the workspace");
  expect(count_logs(sortie::LogLevel::warn, "sandbox") >= 1, "degradation is logged as a warning");
  expect(mgr.cleanup_all() == 0, "cleanup ok");
  fs::remove_all(root);
  fs::remove_all(repo);
}

sortie::ProcessResult git(const fs::path& repo, std::vector<std::string> args) {
  sortie::ProcessSpec spec;
  spec.command = "git";
  spec.argv = {"-C", repo.string(), "-c", "commit.gpgsign=false"};
  spec.argv.insert(spec.argv.end(), args.begin(), args.end());
  spec.env = {{"GIT_AUTHOR_NAME", "sortie"},
              {"GIT_AUTHOR_EMAIL", "sortie@localhost"},
              {"GIT_COMMITTER_NAME", "sortie"},
              {"GIT_COMMITTER_EMAIL", "sortie@localhost"}};
  spec.timeout_ms = 30000;
  return sortie::run_process(spec);
}

void test_sandbox_git_worktree_isolation() {
  if (!sortie::find_executable("git")) {
    std::cout << " (git not found, skipped)";
    return;
  }
  const fs::path root = scratch_dir("sbx-git");
  const fs::path repo = scratch_dir("repo");
  expect(git(repo, {"init", "-q"}).ok(), "git init");
  expect(git(repo, {"commit", "-q", "--allow-empty", "-m", "base"}).ok(), "initial commit");

  sortie::SandboxManager mgr(sortie::SandboxConfig{root.string(), repo.string()});
  std::mutex mu;
  std::vector<sortie::Sandbox> made;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 2; ++i) {
        auto sb = mgr.create_sandbox(true);
        std::lock_guard<std::mutex> lock(mu);
        if (sb) made.push_back(*sb);
      }
    });
  }
  for (auto& th : threads) th.join();
  expect(made.size() == 8, "every isolated create succeeds");

  for (std::size_t i = 0; i < made.size(); ++i) {
    const auto& sb = made[i];
    expect(sb.uses_isolated_branch, "sandbox backed by a worktree");
    expect(sb.branch == sortie::sandbox_branch_name(sb.id), "branch named after the sandbox");
    expect(!sb.worktree_path.empty() && fs::exists(fs::path(sb.worktree_path) / ".git"),
           "worktree checked out");
    expect(sb.working_dir() == sb.worktree_path, "tools run in the worktree");
    auto head = git(sb.worktree_path, {"rev-parse", "--abbrev-ref", "HEAD"});
    expect(head.ok() && head.stdout_text == sb.branch + "\n", "worktree is on its own branch");
    for (std::size_t j = i + 1; j < made.size(); ++j) {
      expect(sb.worktree_path != made[j].worktree_path, "worktrees are distinct");
    }
  }

  expect(mgr.cleanup_all() == 0, "cleanup_all reports no failures");
  expect(mgr.get_active_count() == 0, "no sandbox left active");
  for (const auto& sb : made) expect(!fs::exists(sb.worktree_path), "worktree removed");
  auto branches = git(repo, {"branch", "--list", "sortie/*"});
  expect(branches.ok() && branches.stdout_text.empty(), "sandbox branches deleted");
  auto worktrees = git(repo, {"worktree", "list", "--porcelain"});
  expect(worktrees.ok() && worktrees.stdout_text.find(root.string()) == std::string::npos,
         "worktrees unregistered");
  fs::remove_all(root);
  fs::remove_all(repo);
}

void test_sandbox_branch_name() {
  expect(sortie::sandbox_branch_name("sbx-1") == "sortie/sandbox-sbx-1", "branch naming");
}

void test_process_capture_and_exit_code() {
  sortie::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo out; echo err 1>&2; exit 3"};
  spec.timeout_ms = 5000;
  auto r = sortie::run_process(spec);
  expect(r.exit_code == 3, "exit code propagated");
  expect(r.stdout_text == "out\n" && r.stderr_text == "err\n", "streams captured separately");
  expect(!r.ok(), "nonzero exit is not ok");
}

void test_process_timeout() {
  sortie::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "sleep 10"};
  spec.timeout_ms = 200;
  auto r = sortie::run_process(spec);
  expect(r.timed_out && r.exit_code == 124, "timeout kills the child");
}

void test_process_spawn_failure() {
  sortie::ProcessSpec spec;
  spec.command = "/nonexistent/sortie-no-such-binary";
  auto r = sortie::run_process(spec);
  expect(r.exit_code == 127 && !r.error_message.empty(), "spawn failure reported");
}

void test_process_tool_in_sandbox() {
  const fs::path dir = scratch_dir("tool");
  auto handler = sortie::make_process_tool("/bin/sh");
  sortie::PlanStep step;
  step.id = "s1";
  step.tool_id = "exec";
  step.parameters = sortie::jsonlite::Object{
      {"argv", sortie::jsonlite::Array{"-c", "pwd; printf %s \"$SORTIE_PLAN_ID\""}}};
  auto r = handler(step, sortie::ToolContext{"g1", "p1", "sbx-1", dir.string()});
  expect(r.success, "exit 0 is success");
  const auto& payload = std::get<sortie::jsonlite::Object>(r.result.v);
  const std::string out = sortie::jsonlite::get_string(payload, "stdout");
  expect(out.find(fs::canonical(dir).string()) != std::string::npos, "runs in the working dir");
  expect(out.find("p1") != std::string::npos, "plan id exported to the child");
  fs::remove_all(dir);
}

// ============================================================================
// Configuration, serialization, concurrency primitives
// ============================================================================

void test_config_defaults_valid() {
  auto r = sortie::EngineConfig::defaults().validate();
  expect(r.ok && r.errors.empty(), "defaults validate");
  expect(r.config_version == std::to_string(sortie::version::CONFIG_VERSION), "config version reported");
}

void test_config_from_json_and_validation() {
  std::string err;
  auto cfg = sortie::EngineConfig::from_json(
      R"({"worker_threads":0,"resource_limits":{"max_cpu_percent":50},"unknown":1})", &err);
  expect(cfg.has_value(), "well-formed config parses");
  expect(near(cfg->resource_limits.max_cpu_percent, 50.0), "nested limits applied");
  expect(near(cfg->resource_limits.max_memory_mb, 2048.0), "unspecified limits keep defaults");
  auto r = cfg->validate();
  expect(!r.ok && !r.errors.empty(), "zero workers rejected");
  expect(!sortie::EngineConfig::from_json("{", &err).has_value() && !err.empty(), "malformed JSON rejected");
}

void test_parse_goal_and_plans() {
  std::string err;
  auto goal = sortie::parse_goal_json(
      R"({"description":"ship it","priority":"high","success_criteria":["tests pass"],)"
      R"("constraints":[{"name":"cap","kind":"resource_limit","limits":{"max_cpu_percent":10}}]})",
      &err);
  expect(goal.has_value(), "goal parses: " + err);
  expect(goal->priority == sortie::Priority::high, "priority parsed");
  expect(goal->constraints.size() == 1 && goal->constraints[0].kind == sortie::ConstraintKind::resource_limit,
         "constraint kind parsed");
  expect(!sortie::parse_goal_json(R"({"priority":"high"})", &err).has_value(), "description required");

  auto plans = sortie::parse_plans_json(
      R"({"plans":[{"id":"p1","steps":[{"tool_id":"exec","estimated_resources":{"cpu_percent":5}}]}]})", &err);
  expect(plans && plans->size() == 1 && plans->at(0).steps.size() == 1, "wrapped plan list parses");
  expect(!sortie::parse_plans_json(R"([{"steps":[{"id":"s"}]}])", &err).has_value(), "tool_id required");
}

void test_normalize_plans() {
  std::vector<sortie::Plan> plans(2);
  plans[0].steps.resize(2);
  plans[1].id = "keep";
  sortie::normalize_plans(plans, "g1");
  expect(!plans[0].id.empty() && plans[1].id == "keep", "blank plan ids filled");
  expect(plans[0].steps[0].id == "step-1" && plans[0].steps[1].id == "step-2", "blank step ids filled");
  expect(plans[0].goal_id == "g1" && plans[1].goal_id == "g1", "goal id stamped");
}

void test_worker_pool_and_channel() {
  sortie::WorkerPool pool(3);
  std::vector<std::future<int>> futs;
  for (int i = 0; i < 20; ++i) futs.push_back(pool.submit([i] { return i * i; }));
  int sum = 0;
  for (auto& f : futs) sum += f.get();
  expect(sum == 2470, "pool runs every task");
  pool.shutdown();
  expect(!pool.submit([] { return 1; }).valid(), "submit after shutdown refused");

  sortie::Channel<int> ch;
  expect(ch.push(1) && ch.push(2), "push accepted");
  ch.close();
  expect(!ch.push(3), "push after close refused");
  expect(ch.pop() == 1 && ch.pop() == 2 && !ch.pop().has_value(), "drains then reports closed");
}

void test_engine_stats_ring() {
  sortie::EngineStats stats;
  for (int i = 0; i < 1005; ++i) {
    sortie::EngineEvent ev;
    ev.kind = sortie::EventKind::step_completed;
    ev.detail = std::to_string(i);
    ev.duration_ns = 1000;
    stats.record(ev);
  }
  auto recent = stats.recent_events_snapshot();
  expect(recent.size() == sortie::EngineStats::kMaxRecentEvents, "ring bounded");
  expect(recent.front().detail == "5" && recent.back().detail == "1004", "ring is oldest first");
}

// ============================================================================
// Engine
// ============================================================================

sortie::EngineConfig test_config(const fs::path& root) {
  sortie::EngineConfig cfg;
  cfg.sandbox_root = root.string();
  cfg.learning_update_interval_ms = 20;
  cfg.reservation_backoff_ms = 1;
  cfg.reservation_retries = 1;
  return cfg;
}

sortie::PlanStep step(const std::string& id, const std::string& tool, double cpu = 1.0) {
  sortie::PlanStep s;
  s.id = id;
  s.tool_id = tool;
  s.description = id + " via " + tool;
  s.estimated_resources.cpu_percent = cpu;
  return s;
}

sortie::Plan plan(const std::string& id, std::vector<sortie::PlanStep> steps) {
  sortie::Plan p;
  p.id = id;
  p.steps = std::move(steps);
  return p;
}

sortie::Goal goal(const std::string& description, sortie::Priority p = sortie::Priority::medium) {
  sortie::Goal g;
  g.description = description;
  g.priority = p;
  return g;
}

std::shared_ptr<sortie::FunctionToolRegistry> basic_tools() {
  auto reg = std::make_shared<sortie::FunctionToolRegistry>();
  reg->register_tool("ok", [](const sortie::PlanStep&, const sortie::ToolContext&) {
    sortie::ToolExecutionResult r;
    r.success = true;
    r.result = "done";
    r.cost_usd = 0.001;
    return r;
  });
  reg->register_tool("fail", [](const sortie::PlanStep&, const sortie::ToolContext&) {
    sortie::ToolExecutionResult r;
    r.success = false;
    r.error = "tool_failed: boom";
    return r;
  });
  reg->register_tool("throws", [](const sortie::PlanStep&, const sortie::ToolContext&) -> sortie::ToolExecutionResult {
    throw std::runtime_error("kaboom");
  });
  return reg;
}

void test_engine_completes_best_plan() {
  const fs::path root = scratch_dir("eng");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("good", {step("a", "ok"), step("b", "ok", 2.0)}),
      plan("mixed", {step("a", "ok"), step("b", "fail")}),
      plan("broken", {step("a", "throws")}),
  });
  sortie::Engine engine(test_config(root), oracle, basic_tools());
  std::string err;
  expect(engine.start(&err), "engine starts: " + err);
  auto id = engine.submit_goal(goal("pick the best"), &err);
  expect(id.has_value(), "goal accepted");
  auto state = engine.wait_for_goal(*id, 10s);
  expect(state && *state == sortie::GoalState::completed, "goal completes");

  auto ctx = engine.get_goal_status(*id);
  expect(ctx.has_value(), "status available");
  expect(ctx->ranked_results.size() == 3, "every candidate ranked");
  expect(ctx->ranked_results[0].result.plan_id == "good", "all-success plan wins");
  expect(ctx->tool_results.size() == 5, "every step outcome recorded");
  expect(std::get<std::string>(ctx->state_map.at("winning_plan_id").v) == "good", "winner in state map");
  expect(ctx->state_map.contains("ranking_digest"), "ranking digest recorded");
  expect(ctx->history.front().event == "goal_submitted", "history starts at submission");
  expect(ctx->history.back().event == "goal_completed", "history ends at completion");

  bool threw_recorded = false;
  for (const auto& r : ctx->tool_results) {
    if (r.tool_id == "throws") threw_recorded = !r.success && r.error && r.error->find("kaboom") != std::string::npos;
  }
  expect(threw_recorded, "throwing tool becomes a failed step");

  auto strat = engine.learning().get_best_strategy("ok");
  expect(strat && strat->usage_count == 3 && near(strat->success_rate, 1.0), "outcomes fed to learning");
  expect(engine.memory().search("step_started").size() == 5, "dispatched steps written to memory");
  expect(engine.sandboxes().get_active_count() == 1, "only the winning sandbox is retained");
  expect(engine.resources().get_state().active_reservations == 0, "every reservation released");
  const std::string workspace = std::get<std::string>(ctx->state_map.at("winning_workspace").v);
  expect(fs::is_directory(workspace), "winning workspace exists while the engine runs");

  engine.stop();
  expect(!fs::exists(workspace), "stop removes the winning workspace");
  expect(engine.sandboxes().get_active_count() == 0, "stop removes the retained sandbox");
  expect(fs::is_empty(root), "no workspaces left on disk");
  expect(engine.stats().goals_completed.load() == 1, "stats count completion");
  fs::remove_all(root);
}

void test_engine_zero_plans_fails() {
  const fs::path root = scratch_dir("eng-empty");
  sortie::Engine engine(test_config(root), std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{}),
                        basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(goal("nothing to do"));
  auto state = engine.wait_for_goal(*id, 10s);
  expect(state && *state == sortie::GoalState::failed, "zero plans is a hard failure");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->error && ctx->error->rfind("no_plans", 0) == 0, "error names the cause");
  engine.stop();
  fs::remove_all(root);
}

class ThrowingOracle : public sortie::IPlanOracle {
 public:
  std::vector<sortie::Plan> propose_plans(const sortie::PlanningContext&) override {
    throw std::runtime_error("model unavailable");
  }
};

void test_engine_oracle_failure() {
  const fs::path root = scratch_dir("eng-oracle");
  sortie::Engine engine(test_config(root), std::make_shared<ThrowingOracle>(), basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(goal("cannot plan"));
  auto state = engine.wait_for_goal(*id, 10s);
  expect(state && *state == sortie::GoalState::failed, "oracle exception fails the goal");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->error && ctx->error->find("model unavailable") != std::string::npos, "oracle message kept");
  engine.stop();
  fs::remove_all(root);
}

void test_engine_resource_rejection() {
  const fs::path root = scratch_dir("eng-res");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("greedy", {step("a", "ok", 500.0)}),
      plan("modest", {step("a", "ok", 5.0)}),
  });
  sortie::Engine engine(test_config(root), oracle, basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(goal("fit the budget"));
  auto state = engine.wait_for_goal(*id, 10s);
  expect(state && *state == sortie::GoalState::completed, "goal still completes");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->ranked_results[0].result.plan_id == "modest", "plan within limits wins");
  bool rejected = false;
  for (const auto& r : ctx->tool_results) {
    if (!r.success && r.error && r.error->rfind("resource_limit_exceeded", 0) == 0) rejected = true;
  }
  expect(rejected, "over-limit step surfaces as resource_limit_exceeded");
  expect(!engine.learning().get_best_strategy("ok") ||
             engine.learning().get_best_strategy("ok")->usage_count == 1,
         "rejected step never reached the tool");
  expect(engine.stats().steps_rejected.load() >= 1, "rejection counted");
  engine.stop();
  fs::remove_all(root);
}

void test_engine_all_candidates_refused() {
  const fs::path root = scratch_dir("eng-refused");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("greedy", {step("a", "ok", 500.0)}),
  });
  sortie::Engine engine(test_config(root), oracle, basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(goal("impossible budget"));
  auto state = engine.wait_for_goal(*id, 10s);
  expect(state && *state == sortie::GoalState::failed, "no dispatched step means failure");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->error && ctx->error->rfind("all_candidates_failed", 0) == 0, "all candidates failed");
  expect(engine.sandboxes().get_active_count() == 0, "no sandbox retained on failure");
  engine.stop();
  fs::remove_all(root);
}

void test_engine_all_tool_calls_fail() {
  const fs::path root = scratch_dir("eng-allfail");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p1", {step("a", "fail"), step("b", "fail")}),
      plan("p2", {step("a", "fail")}),
  });
  sortie::Engine engine(test_config(root), oracle, basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(goal("nothing works"));
  auto state = engine.wait_for_goal(*id, 10s);
  expect(state && *state == sortie::GoalState::failed, "every tool call failing is total execution failure");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->error && ctx->error->rfind("all_candidates_failed", 0) == 0, "error names the cause");
  expect(ctx->ranked_results.size() == 2, "ranked results kept for inspection");
  expect(ctx->tool_results.size() == 3, "every failed step recorded");
  expect(!ctx->state_map.contains("winning_sandbox_id"), "no winner retained");
  expect(engine.sandboxes().get_active_count() == 0, "every sandbox released");
  engine.stop();
  fs::remove_all(root);
}

std::shared_ptr<sortie::FunctionToolRegistry> slow_tools() {
  auto reg = basic_tools();
  reg->register_tool("slow", [](const sortie::PlanStep&, const sortie::ToolContext&) {
    std::this_thread::sleep_for(150ms);
    sortie::ToolExecutionResult r;
    r.success = true;
    return r;
  });
  return reg;
}

void test_effective_deadline() {
  const auto start = std::chrono::steady_clock::now();
  auto g = goal("bounded");
  expect(!sortie::effective_deadline(g, start).has_value(), "no deadline without limits");
  g.deadline_unix_ms = sortie::now_unix_ms() + 60000;
  sortie::Constraint c;
  c.kind = sortie::ConstraintKind::time_limit;
  c.time_limit_ms = 50;
  g.constraints.push_back(c);
  auto d = sortie::effective_deadline(g, start);
  expect(d && *d == start + 50ms, "tightest limit wins");
}

void test_engine_time_limit_stops_dispatch() {
  const fs::path root = scratch_dir("eng-deadline");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p", {step("a", "slow"), step("b", "ok"), step("c", "ok")}),
  });
  auto g = goal("race the clock");
  sortie::Constraint c;
  c.name = "budget";
  c.kind = sortie::ConstraintKind::time_limit;
  c.time_limit_ms = 50;
  g.constraints.push_back(c);

  sortie::Engine engine(test_config(root), oracle, slow_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(g);
  expect(engine.wait_for_goal(*id, 10s) == sortie::GoalState::completed, "partial progress completes");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->tool_results.size() == 1, "no step dispatched after the time limit");
  const auto& best = ctx->ranked_results[0].result;
  expect(!best.success && best.steps_completed == 1, "candidate stopped early");
  expect(best.error && best.error->rfind("deadline_exceeded", 0) == 0, "deadline_exceeded reported");
  expect(!engine.learning().get_best_strategy("ok").has_value(), "later steps never reached a tool");
  engine.stop();
  fs::remove_all(root);
}

void test_engine_past_deadline_fails() {
  const fs::path root = scratch_dir("eng-expired");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p", {step("a", "ok")}),
  });
  auto g = goal("already late");
  g.deadline_unix_ms = sortie::now_unix_ms() - 1000;
  sortie::Engine engine(test_config(root), oracle, basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(g);
  expect(engine.wait_for_goal(*id, 10s) == sortie::GoalState::failed, "nothing runs past the deadline");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->tool_results.empty(), "no step dispatched");
  expect(ctx->error && ctx->error->find("deadline_exceeded") != std::string::npos, "deadline named in error");
  engine.stop();
  fs::remove_all(root);
}

sortie::Constraint quality(double threshold) {
  sortie::Constraint c;
  c.name = "quality";
  c.kind = sortie::ConstraintKind::quality_threshold;
  c.threshold = threshold;
  return c;
}

void test_engine_quality_threshold_recorded() {
  const fs::path root = scratch_dir("eng-quality");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p", {step("a", "ok")}),
  });
  sortie::Engine engine(test_config(root), oracle, basic_tools());
  expect(engine.start(), "start");

  auto met = goal("easy bar");
  met.constraints = {quality(90.0)};
  auto missed = goal("high bar");
  missed.constraints = {quality(50.0), quality(120.0)};
  auto plain = goal("no bar");

  auto met_id = engine.submit_goal(met);
  auto missed_id = engine.submit_goal(missed);
  auto plain_id = engine.submit_goal(plain);
  for (const auto& id : {*met_id, *missed_id, *plain_id}) {
    expect(engine.wait_for_goal(id, 10s) == sortie::GoalState::completed, "threshold never changes the outcome");
  }
  auto ctx = engine.get_goal_status(*met_id);
  expect(std::get<bool>(ctx->state_map.at("quality_threshold_met").v), "score 100 meets 90");
  ctx = engine.get_goal_status(*missed_id);
  expect(!std::get<bool>(ctx->state_map.at("quality_threshold_met").v), "highest threshold applies");
  ctx = engine.get_goal_status(*plain_id);
  expect(!ctx->state_map.contains("quality_threshold_met"), "key absent without a threshold");
  engine.stop();
  fs::remove_all(root);
}

void test_engine_abort_on_step_failure() {
  const fs::path root = scratch_dir("eng-abort");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p", {step("a", "ok"), step("b", "fail"), step("c", "ok")}),
  });
  auto cfg = test_config(root);
  cfg.abort_candidate_on_step_failure = true;
  sortie::Engine engine(cfg, oracle, basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(goal("stop at first failure"));
  expect(engine.wait_for_goal(*id, 10s) == sortie::GoalState::completed, "partial progress completes");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->tool_results.size() == 2, "nothing dispatched after the failed step");
  const auto& best = ctx->ranked_results[0].result;
  expect(best.steps_completed == 1 && best.steps_failed == 1 && !best.success, "candidate aborted");
  engine.stop();
  fs::remove_all(root);
}

void throwing_event_hook(const sortie::EngineEvent&) { throw std::runtime_error("event sink down"); }

void test_engine_survives_throwing_event_hook() {
  const fs::path root = scratch_dir("eng-hook");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p", {step("a", "ok")}),
  });
  clear_logs();
  sortie::set_engine_event_hook(throwing_event_hook);
  sortie::Engine engine(test_config(root), oracle, basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(goal("noisy observer"));
  auto state = engine.wait_for_goal(*id, 10s);
  engine.stop();
  sortie::set_engine_event_hook(nullptr);
  expect(state && *state == sortie::GoalState::completed, "hook failure does not affect the goal");
  expect(count_logs(sortie::LogLevel::warn, "observability") > 0, "hook failure logged");
  expect(engine.stats().goals_completed.load() == 1, "stats still recorded");
  fs::remove_all(root);
}

void test_engine_constraint_and_dependency() {
  const fs::path root = scratch_dir("eng-constraint");
  auto dependent = step("b", "ok");
  dependent.dependencies = {"a"};
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p", {step("a", "ok", 20.0), dependent, step("c", "ok", 1.0)}),
  });
  auto g = goal("stay small");
  sortie::Constraint c;
  c.name = "small";
  c.kind = sortie::ConstraintKind::resource_limit;
  c.limits.max_cpu_percent = 10.0;
  g.constraints.push_back(c);

  sortie::Engine engine(test_config(root), oracle, basic_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(g);
  expect(engine.wait_for_goal(*id, 10s) == sortie::GoalState::completed, "completes with partial result");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->tool_results.size() == 3, "three step outcomes");
  expect(ctx->tool_results[0].error && ctx->tool_results[0].error->rfind("constraint_violation", 0) == 0,
         "constraint violation");
  expect(ctx->tool_results[1].error && ctx->tool_results[1].error->rfind("dependency_failed", 0) == 0,
         "dependent step not dispatched");
  expect(ctx->tool_results[2].success, "independent step still runs");
  const auto& best = ctx->ranked_results[0].result;
  expect(best.steps_completed == 1 && best.steps_failed == 2 && !best.success, "partial completion counted");
  engine.stop();
  fs::remove_all(root);
}

class FirstStepCriteria : public sortie::ICriteriaEvaluator {
 public:
  bool criterion_met(const std::string&, const sortie::CandidateView& view) override {
    return !view.results->empty() && view.results->back().success;
  }
};

void test_engine_criteria_early_stop() {
  const fs::path root = scratch_dir("eng-criteria");
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p", {step("a", "ok"), step("b", "ok"), step("c", "ok")}),
  });
  auto g = goal("stop when done");
  g.success_criteria = {"first step ok"};
  sortie::Engine engine(test_config(root), oracle, basic_tools(), std::make_shared<FirstStepCriteria>());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(g);
  expect(engine.wait_for_goal(*id, 10s) == sortie::GoalState::completed, "completes");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->tool_results.size() == 1, "no steps dispatched after criteria met");
  expect(ctx->ranked_results[0].result.success, "criteria met counts as success");
  engine.stop();
  fs::remove_all(root);
}

std::atomic<bool> g_gate_open{false};
std::atomic<int> g_gate_entered{0};
std::mutex g_order_mu;
std::vector<std::string> g_order;

std::shared_ptr<sortie::FunctionToolRegistry> gated_tools() {
  auto reg = basic_tools();
  reg->register_tool("gate", [](const sortie::PlanStep&, const sortie::ToolContext&) {
    g_gate_entered.fetch_add(1);
    while (!g_gate_open.load()) std::this_thread::sleep_for(2ms);
    sortie::ToolExecutionResult r;
    r.success = true;
    return r;
  });
  reg->register_tool("trace", [](const sortie::PlanStep& s, const sortie::ToolContext&) {
    std::lock_guard<std::mutex> lock(g_order_mu);
    g_order.push_back(s.description);
    sortie::ToolExecutionResult r;
    r.success = true;
    return r;
  });
  return reg;
}

class DescriptionOracle : public sortie::IPlanOracle {
 public:
  std::vector<sortie::Plan> propose_plans(const sortie::PlanningContext& ctx) override {
    const std::string tool = ctx.goal.description == "blocker" ? "gate" : "trace";
    auto s = step("only", tool);
    s.description = ctx.goal.description;
    return {plan("p", {s})};
  }
};

bool wait_until(const std::function<bool()>& pred) {
  for (int i = 0; i < 2000; ++i) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return false;
}

void test_engine_cancel_running_goal() {
  const fs::path root = scratch_dir("eng-cancel");
  g_gate_open = false;
  g_gate_entered = 0;
  auto oracle = std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{
      plan("p", {step("a", "gate"), step("b", "ok")}),
  });
  sortie::Engine engine(test_config(root), oracle, gated_tools());
  expect(engine.start(), "start");
  auto id = engine.submit_goal(goal("long task"));
  expect(wait_until([] { return g_gate_entered.load() > 0; }), "first step dispatched");
  expect(engine.cancel_goal(*id), "cancel accepted");
  g_gate_open = true;
  auto state = engine.wait_for_goal(*id, 10s);
  expect(state && *state == sortie::GoalState::cancelled, "goal ends cancelled");
  auto ctx = engine.get_goal_status(*id);
  expect(ctx->tool_results.size() == 1, "no step dispatched after cancel");
  expect(!engine.cancel_goal(*id), "terminal goal cannot be cancelled again");
  expect(engine.sandboxes().get_active_count() == 0, "cancelled goal leaves no sandbox");
  engine.stop();
  fs::remove_all(root);
}

void test_engine_priority_dispatch() {
  const fs::path root = scratch_dir("eng-prio");
  g_gate_open = false;
  g_gate_entered = 0;
  {
    std::lock_guard<std::mutex> lock(g_order_mu);
    g_order.clear();
  }
  auto cfg = test_config(root);
  cfg.max_concurrent_goals = 1;
  sortie::Engine engine(cfg, std::make_shared<DescriptionOracle>(), gated_tools());
  expect(engine.start(), "start");
  auto blocker = engine.submit_goal(goal("blocker", sortie::Priority::critical));
  expect(wait_until([] { return g_gate_entered.load() > 0; }), "blocker running");
  auto low = engine.submit_goal(goal("low", sortie::Priority::low));
  auto high1 = engine.submit_goal(goal("high-1", sortie::Priority::high));
  auto high2 = engine.submit_goal(goal("high-2", sortie::Priority::high));

  auto listed = engine.list_goals();
  expect(listed.size() == 4 && listed[1].description == "low", "list_goals in submission order");
  auto waiting = engine.get_goal_status(*low);
  expect(waiting && waiting->state == sortie::GoalState::submitted, "queued goal stays submitted");

  g_gate_open = true;
  for (const auto& id : {*blocker, *low, *high1, *high2}) {
    expect(engine.wait_for_goal(id, 10s) == sortie::GoalState::completed, "goal completes");
  }
  std::lock_guard<std::mutex> lock(g_order_mu);
  expect(g_order.size() == 3 && g_order[0] == "high-1" && g_order[1] == "high-2" && g_order[2] == "low",
         "highest priority first, FIFO within a priority");
  engine.stop();
  fs::remove_all(root);
}

void test_engine_rejects_after_stop() {
  const fs::path root = scratch_dir("eng-stop");
  sortie::Engine engine(test_config(root),
                        std::make_shared<sortie::StaticPlanOracle>(std::vector<sortie::Plan>{plan("p", {step("a", "ok")})}),
                        basic_tools());
  std::string err;
  expect(!engine.submit_goal(goal("early"), &err).has_value(), "submit before start refused");
  expect(engine.start(), "start");
  expect(!engine.submit_goal(goal(""), &err).has_value() && err.rfind("invalid_goal", 0) == 0,
         "blank description refused");
  expect(!engine.get_goal_status("goal-missing").has_value(), "unknown goal has no status");
  engine.stop();
  engine.stop();
  expect(!engine.running(), "stopped");
  expect(!engine.submit_goal(goal("late"), &err).has_value(), "submit after stop refused");
  expect(!engine.start(&err), "restart refused");
  fs::remove_all(root);
}

void test_engine_invalid_config_refused() {
  auto cfg = sortie::EngineConfig::defaults();
  cfg.worker_threads = 0;
  sortie::Engine engine(cfg, std::make_shared<ThrowingOracle>(), basic_tools());
  std::string err;
  expect(!engine.start(&err) && err.find("worker_threads") != std::string::npos, "invalid config refused");
}

void test_engine_null_seams_throw() {
  bool threw = false;
  try {
    sortie::Engine engine(sortie::EngineConfig::defaults(), nullptr, basic_tools());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  expect(threw, "missing oracle rejected");
}

void test_version_manifest() {
  const std::string json = sortie::version::manifest_to_json(sortie::version::current_manifest());
  expect(json.find(sortie::version::ENGINE_SEMVER) != std::string::npos, "manifest carries semver");
}

}  // namespace

int main() {
  sortie::set_log_hook(capture_log);
  sortie::set_engine_event_hook(nullptr);

  std::cout << "=== Sortie Engine Test Suite ===\n";

  std::cout << "\n[Hashing] BLAKE3 and identifiers\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("make_id uniqueness", test_make_id_unique);

  std::cout << "\n[JSON] Parser and writer\n";
  run_test("canonical round trip", test_json_roundtrip_canonical);
  run_test("malformed input rejected", test_json_rejects_malformed);
  run_test("non-finite written as null", test_json_non_finite_written_as_null);

  std::cout << "\n[Logging] Levels and hook\n";
  run_test("level filter and hook delivery", test_log_level_and_hook);

  std::cout << "\n[Comparator] Scoring and ranking\n";
  run_test("reference success score", test_score_reference_success);
  run_test("reference failure score", test_score_reference_failure);
  run_test("moderate tiers", test_score_moderate_tiers);
  run_test("rank order", test_rank_order_and_ranks);
  run_test("deterministic ties", test_rank_ties_are_deterministic);
  run_test("NaN cost", test_nan_cost_earns_no_bonus);
  run_test("best result / empty", test_best_result_and_empty);
  run_test("format comparison", test_format_comparison_mentions_plans);

  std::cout << "\n[Learning] Strategies\n";
  run_test("success rate", test_learning_success_rate);
  run_test("most recent usage", test_learning_usage_is_most_recent);
  run_test("learning disabled", test_learning_disabled);
  run_test("cap and optimizer hook", test_learning_cap_and_hook);

  std::cout << "\n[Memory] Working memory\n";
  run_test("eviction at 1000", test_memory_eviction);
  run_test("search", test_memory_search);

  std::cout << "\n[Resources] Reservation gate\n";
  run_test("reserve/release", test_resource_reserve_release);
  run_test("invalid usage", test_resource_rejects_invalid_usage);
  run_test("concurrent reservations", test_resource_concurrent_never_overcommits);

  std::cout << "\n[Sandbox] Workspaces and processes\n";
  run_test("concurrent unique sandboxes", test_sandbox_concurrent_unique);
  run_test("non-git degradation", test_sandbox_non_git_degrades);
  run_test("git worktree isolation", test_sandbox_git_worktree_isolation);
  run_test("branch name", test_sandbox_branch_name);
  run_test("process capture", test_process_capture_and_exit_code);
  run_test("process timeout", test_process_timeout);
  run_test("process spawn failure", test_process_spawn_failure);
  run_test("process tool", test_process_tool_in_sandbox);

  std::cout << "\n[Config] Configuration and serialization\n";
  run_test("defaults valid", test_config_defaults_valid);
  run_test("from_json + validate", test_config_from_json_and_validation);
  run_test("goal and plan parsing", test_parse_goal_and_plans);
  run_test("plan normalization", test_normalize_plans);
  run_test("worker pool and channel", test_worker_pool_and_channel);
  run_test("event ring", test_engine_stats_ring);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Engine] Goal lifecycle\n";
  run_test("completes with best plan", test_engine_completes_best_plan);
  run_test("zero plans", test_engine_zero_plans_fails);
  run_test("oracle failure", test_engine_oracle_failure);
  run_test("resource rejection", test_engine_resource_rejection);
  run_test("all candidates refused", test_engine_all_candidates_refused);
  run_test("all tool calls fail", test_engine_all_tool_calls_fail);
  run_test("effective deadline", test_effective_deadline);
  run_test("time limit stops dispatch", test_engine_time_limit_stops_dispatch);
  run_test("past deadline", test_engine_past_deadline_fails);
  run_test("quality threshold", test_engine_quality_threshold_recorded);
  run_test("abort on step failure", test_engine_abort_on_step_failure);
  run_test("throwing event hook", test_engine_survives_throwing_event_hook);
  run_test("constraints and dependencies", test_engine_constraint_and_dependency);
  run_test("criteria early stop", test_engine_criteria_early_stop);
  run_test("cancel running goal", test_engine_cancel_running_goal);
  run_test("priority dispatch", test_engine_priority_dispatch);
  run_test("lifecycle guards", test_engine_rejects_after_stop);
  run_test("invalid config", test_engine_invalid_config_refused);
  run_test("null seams", test_engine_null_seams_throw);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
