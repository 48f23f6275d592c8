#include "sortie/sandbox.hpp"

#include <filesystem>
#include <system_error>

#include "sortie/hash.hpp"
#include "sortie/log.hpp"
#include "sortie/process.hpp"
#include "sortie/types.hpp"

namespace fs = std::filesystem;

namespace sortie {

namespace {

constexpr int kMaxIdAttempts = 4;

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string describe(const ProcessResult& r) {
  if (!r.error_message.empty()) return r.error_message;
  if (r.timed_out) return "timed out";
  std::string out = "exit code " + std::to_string(r.exit_code);
  const std::string err = trim(r.stderr_text);
  if (!err.empty()) out += ": " + err;
  return out;
}

}  // namespace

std::string sandbox_branch_name(const std::string& sandbox_id) {
  return "sortie/sandbox-" + sandbox_id;
}

SandboxManager::SandboxManager(SandboxConfig config) : config_(std::move(config)) {
  std::error_code ec;
  if (config_.root.empty()) {
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    root_ = (tmp / "sortie-sandboxes").string();
  } else {
    root_ = config_.root;
  }
  if (config_.repo_dir.empty()) {
    fs::path cwd = fs::current_path(ec);
    repo_dir_ = ec ? std::string(".") : cwd.string();
  } else {
    repo_dir_ = config_.repo_dir;
  }
}

bool SandboxManager::repo_is_git_work_tree() {
  ProcessSpec spec;
  spec.command = config_.git_binary;
  spec.argv = {"-C", repo_dir_, "rev-parse", "--is-inside-work-tree"};
  spec.timeout_ms = config_.git_timeout_ms;
  auto r = run_process(spec);
  return r.ok() && trim(r.stdout_text) == "true";
}

bool SandboxManager::add_worktree(Sandbox& sb) {
  const std::string branch = sandbox_branch_name(sb.id);
  const std::string path = (fs::path(sb.workspace_path) / "repo").string();
  ProcessSpec spec;
  spec.command = config_.git_binary;
  spec.argv = {"-C", repo_dir_, "worktree", "add", "-b", branch, path, "HEAD"};
  spec.timeout_ms = config_.git_timeout_ms;
  std::unique_lock<std::mutex> git_lock(git_mu_);
  auto r = run_process(spec);
  git_lock.unlock();
  if (!r.ok()) {
    log_warn("sandbox", "worktree add failed for " + sb.id + " (" + describe(r) +
                            "); using plain directory isolation");
    return false;
  }
  sb.worktree_path = path;
  sb.branch = branch;
  sb.uses_isolated_branch = true;
  return true;
}

void SandboxManager::remove_worktree(const Sandbox& sb) {
  ProcessSpec spec;
  spec.command = config_.git_binary;
  spec.timeout_ms = config_.git_timeout_ms;
  std::lock_guard<std::mutex> git_lock(git_mu_);

  spec.argv = {"-C", repo_dir_, "worktree", "remove", "--force", sb.worktree_path};
  auto r = run_process(spec);
  if (!r.ok()) {
    log_warn("sandbox", "worktree remove failed for " + sb.id + ": " + describe(r));
  }
  spec.argv = {"-C", repo_dir_, "branch", "-D", sb.branch};
  r = run_process(spec);
  if (!r.ok()) {
    log_warn("sandbox", "branch delete failed for " + sb.id + ": " + describe(r));
  }
}

std::optional<Sandbox> SandboxManager::create_sandbox(bool use_isolated_branch, std::string* error) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    if (error) *error = "sandbox_create_failed: " + root_ + ": " + ec.message();
    return std::nullopt;
  }

  Sandbox sb;
  for (int attempt = 0; attempt < kMaxIdAttempts && sb.id.empty(); ++attempt) {
    std::string id = make_id("sbx");
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (active_.contains(id)) continue;
    }
    const fs::path dir = fs::path(root_) / id;
    // create_directory() returns false when the path already exists.
    if (!fs::create_directory(dir, ec)) {
      if (ec) {
        if (error) *error = "sandbox_create_failed: " + dir.string() + ": " + ec.message();
        return std::nullopt;
      }
      continue;
    }
    sb.id = std::move(id);
    sb.workspace_path = dir.string();
  }
  if (sb.id.empty()) {
    if (error) *error = "sandbox_create_failed: could not allocate a unique sandbox id";
    return std::nullopt;
  }
  sb.created_at_ms = now_unix_ms();

  if (use_isolated_branch) {
    if (!find_executable(config_.git_binary)) {
      log_warn("sandbox", "git not found; sandbox " + sb.id + " uses plain directory isolation");
    } else if (!repo_is_git_work_tree()) {
      log_warn("sandbox", repo_dir_ + " is not under version control; sandbox " + sb.id +
                              " uses plain directory isolation");
    } else {
      add_worktree(sb);
    }
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    active_.emplace(sb.id, sb);
  }
  log_debug("sandbox", "created " + sb.id + " at " + sb.workspace_path);
  return sb;
}

bool SandboxManager::cleanup_sandbox(const Sandbox& sandbox, std::string* error) {
  if (sandbox.uses_isolated_branch) remove_worktree(sandbox);

  std::error_code ec;
  fs::remove_all(sandbox.workspace_path, ec);
  if (ec) {
    const std::string msg = "sandbox_cleanup_failed: " + sandbox.workspace_path + ": " + ec.message();
    log_error("sandbox", msg);
    if (error) *error = msg;
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  active_.erase(sandbox.id);
  return true;
}

std::size_t SandboxManager::cleanup_all() {
  std::size_t failures = 0;
  for (const auto& sb : active_sandboxes()) {
    std::string err;
    if (!cleanup_sandbox(sb, &err)) ++failures;
  }
  return failures;
}

std::size_t SandboxManager::get_active_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_.size();
}

std::optional<Sandbox> SandboxManager::find(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = active_.find(id);
  if (it == active_.end()) return std::nullopt;
  return it->second;
}

std::vector<Sandbox> SandboxManager::active_sandboxes() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Sandbox> out;
  out.reserve(active_.size());
  for (const auto& [id, sb] : active_) out.push_back(sb);
  return out;
}

}  // namespace sortie
