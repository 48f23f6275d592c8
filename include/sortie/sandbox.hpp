#pragma once

// sortie/sandbox.hpp: Isolated per-candidate execution workspaces.
//
// DESIGN:
//   Each candidate plan runs in its own workspace directory under
//   SandboxConfig::root. When an isolated branch is requested and repo_dir is
//   inside a git work tree, a worktree is additionally checked out at
//   <workspace>/repo on the branch "sortie/sandbox-<id>", so concurrent
//   candidates never observe each other's file mutations.
//
// FAILURE SEMANTICS:
//   - Workspace creation failure: returned to the caller (fatal for that
//     candidate only).
//   - git failures during creation: isolation degrades to a plain directory;
//     a warning is logged.
//   - git failures during removal: logged, not propagated.
//   - Workspace removal failure: propagated. The sandbox stays in the active
//     set so cleanup_all() can retry it.
//
// INVARIANT: an id, once issued, is never reused while active. After a
// successful cleanup_sandbox() the workspace path no longer exists and the
// sandbox is no longer active.

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sortie {

struct Sandbox {
  std::string id;
  std::string workspace_path;
  std::string worktree_path;  // empty unless backed by a git worktree
  std::string branch;         // empty unless backed by a git worktree
  bool uses_isolated_branch{false};
  bool isolated{true};
  std::uint64_t created_at_ms{0};

  // Directory tools should run in: the worktree when present.
  const std::string& working_dir() const {
    return worktree_path.empty() ? workspace_path : worktree_path;
  }
};

struct SandboxConfig {
  std::string root;        // empty = <temp dir>/sortie-sandboxes
  std::string repo_dir;    // empty = current working directory
  std::string git_binary{"git"};
  std::uint64_t git_timeout_ms{30000};
};

class SandboxManager {
 public:
  explicit SandboxManager(SandboxConfig config = {});
  ~SandboxManager() = default;
  SandboxManager(const SandboxManager&) = delete;
  SandboxManager& operator=(const SandboxManager&) = delete;

  std::optional<Sandbox> create_sandbox(bool use_isolated_branch, std::string* error = nullptr);
  bool cleanup_sandbox(const Sandbox& sandbox, std::string* error = nullptr);
  // Returns the number of sandboxes that could not be removed.
  std::size_t cleanup_all();

  std::size_t get_active_count() const;
  std::optional<Sandbox> find(const std::string& id) const;
  std::vector<Sandbox> active_sandboxes() const;

  const std::string& root() const { return root_; }

 private:
  bool repo_is_git_work_tree();
  bool add_worktree(Sandbox& sb);
  void remove_worktree(const Sandbox& sb);

  SandboxConfig config_;
  std::string root_;
  std::string repo_dir_;

  mutable std::mutex mu_;
  std::map<std::string, Sandbox> active_;
  // Serializes worktree add/remove: git names worktree admin dirs after the
  // checkout basename, which is "repo" for every sandbox.
  std::mutex git_mu_;
};

std::string sandbox_branch_name(const std::string& sandbox_id);

}  // namespace sortie
