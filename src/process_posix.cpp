#include "sortie/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

extern char** environ;

namespace sortie {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, std::size_t limit,
                    bool& truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take = std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

bool is_executable_file(const std::string& path) {
  return ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string> build_environment(const ProcessSpec& spec) {
  std::map<std::string, std::string> merged;
  if (spec.inherit_env && environ) {
    for (char** e = environ; *e; ++e) {
      const char* eq = std::strchr(*e, '=');
      if (!eq) continue;
      merged[std::string(*e, static_cast<std::size_t>(eq - *e))] = eq + 1;
    }
  }
  for (const auto& [k, v] : spec.env) merged[k] = v;
  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
  return out;
}

void drain(int fd, std::string& dst, std::size_t limit, bool& truncated) {
  char buf[4096];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n <= 0) break;
    append_limited(dst, buf, n, limit, truncated);
  }
}

}  // namespace

std::optional<std::string> find_executable(const std::string& name) {
  if (name.empty()) return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (is_executable_file(name)) return name;
    return std::nullopt;
  }
  const char* path = std::getenv("PATH");
  std::string dirs = path && path[0] ? path : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= dirs.size()) {
    std::size_t end = dirs.find(':', start);
    if (end == std::string::npos) end = dirs.size();
    std::string dir = dirs.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (is_executable_file(candidate)) return candidate;
    start = end + 1;
  }
  return std::nullopt;
}

ProcessResult run_process(const ProcessSpec& spec) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();
  auto finish = [&]() -> ProcessResult& {
    result.duration_ms = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count());
    return result;
  };

  auto resolved = find_executable(spec.command);
  if (!resolved) {
    result.exit_code = 127;
    result.error_message = "spawn_failed: executable not found: " + spec.command;
    return finish();
  }

  // Everything the child needs is built before fork().
  std::vector<std::string> args = {spec.command};
  args.insert(args.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& s : args) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = build_environment(spec);
  std::vector<char*> envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  int out_pipe[2];
  int err_pipe[2];
  int exec_pipe[2];
  if (::pipe(out_pipe) != 0) {
    result.exit_code = 127;
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    return finish();
  }
  if (::pipe(err_pipe) != 0) {
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    result.exit_code = 127;
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    return finish();
  }
  if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
    result.exit_code = 127;
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    return finish();
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1], exec_pipe[0], exec_pipe[1]}) {
      ::close(fd);
    }
    result.exit_code = 127;
    result.error_message = std::string("spawn_failed: fork: ") + std::strerror(errno);
    return finish();
  }

  if (pid == 0) {
    ::setsid();
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[0]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[0]);

    int child_errno = 0;
    if (!spec.cwd.empty() && ::chdir(spec.cwd.c_str()) != 0) {
      child_errno = errno;
    } else {
      if (spec.max_memory_bytes > 0) {
        struct rlimit rl;
        rl.rlim_cur = spec.max_memory_bytes;
        rl.rlim_max = spec.max_memory_bytes;
        ::setrlimit(RLIMIT_AS, &rl);
      }
      if (spec.max_file_descriptors > 0) {
        struct rlimit rl;
        rl.rlim_cur = spec.max_file_descriptors;
        rl.rlim_max = spec.max_file_descriptors;
        ::setrlimit(RLIMIT_NOFILE, &rl);
      }
      ::execve(resolved->c_str(), argv.data(), envp.data());
      child_errno = errno;
    }
    // Report the failure to the parent; exec_pipe closes on a successful exec.
    ssize_t ignored = ::write(exec_pipe[1], &child_errno, sizeof(child_errno));
    (void)ignored;
    ::_exit(127);
  }

  ::close(out_pipe[1]);
  ::close(err_pipe[1]);
  ::close(exec_pipe[1]);

  int child_errno = 0;
  ssize_t exec_n;
  do {
    exec_n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (exec_n < 0 && errno == EINTR);
  ::close(exec_pipe[0]);
  if (exec_n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    result.exit_code = 127;
    result.error_message = std::string("spawn_failed: ") + std::strerror(child_errno);
    return finish();
  }

  ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  int status = 0;
  while (true) {
    ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes, result.stdout_truncated);
    n = ::read(err_pipe[0], buf, sizeof(buf));
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes, result.stderr_truncated);

    pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (spec.timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
      ::kill(-pid, SIGKILL);
      ::kill(pid, SIGKILL);
      ::waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.stdout_truncated);
  drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.stderr_truncated);
  ::close(out_pipe[0]);
  ::close(err_pipe[0]);

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return finish();
}

}  // namespace sortie
