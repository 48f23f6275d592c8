#pragma once

// sortie/process.hpp: Child process execution with captured output.
//
// Used for the optional version-control subprocess behind sandbox isolation
// and by the process tool adapter. POSIX only.
//
// INVARIANT: run_process() never throws. Spawn failures are reported through
// ProcessResult::error_message with exit_code 127; timeouts kill the whole
// process group and report exit_code 124.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sortie {

struct ProcessSpec {
  std::string command;                 // absolute path, or a name resolved on PATH
  std::vector<std::string> argv;       // arguments after argv[0]
  std::map<std::string, std::string> env;
  bool inherit_env{true};              // start from the parent environment, then apply env
  std::string cwd;
  std::uint64_t timeout_ms{30000};
  std::size_t max_output_bytes{64 * 1024};
  std::uint64_t max_memory_bytes{0};      // 0 = unlimited
  std::uint64_t max_file_descriptors{0};  // 0 = unlimited
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  std::string error_message;
  std::uint64_t duration_ms{0};

  bool ok() const { return error_message.empty() && !timed_out && exit_code == 0; }
};

ProcessResult run_process(const ProcessSpec& spec);

// Resolves `name` against PATH. Names containing '/' are checked as-is.
std::optional<std::string> find_executable(const std::string& name);

}  // namespace sortie
