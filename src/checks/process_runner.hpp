#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace plugeval::checks {

struct ProcessRequest {
  // argv[0] is resolved through PATH.
  std::vector<std::string> argv;
  std::filesystem::path working_dir;
  // Set (or replaced) in the child's inherited environment.
  std::vector<std::pair<std::string, std::string>> env_overrides;
  std::chrono::milliseconds timeout{60000};
};

struct ProcessResult {
  int exit_code = -1;
  // Set when the child was killed for exceeding `timeout`.
  bool timed_out = false;
  // Terminating signal when the child did not exit normally, else 0.
  int term_signal = 0;
  std::string stdout_text;
  std::string stderr_text;
};

// Runs one child process to completion, capturing stdout and stderr
// separately. On timeout the child's process group is killed and
// `timed_out` is set; this still returns true.
//
// Returns false with `error` when the process could not be started at all
// (empty argv, missing executable, bad working directory, pipe/fork failure).
bool RunProcess(const ProcessRequest& request, ProcessResult& result, std::string& error);

} // namespace plugeval::checks
