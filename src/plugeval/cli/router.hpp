#pragma once

#include "core/config/eval_config.hpp"
#include "core/logging/logger.hpp"
#include "remote/record_client.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace plugeval::cli {

inline constexpr std::string_view kVersion = "0.1.0";

// Shared verify options for `plugeval verify` and in-process callers.
struct VerifyOptions {
  std::string scenario;
  std::filesystem::path project_dir;
  std::string mode;
  std::optional<std::filesystem::path> output_path;
  std::filesystem::path scenarios_dir = "scenarios";
  std::optional<std::filesystem::path> env_file;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Collaborators the verify pipeline would otherwise build from the process.
// Tests substitute a scripted environment and record client.
struct VerifyDependencies {
  core::config::EnvLookup env = core::config::ProcessEnvironment();
  // When null, an HTTP client is built from the loaded configuration.
  remote::IRecordClient* client = nullptr;
  std::ostream* out = &std::cout;
  std::ostream* log = &std::cerr;
};

// Loads configuration and scenario, runs every criterion, prints the report
// and writes the result document when requested.
//
// Returns 0 when every criterion passed or was skipped, 1 otherwise, 10 when
// the scenario cannot be loaded and 11 when the configuration is malformed.
int ExecuteVerify(const VerifyOptions& options, const VerifyDependencies& deps);

// Routes `plugeval` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0 => success
//   1 => command failed after valid invocation
//   2 => usage error (unknown command / invalid args)
//   10 => scenario invalid or not loadable
//   11 => configuration invalid
int Dispatch(int argc, char** argv);

} // namespace plugeval::cli
