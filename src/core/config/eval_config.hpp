#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace plugeval::core::config {

// Environment lookup seam. Returns nullopt when the variable is unset.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Reads the real process environment.
EnvLookup ProcessEnvironment();

// Layers `overrides` on top of `fallback`; override entries win even when the
// fallback also defines the key.
EnvLookup OverlayEnvironment(std::map<std::string, std::string> overrides, EnvLookup fallback);

// Remote platform connection settings.
struct RemoteSettings {
  std::string base_url = "https://api.freeplay.ai";
  std::string api_key;
  std::string project_id;
  bool verify_tls = true;
  std::chrono::seconds request_timeout{10};

  // Remote checks are skipped (not failed) unless both are present.
  bool HasCredentials() const {
    return !api_key.empty() && !project_id.empty();
  }
};

// Tooling used by code-run checks before and while executing project code.
struct CodeRunSettings {
  std::string dependency_manifest = "requirements.txt";
  std::string install_command = "python3 -m pip install -q -r requirements.txt";
  std::chrono::seconds install_timeout{120};
  // Set to the project directory in the checked command's environment.
  // Empty disables the adjustment.
  std::string project_path_variable = "PYTHONPATH";
};

// Explicit, immutable configuration for one evaluation run. Built once at the
// CLI edge and passed into each component instead of reading ambient state.
struct EvalConfig {
  RemoteSettings remote;
  CodeRunSettings code_run;
  // Explicit window start (`YYYY-MM-DD HH:MM:SS`); unset means "now - 5 min".
  std::optional<std::string> eval_start_time;
  std::optional<std::string> eval_end_time;
  std::int64_t eval_duration_seconds = 0;
};

// Builds EvalConfig from FREEPLAY_* and EVAL_* variables.
//
// Contract:
// - true: `config` fully populated, `error` empty.
// - false: a present variable is malformed (e.g. non-integer duration).
bool LoadEvalConfig(const EnvLookup& env, EvalConfig& config, std::string& error);

// Parses a dotenv-style file into `entries`.
//
// Accepted lines: `KEY=VALUE`, optionally prefixed by `export `, with optional
// matching single or double quotes around VALUE. Blank lines and `#` comments
// are ignored. Returns false with a line-qualified `error` on anything else.
bool LoadEnvFile(const std::filesystem::path& path, std::map<std::string, std::string>& entries,
                 std::string& error);

} // namespace plugeval::core::config
