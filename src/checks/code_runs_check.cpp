#include "checks/code_runs_check.hpp"

#include "checks/process_runner.hpp"
#include "core/string_utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <system_error>

namespace plugeval::checks {

namespace json = core::json;
using core::schema::CheckKind;
using core::schema::CheckOutcome;
using core::schema::PassState;

namespace {

void InstallDependencies(const std::filesystem::path& project_dir,
                         const core::config::CodeRunSettings& settings) {
  if (settings.dependency_manifest.empty() || settings.install_command.empty()) {
    return;
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(project_dir / settings.dependency_manifest, ec)) {
    return;
  }

  ProcessRequest request;
  request.argv = core::SplitWhitespace(settings.install_command);
  request.working_dir = project_dir;
  request.timeout = settings.install_timeout;
  ProcessResult ignored_result;
  std::string ignored_error;
  // Best effort: a failed install surfaces as a failing project command.
  (void)RunProcess(request, ignored_result, ignored_error);
}

} // namespace

bool HasFailureIndicator(std::string_view stderr_text) {
  const std::string lowered = core::ToLowerAscii(stderr_text);
  for (const std::string_view indicator : kFailureIndicators) {
    if (lowered.find(indicator) != std::string::npos) {
      return true;
    }
  }
  return false;
}

CheckOutcome RunCodeRunsCheck(const std::filesystem::path& project_dir,
                              const scenarios::CodeRunsCriterion& criterion,
                              const core::config::CodeRunSettings& settings) {
  CheckOutcome outcome;
  outcome.kind = CheckKind::kCodeRuns;
  outcome.check_name = core::schema::ToString(CheckKind::kCodeRuns);
  outcome.details["command"] = json::MakeString(criterion.command);
  outcome.details["stdout"] = json::MakeString("");
  outcome.details["stderr"] = json::MakeString("");

  InstallDependencies(project_dir, settings);

  ProcessRequest request;
  request.argv = core::SplitWhitespace(criterion.command);
  request.working_dir = project_dir;
  const std::uint64_t timeout_seconds =
      std::min(criterion.timeout_seconds, kMaxCommandTimeoutSeconds);
  request.timeout = std::chrono::seconds(static_cast<std::int64_t>(timeout_seconds));
  if (!settings.project_path_variable.empty()) {
    request.env_overrides.emplace_back(settings.project_path_variable, project_dir.string());
  }

  ProcessResult result;
  std::string error;
  if (!RunProcess(request, result, error)) {
    outcome.error = error;
    return outcome;
  }
  if (result.timed_out) {
    outcome.error = "Command timed out after " + std::to_string(timeout_seconds) + "s";
    return outcome;
  }

  outcome.details["stdout"] =
      json::MakeString(core::TruncateCopy(result.stdout_text, kMaxCapturedOutputChars));
  outcome.details["stderr"] =
      json::MakeString(core::TruncateCopy(result.stderr_text, kMaxCapturedOutputChars));
  outcome.details["return_code"] = json::MakeNumber(result.exit_code);

  const bool suppressed_error = HasFailureIndicator(result.stderr_text);
  outcome.passed =
      (result.exit_code == 0 && !suppressed_error) ? PassState::kPassed : PassState::kFailed;
  if (suppressed_error && result.exit_code == 0) {
    outcome.warning = "Exit code 0 but stderr contains error indicators";
  }
  return outcome;
}

} // namespace plugeval::checks
