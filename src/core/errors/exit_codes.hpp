#pragma once

namespace plugeval::core::errors {

// Process-exit contract for the verify/compare entry points.
//
// - 0 success (verify: every criterion passed or was skipped)
// - 1 unmet criteria or unreadable inputs after a valid invocation
// - 2 usage/argument failure
// - 10 scenario definition missing or malformed
// - 11 environment configuration malformed
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kScenarioInvalid = 10,
  kConfigInvalid = 11,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace plugeval::core::errors
