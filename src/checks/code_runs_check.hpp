#pragma once

#include "core/config/eval_config.hpp"
#include "core/schema/result_contract.hpp"
#include "scenarios/model.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>

namespace plugeval::checks {

// Lowercase stderr substrings that fail a run even when it exits 0. Project
// code that catches and logs its own exceptions still trips this, and so does
// benign log text mentioning these words.
inline constexpr std::array<std::string_view, 4> kFailureIndicators = {
    "error",
    "exception",
    "traceback",
    "failed",
};

inline constexpr std::size_t kMaxCapturedOutputChars = 2000;

// Upper bound on a command's wall-clock budget. Larger scenario values are
// clamped so the deadline arithmetic stays in range.
inline constexpr std::uint64_t kMaxCommandTimeoutSeconds = 24U * 60U * 60U;

// Runs `criterion.command` (split on whitespace) inside `project_dir`.
//
// When the project ships the configured dependency manifest, the install
// command runs first; its result is ignored. The check passes iff the command
// exits 0 and its stderr carries no failure indicator. Timeouts and launch
// failures are reported in `error`. The timeout is clamped to
// kMaxCommandTimeoutSeconds.
core::schema::CheckOutcome RunCodeRunsCheck(const std::filesystem::path& project_dir,
                                            const scenarios::CodeRunsCriterion& criterion,
                                            const core::config::CodeRunSettings& settings);

// True when lowercase `stderr_text` contains any failure indicator.
bool HasFailureIndicator(std::string_view stderr_text);

} // namespace plugeval::checks
