#pragma once

#include "core/config/eval_config.hpp"
#include "core/schema/result_contract.hpp"
#include "reconcile/timestamp_reconciler.hpp"
#include "remote/record_client.hpp"
#include "scenarios/model.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace plugeval::checks {

inline constexpr std::string_view kMissingCredentialsReason =
    "FREEPLAY_API_KEY or FREEPLAY_PROJECT_ID not set";

bool IsKnownApiVerifyMethod(std::string_view method);

// `a|b|c` list of supported methods for usage and validation messages.
std::string ExpectedApiVerifyMethodList();

// Executes `api_verify` criteria against the remote platform.
//
// Every call returns a well-formed outcome:
// - missing credentials: skipped (kUnknown) with kMissingCredentialsReason.
// - remote failures: `error` plus `api_reachable`, `error_kind` and
//   `status_code` details.
// - unknown method: error outcome, checked before credentials.
//
// The window boundary is resolved per call from the configured start time, or
// from `now` minus five minutes, so every check in one run shares it.
class ApiVerifier {
public:
  ApiVerifier(const core::config::EvalConfig& config, remote::IRecordClient& client,
              std::chrono::system_clock::time_point now);

  core::schema::CheckOutcome Run(const scenarios::ApiVerifyCriterion& criterion);

  static bool Supports(std::string_view method);

private:
  using Method = void (ApiVerifier::*)(const scenarios::ApiVerifyCriterion&,
                                       core::schema::CheckOutcome&);

  static Method FindMethod(std::string_view name);

  bool ResolveBoundary(core::schema::CheckOutcome& outcome, reconcile::WindowBoundary& boundary);
  bool FetchRecentCompletions(core::schema::CheckOutcome& outcome, remote::ApiResponse& response,
                              reconcile::ReconciledSet& recent);
  bool FetchRecentTestRuns(core::schema::CheckOutcome& outcome, remote::ApiResponse& response,
                           reconcile::ReconciledSet& recent);

  void SearchCompletions(const scenarios::ApiVerifyCriterion& criterion,
                         core::schema::CheckOutcome& outcome);
  void CheckPromptExists(const scenarios::ApiVerifyCriterion& criterion,
                         core::schema::CheckOutcome& outcome);
  void CheckCompletionHasPrompt(const scenarios::ApiVerifyCriterion& criterion,
                                core::schema::CheckOutcome& outcome);
  void CheckPromptHasVariable(const scenarios::ApiVerifyCriterion& criterion,
                              core::schema::CheckOutcome& outcome);
  void CheckDatasetExists(const scenarios::ApiVerifyCriterion& criterion,
                          core::schema::CheckOutcome& outcome);
  void CheckDatasetHasTestCases(const scenarios::ApiVerifyCriterion& criterion,
                                core::schema::CheckOutcome& outcome);
  void CheckTestRunExists(const scenarios::ApiVerifyCriterion& criterion,
                          core::schema::CheckOutcome& outcome);
  void CheckTestRunHasSessions(const scenarios::ApiVerifyCriterion& criterion,
                               core::schema::CheckOutcome& outcome);

  const core::config::EvalConfig& config_;
  remote::IRecordClient& client_;
  std::chrono::system_clock::time_point now_;
};

} // namespace plugeval::checks
