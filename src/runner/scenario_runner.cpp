#include "runner/scenario_runner.hpp"

#include "checks/api_verify_check.hpp"
#include "checks/code_runs_check.hpp"
#include "checks/file_contains_check.hpp"
#include "core/time_utils.hpp"
#include "scoring/score_aggregator.hpp"

#include <exception>
#include <type_traits>
#include <variant>

namespace plugeval::runner {

namespace schema = core::schema;

namespace {

schema::CheckOutcome UnknownCheckOutcome(const scenarios::UnknownCriterion& criterion) {
  schema::CheckOutcome outcome;
  outcome.kind = schema::CheckKind::kUnknown;
  outcome.check_name = criterion.type;
  outcome.error = "Unknown check type: " + criterion.type;
  return outcome;
}

// Identity fields for an outcome whose executor threw before returning one.
schema::CheckOutcome FaultOutcome(const scenarios::CriterionParams& params,
                                  const std::string& message) {
  schema::CheckOutcome outcome;
  std::visit(
      [&outcome](const auto& criterion) {
        using T = std::decay_t<decltype(criterion)>;
        if constexpr (std::is_same_v<T, scenarios::FileContainsCriterion>) {
          outcome.kind = schema::CheckKind::kFileContains;
        } else if constexpr (std::is_same_v<T, scenarios::CodeRunsCriterion>) {
          outcome.kind = schema::CheckKind::kCodeRuns;
        } else if constexpr (std::is_same_v<T, scenarios::ApiVerifyCriterion>) {
          outcome.kind = schema::CheckKind::kApiVerify;
          outcome.method = criterion.method;
        } else {
          outcome.kind = schema::CheckKind::kUnknown;
          outcome.check_name = criterion.type;
        }
      },
      params);
  if (outcome.kind != schema::CheckKind::kUnknown) {
    outcome.check_name = schema::ToString(outcome.kind);
  }
  outcome.error = message;
  return outcome;
}

} // namespace

ScenarioRunner::ScenarioRunner(const core::config::EvalConfig& config,
                               remote::IRecordClient& client, core::logging::Logger& logger)
    : config_(config), client_(client), logger_(logger) {}

schema::ResultDocument ScenarioRunner::Run(const scenarios::Scenario& scenario,
                                           const std::filesystem::path& project_dir,
                                           const std::string& mode,
                                           std::chrono::system_clock::time_point now) {
  schema::ResultDocument document;
  document.scenario = scenario.name;
  document.mode = mode;
  document.timestamp = core::FormatUtcTimestamp(now);
  document.project_dir = project_dir.string();
  document.timing.start_time = config_.eval_start_time;
  document.timing.end_time = config_.eval_end_time;
  document.timing.duration_seconds = config_.eval_duration_seconds;

  checks::ApiVerifier api_verifier(config_, client_, now);

  document.checks.reserve(scenario.criteria.size());
  for (std::size_t i = 0; i < scenario.criteria.size(); ++i) {
    const scenarios::SuccessCriterion& criterion = scenario.criteria[i];
    const std::string index = std::to_string(i);
    logger_.Debug("check started", {{"index", index}, {"description", criterion.description}});

    schema::CheckOutcome outcome;
    try {
      outcome = std::visit(
          [&](const auto& params) -> schema::CheckOutcome {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, scenarios::FileContainsCriterion>) {
              return checks::RunFileContainsCheck(project_dir, params);
            } else if constexpr (std::is_same_v<T, scenarios::CodeRunsCriterion>) {
              return checks::RunCodeRunsCheck(project_dir, params, config_.code_run);
            } else if constexpr (std::is_same_v<T, scenarios::ApiVerifyCriterion>) {
              return api_verifier.Run(params);
            } else {
              return UnknownCheckOutcome(params);
            }
          },
          criterion.params);
    } catch (const std::exception& ex) {
      outcome = FaultOutcome(criterion.params, ex.what());
    }
    outcome.description = criterion.description;

    logger_.Debug("check finished",
                  {{"index", index},
                   {"check", outcome.check_name},
                   {"method", outcome.method},
                   {"passed", schema::ToString(outcome.passed)},
                   {"error", outcome.error.value_or("")}});
    if (outcome.error.has_value()) {
      logger_.Warn("check reported error",
                   {{"index", index}, {"check", outcome.check_name}, {"error", *outcome.error}});
    }
    document.checks.push_back(std::move(outcome));
  }

  document.score = scoring::ComputeScore(scenario.scoring, document.checks);
  return document;
}

bool AllCriteriaSatisfied(const schema::ResultDocument& document) {
  for (const auto& check : document.checks) {
    if (!check.Passed() && !check.Skipped()) {
      return false;
    }
  }
  return true;
}

} // namespace plugeval::runner
