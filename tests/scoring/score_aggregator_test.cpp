#include "scoring/score_aggregator.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace schema = plugeval::core::schema;
namespace scenarios = plugeval::scenarios;
namespace scoring = plugeval::scoring;

namespace {

schema::CheckOutcome Outcome(schema::CheckKind kind, std::string method, schema::PassState state) {
  schema::CheckOutcome outcome;
  outcome.kind = kind;
  outcome.check_name = schema::ToString(kind);
  outcome.method = std::move(method);
  outcome.passed = state;
  return outcome;
}

scenarios::ScoringRubric Rubric(std::initializer_list<std::pair<const char*, std::int64_t>> items) {
  scenarios::ScoringRubric rubric;
  for (const auto& [name, points] : items) {
    rubric[name] = scenarios::RubricEntry{points};
  }
  return rubric;
}

} // namespace

TEST_CASE("Category lookup covers every executor and api method", "[scoring]") {
  using schema::CheckKind;
  REQUIRE(scoring::CategoryFor(CheckKind::kFileContains, "") == "code_modified");
  REQUIRE(scoring::CategoryFor(CheckKind::kCodeRuns, "") == "code_runs");
  REQUIRE(scoring::CategoryFor(CheckKind::kApiVerify, "search_completions") ==
          "completion_logged");
  REQUIRE(scoring::CategoryFor(CheckKind::kApiVerify, "check_prompt_exists") == "prompt_created");
  REQUIRE(scoring::CategoryFor(CheckKind::kApiVerify, "check_completion_has_prompt") ==
          "completion_has_prompt");
  REQUIRE(scoring::CategoryFor(CheckKind::kApiVerify, "check_prompt_has_variable") ==
          "prompt_has_variable");
  REQUIRE(scoring::CategoryFor(CheckKind::kApiVerify, "check_dataset_exists") ==
          "dataset_created");
  REQUIRE(scoring::CategoryFor(CheckKind::kApiVerify, "check_dataset_has_test_cases") ==
          "dataset_has_test_cases");
  REQUIRE(scoring::CategoryFor(CheckKind::kApiVerify, "check_test_run_exists") ==
          "test_run_created");
  REQUIRE(scoring::CategoryFor(CheckKind::kApiVerify, "check_test_run_has_sessions") ==
          "test_run_has_sessions");
  REQUIRE_FALSE(scoring::CategoryFor(CheckKind::kApiVerify, "nope").has_value());
  REQUIRE_FALSE(scoring::CategoryFor(CheckKind::kUnknown, "").has_value());
}

TEST_CASE("A single passing check earns full marks", "[scoring]") {
  const auto score = scoring::ComputeScore(
      Rubric({{"code_modified", 10}}),
      {Outcome(schema::CheckKind::kFileContains, "", schema::PassState::kPassed)});
  REQUIRE(score.total == 10);
  REQUIRE(score.max_total == 10);
  REQUIRE(score.percentage == 100.0);
  REQUIRE(score.categories.at("code_modified").Passed());
}

TEST_CASE("Skipped checks keep their reason and score zero", "[scoring]") {
  schema::CheckOutcome skipped =
      Outcome(schema::CheckKind::kApiVerify, "check_prompt_exists", schema::PassState::kUnknown);
  skipped.reason = "no credentials";

  const auto score = scoring::ComputeScore(
      Rubric({{"code_runs", 20}, {"prompt_created", 20}}),
      {Outcome(schema::CheckKind::kCodeRuns, "", schema::PassState::kPassed), skipped});
  REQUIRE(score.total == 20);
  REQUIRE(score.max_total == 40);
  REQUIRE(score.percentage == 50.0);
  const auto& category = score.categories.at("prompt_created");
  REQUIRE(category.Skipped());
  REQUIRE(category.points == 0);
  REQUIRE(category.max_points == 20);
  REQUIRE(category.reason == std::optional<std::string>("no credentials"));
}

TEST_CASE("The later outcome wins a shared category", "[scoring]") {
  const auto score = scoring::ComputeScore(
      Rubric({{"code_modified", 10}}),
      {Outcome(schema::CheckKind::kFileContains, "", schema::PassState::kPassed),
       Outcome(schema::CheckKind::kFileContains, "", schema::PassState::kFailed)});
  REQUIRE(score.total == 0);
  REQUIRE(score.max_total == 10);
  REQUIRE_FALSE(score.categories.at("code_modified").Passed());
}

TEST_CASE("Outcomes without a rubric entry are not scored", "[scoring]") {
  const auto score = scoring::ComputeScore(
      Rubric({}), {Outcome(schema::CheckKind::kCodeRuns, "", schema::PassState::kPassed),
                   Outcome(schema::CheckKind::kUnknown, "", schema::PassState::kFailed)});
  REQUIRE(score.categories.empty());
  REQUIRE(score.total == 0);
  REQUIRE(score.max_total == 0);
  REQUIRE(score.percentage == 0.0);
}

TEST_CASE("Percentage rounds to one decimal", "[scoring]") {
  const auto score = scoring::ComputeScore(
      Rubric({{"code_modified", 10}, {"code_runs", 20}}),
      {Outcome(schema::CheckKind::kFileContains, "", schema::PassState::kPassed),
       Outcome(schema::CheckKind::kCodeRuns, "", schema::PassState::kFailed)});
  REQUIRE(score.total == 10);
  REQUIRE(score.percentage == 33.3);
}
