#include "scoring/score_aggregator.hpp"

#include "core/string_utils.hpp"

#include <array>
#include <string>

namespace plugeval::scoring {

using core::schema::CategoryScore;
using core::schema::CheckKind;
using core::schema::CheckOutcome;
using core::schema::PassState;
using core::schema::ScoreResult;

namespace {

struct ApiCategory {
  std::string_view method;
  std::string_view category;
};

constexpr std::array<ApiCategory, 8> kApiCategories = {{
    {"search_completions", "completion_logged"},
    {"check_prompt_exists", "prompt_created"},
    {"check_completion_has_prompt", "completion_has_prompt"},
    {"check_prompt_has_variable", "prompt_has_variable"},
    {"check_dataset_exists", "dataset_created"},
    {"check_dataset_has_test_cases", "dataset_has_test_cases"},
    {"check_test_run_exists", "test_run_created"},
    {"check_test_run_has_sessions", "test_run_has_sessions"},
}};

} // namespace

std::optional<std::string_view> CategoryFor(CheckKind kind, std::string_view method) {
  switch (kind) {
  case CheckKind::kFileContains:
    return std::string_view("code_modified");
  case CheckKind::kCodeRuns:
    return std::string_view("code_runs");
  case CheckKind::kApiVerify:
    for (const auto& entry : kApiCategories) {
      if (entry.method == method) {
        return entry.category;
      }
    }
    return std::nullopt;
  case CheckKind::kUnknown:
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<std::string_view> CategoryFor(const CheckOutcome& outcome) {
  return CategoryFor(outcome.kind, outcome.method);
}

ScoreResult ComputeScore(const scenarios::ScoringRubric& rubric,
                         const std::vector<CheckOutcome>& outcomes) {
  ScoreResult score;
  for (const auto& outcome : outcomes) {
    const std::optional<std::string_view> category = CategoryFor(outcome);
    if (!category.has_value()) {
      continue;
    }
    const auto rubric_it = rubric.find(std::string(*category));
    if (rubric_it == rubric.end()) {
      continue;
    }

    CategoryScore entry;
    entry.max_points = rubric_it->second.points;
    if (outcome.Skipped()) {
      entry.passed = PassState::kUnknown;
      entry.reason = outcome.reason;
      entry.points = 0;
    } else {
      entry.passed = outcome.Passed() ? PassState::kPassed : PassState::kFailed;
      entry.points = outcome.Passed() ? entry.max_points : 0;
    }
    score.categories[rubric_it->first] = std::move(entry);
  }

  for (const auto& [name, entry] : score.categories) {
    score.total += entry.points;
    score.max_total += entry.max_points;
  }
  if (score.max_total > 0) {
    score.percentage = core::RoundToOneDecimal(static_cast<double>(score.total) /
                                               static_cast<double>(score.max_total) * 100.0);
  }
  return score;
}

} // namespace plugeval::scoring
