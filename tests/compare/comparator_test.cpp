#include "compare/comparator.hpp"

#include <catch2/catch.hpp>

#include <string>

namespace schema = plugeval::core::schema;
namespace compare = plugeval::compare;

namespace {

schema::CategoryScore Category(schema::PassState state, std::int64_t points,
                               std::int64_t max_points) {
  schema::CategoryScore category;
  category.passed = state;
  category.points = points;
  category.max_points = max_points;
  return category;
}

schema::ResultDocument Document(const std::string& mode) {
  schema::ResultDocument document;
  document.scenario = "integration-with-prompt";
  document.mode = mode;
  document.timestamp = "2024-01-15T10:30:00Z";
  return document;
}

void Finalize(schema::ResultDocument& document) {
  document.score.total = 0;
  document.score.max_total = 0;
  for (const auto& [name, category] : document.score.categories) {
    document.score.total += category.points;
    document.score.max_total += category.max_points;
  }
  document.score.percentage =
      document.score.max_total == 0
          ? 0.0
          : static_cast<double>(document.score.total) / document.score.max_total * 100.0;
}

} // namespace

TEST_CASE("A category flipping to passed is an improvement worth its points", "[compare]") {
  schema::ResultDocument baseline = Document("baseline");
  baseline.score.categories["code_runs"] = Category(schema::PassState::kPassed, 20, 20);
  baseline.score.categories["prompt_created"] = Category(schema::PassState::kFailed, 0, 20);
  Finalize(baseline);

  schema::ResultDocument with_plugin = Document("with-plugin");
  with_plugin.score.categories["code_runs"] = Category(schema::PassState::kPassed, 20, 20);
  with_plugin.score.categories["prompt_created"] = Category(schema::PassState::kPassed, 20, 20);
  Finalize(with_plugin);

  const schema::ComparisonReport report = compare::Compare(baseline, with_plugin);
  REQUIRE(report.improvements.size() == 1U);
  REQUIRE(report.improvements.front().category == "prompt_created");
  REQUIRE(report.improvements.front().delta == 20);
  REQUIRE(report.regressions.empty());
  REQUIRE(report.unchanged.size() == 1U);
  REQUIRE(report.unchanged.front().status == "passed");
  REQUIRE(report.unchanged.front().points == 20);
  REQUIRE(report.summary.delta == 20);
  REQUIRE(report.summary.percentage_delta == 50.0);
  REQUIRE(report.summary.verdict == schema::Verdict::kImproved);
  REQUIRE(report.baseline.mode == "baseline");
  REQUIRE(report.with_plugin.mode == "with-plugin");
}

TEST_CASE("Passed to failed is a regression with a negative delta", "[compare]") {
  schema::ResultDocument baseline = Document("baseline");
  baseline.score.categories["code_runs"] = Category(schema::PassState::kPassed, 20, 20);
  Finalize(baseline);
  schema::ResultDocument with_plugin = Document("with-plugin");
  with_plugin.score.categories["code_runs"] = Category(schema::PassState::kFailed, 0, 20);
  Finalize(with_plugin);

  const schema::ComparisonReport report = compare::Compare(baseline, with_plugin);
  REQUIRE(report.regressions.size() == 1U);
  REQUIRE(report.regressions.front().delta == -20);
  REQUIRE(report.summary.verdict == schema::Verdict::kReduced);
}

TEST_CASE("Skips on either side are reported unchanged", "[compare]") {
  schema::ResultDocument baseline = Document("baseline");
  schema::CategoryScore skipped = Category(schema::PassState::kUnknown, 0, 20);
  skipped.reason = "baseline reason";
  baseline.score.categories["completion_logged"] = skipped;
  baseline.score.categories["prompt_created"] = Category(schema::PassState::kFailed, 0, 20);
  Finalize(baseline);

  schema::ResultDocument with_plugin = Document("with-plugin");
  with_plugin.score.categories["completion_logged"] = Category(schema::PassState::kPassed, 20, 20);
  schema::CategoryScore plugin_skipped = Category(schema::PassState::kUnknown, 0, 20);
  plugin_skipped.reason = "plugin reason";
  with_plugin.score.categories["prompt_created"] = plugin_skipped;
  Finalize(with_plugin);

  const schema::ComparisonReport report = compare::Compare(baseline, with_plugin);
  REQUIRE(report.improvements.empty());
  REQUIRE(report.regressions.empty());
  REQUIRE(report.unchanged.size() == 2U);
  REQUIRE(report.unchanged[0].category == "completion_logged");
  REQUIRE(report.unchanged[0].status == "skipped");
  REQUIRE(report.unchanged[0].reason == std::optional<std::string>("baseline reason"));
  REQUIRE(report.unchanged[1].category == "prompt_created");
  REQUIRE(report.unchanged[1].reason == std::optional<std::string>("plugin reason"));
}

TEST_CASE("A category present on one side only counts as failed on the other", "[compare]") {
  schema::ResultDocument baseline = Document("baseline");
  Finalize(baseline);
  schema::ResultDocument with_plugin = Document("with-plugin");
  with_plugin.score.categories["dataset_created"] = Category(schema::PassState::kPassed, 15, 15);
  Finalize(with_plugin);

  const schema::ComparisonReport report = compare::Compare(baseline, with_plugin);
  REQUIRE(report.improvements.size() == 1U);
  REQUIRE(report.improvements.front().baseline_points == 0);
  REQUIRE(report.improvements.front().with_plugin_points == 15);

  const schema::ComparisonReport reverse = compare::Compare(with_plugin, baseline);
  REQUIRE(reverse.regressions.size() == 1U);
  REQUIRE(reverse.regressions.front().delta == -15);
}

TEST_CASE("Equal totals produce an unchanged verdict", "[compare]") {
  schema::ResultDocument baseline = Document("baseline");
  baseline.score.categories["code_runs"] = Category(schema::PassState::kFailed, 0, 20);
  Finalize(baseline);

  const schema::ComparisonReport report = compare::Compare(baseline, baseline);
  REQUIRE(report.summary.delta == 0);
  REQUIRE(report.summary.verdict == schema::Verdict::kUnchanged);
  REQUIRE(report.unchanged.front().status == "failed");
}

TEST_CASE("Comparison output is identical across repeated runs", "[compare]") {
  schema::ResultDocument baseline = Document("baseline");
  schema::ResultDocument with_plugin = Document("with-plugin");
  for (const char* name : {"zeta", "alpha", "mid"}) {
    baseline.score.categories[name] = Category(schema::PassState::kFailed, 0, 10);
    with_plugin.score.categories[name] = Category(schema::PassState::kPassed, 10, 10);
  }
  Finalize(baseline);
  Finalize(with_plugin);

  const std::string first = schema::ToJson(compare::Compare(baseline, with_plugin));
  const std::string second = schema::ToJson(compare::Compare(baseline, with_plugin));
  REQUIRE(first == second);
  REQUIRE(first.find("\"alpha\"") < first.find("\"mid\""));
  REQUIRE(first.find("\"mid\"") < first.find("\"zeta\""));
}
