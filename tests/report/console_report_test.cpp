#include "report/console_report.hpp"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>

namespace schema = plugeval::core::schema;
namespace report = plugeval::report;

namespace {

void RequireContains(const std::string& text, const std::string& needle) {
  INFO(text);
  REQUIRE(text.find(needle) != std::string::npos);
}

} // namespace

TEST_CASE("FormatDuration switches to minutes at sixty seconds", "[report]") {
  REQUIRE(report::FormatDuration(0) == "0s");
  REQUIRE(report::FormatDuration(59) == "59s");
  REQUIRE(report::FormatDuration(60) == "1m 0s");
  REQUIRE(report::FormatDuration(125) == "2m 5s");
}

TEST_CASE("FormatVerdict reflects the sign of the point delta", "[report]") {
  schema::ComparisonSummary summary;
  summary.delta = 20;
  summary.percentage_delta = 20.0;
  summary.verdict = schema::Verdict::kImproved;
  REQUIRE(report::FormatVerdict(summary) == "Plugin IMPROVED score by 20 points (+20.0%)");

  summary.delta = -15;
  summary.percentage_delta = -15.0;
  summary.verdict = schema::Verdict::kReduced;
  REQUIRE(report::FormatVerdict(summary) == "Plugin REDUCED score by 15 points (-15.0%)");

  summary.delta = 0;
  summary.percentage_delta = 0.0;
  summary.verdict = schema::Verdict::kUnchanged;
  REQUIRE(report::FormatVerdict(summary) == "No change in score");
}

TEST_CASE("Verify report lists markers, missing patterns and totals", "[report]") {
  schema::ResultDocument document;
  document.timing.duration_seconds = 95;

  schema::CheckOutcome file_check;
  file_check.kind = schema::CheckKind::kFileContains;
  file_check.check_name = "file_contains";
  file_check.description = "Freeplay SDK imported";
  file_check.details["missing"] = plugeval::core::json::MakeStringArray({"freeplay", "gpt"});
  document.checks.push_back(file_check);

  schema::CheckOutcome skipped;
  skipped.kind = schema::CheckKind::kApiVerify;
  skipped.check_name = "api_verify";
  skipped.method = "search_completions";
  skipped.description = "Completion logged";
  skipped.passed = schema::PassState::kUnknown;
  skipped.reason = "no credentials";
  document.checks.push_back(skipped);

  schema::CategoryScore category;
  category.max_points = 10;
  document.score.categories["code_modified"] = category;
  document.score.max_total = 10;

  std::ostringstream out;
  report::PrintVerifyReport(document, out);
  const std::string text = out.str();
  RequireContains(text, "\xE2\x9C\x97 Freeplay SDK imported");
  RequireContains(text, "  Missing patterns: freeplay, gpt");
  RequireContains(text, "\xE2\x8A\x98 Completion logged");
  RequireContains(text, "  Skipped: no credentials");
  RequireContains(text, "=== Score ===");
  RequireContains(text, "code_modified: 0/10");
  RequireContains(text, "Total: 0/10 (0.0%)");
  RequireContains(text, "Duration: 1m 35s");
}

TEST_CASE("Comparison report prints sections and the verdict", "[report]") {
  schema::ComparisonReport comparison;
  comparison.scenario = "integration-with-prompt";
  comparison.improvements.push_back(schema::CategoryDelta{"prompt_created", 0, 20, 20});
  schema::UnchangedCategory skipped;
  skipped.category = "completion_logged";
  skipped.status = "skipped";
  comparison.unchanged.push_back(skipped);
  comparison.summary.baseline_total = 30;
  comparison.summary.plugin_total = 50;
  comparison.summary.delta = 20;
  comparison.summary.baseline_percentage = 30.0;
  comparison.summary.plugin_percentage = 50.0;
  comparison.summary.percentage_delta = 20.0;
  comparison.summary.verdict = schema::Verdict::kImproved;

  std::ostringstream out;
  report::PrintComparisonReport(comparison, out);
  const std::string text = out.str();
  RequireContains(text, "EVALUATION COMPARISON: integration-with-prompt");
  RequireContains(text, std::string(60, '='));
  RequireContains(text, "OVERALL SCORES");
  RequireContains(text, "IMPROVEMENTS (Plugin passed where baseline failed)");
  RequireContains(text, "prompt_created: 0 \xE2\x86\x92 20 (+20)");
  RequireContains(text, "= UNCHANGED");
  RequireContains(text, "completion_logged: skipped (unknown reason)");
  RequireContains(text, "VERDICT: Plugin IMPROVED score by 20 points (+20.0%)");
  REQUIRE(text.find("REGRESSIONS") == std::string::npos);
}
