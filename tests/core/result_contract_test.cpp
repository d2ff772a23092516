#include "core/schema/result_contract.hpp"

#include <catch2/catch.hpp>

#include <string>

namespace schema = plugeval::core::schema;
namespace json = plugeval::core::json;

namespace {

void RequireContains(const std::string& text, const std::string& needle) {
  REQUIRE(text.find(needle) != std::string::npos);
}

} // namespace

TEST_CASE("Skipped outcomes serialize passed as null with a reason", "[core][schema][json]") {
  schema::CheckOutcome outcome;
  outcome.kind = schema::CheckKind::kApiVerify;
  outcome.check_name = "api_verify";
  outcome.method = "search_completions";
  outcome.description = "Completion logged";
  outcome.passed = schema::PassState::kUnknown;
  outcome.reason = "FREEPLAY_API_KEY or FREEPLAY_PROJECT_ID not set";

  const std::string text = json::Serialize(schema::ToJsonValue(outcome), 0);
  RequireContains(text, "\"passed\":null");
  RequireContains(text, "\"skipped\":true");
  RequireContains(text, "\"method\":\"search_completions\"");
  RequireContains(text, "\"reason\":\"FREEPLAY_API_KEY or FREEPLAY_PROJECT_ID not set\"");
}

TEST_CASE("Common outcome fields override colliding detail keys", "[core][schema][json]") {
  schema::CheckOutcome outcome;
  outcome.kind = schema::CheckKind::kFileContains;
  outcome.check_name = "file_contains";
  outcome.passed = schema::PassState::kPassed;
  outcome.details["passed"] = json::MakeString("bogus");
  outcome.details["file"] = json::MakeString("main.py");

  const json::Value value = schema::ToJsonValue(outcome);
  REQUIRE(json::GetBool(value, "passed") == std::optional<bool>(true));
  REQUIRE(json::GetString(value, "file") == std::optional<std::string>("main.py"));
  REQUIRE(value.Find("method") == nullptr);
}

TEST_CASE("Result documents survive a write and read cycle", "[core][schema][json]") {
  schema::ResultDocument document;
  document.scenario = "integration-with-prompt";
  document.mode = "baseline";
  document.timestamp = "2024-01-15T10:30:00Z";
  document.project_dir = "/tmp/project";
  document.timing.start_time = "2024-01-15 10:25:00";
  document.timing.duration_seconds = 95;

  schema::CheckOutcome skipped;
  skipped.kind = schema::CheckKind::kApiVerify;
  skipped.check_name = "api_verify";
  skipped.method = "check_prompt_exists";
  skipped.passed = schema::PassState::kUnknown;
  skipped.reason = "no credentials";
  document.checks.push_back(skipped);

  schema::CategoryScore category;
  category.passed = schema::PassState::kUnknown;
  category.reason = "no credentials";
  category.max_points = 20;
  document.score.categories["prompt_created"] = category;
  document.score.max_total = 20;

  const std::string text = schema::ToJson(document);
  REQUIRE(text.back() == '\n');

  schema::ResultDocument parsed;
  std::string error;
  REQUIRE(schema::ParseResultDocumentText(text, parsed, error));
  REQUIRE(parsed.scenario == "integration-with-prompt");
  REQUIRE(parsed.timing.start_time == std::optional<std::string>("2024-01-15 10:25:00"));
  REQUIRE_FALSE(parsed.timing.end_time.has_value());
  REQUIRE(parsed.timing.duration_seconds == 95);
  REQUIRE(parsed.checks.size() == 1U);
  REQUIRE(parsed.checks.front().Skipped());
  REQUIRE(parsed.checks.front().kind == schema::CheckKind::kApiVerify);
  REQUIRE(parsed.checks.front().method == "check_prompt_exists");
  REQUIRE(parsed.score.categories.at("prompt_created").Skipped());
  REQUIRE(parsed.score.categories.at("prompt_created").max_points == 20);
  REQUIRE(schema::ToJson(parsed) == text);
}

TEST_CASE("Result document reader is lenient about absent members", "[core][schema][json]") {
  schema::ResultDocument parsed;
  std::string error;
  REQUIRE(schema::ParseResultDocumentText(R"({"scenario":"x"})", parsed, error));
  REQUIRE(parsed.scenario == "x");
  REQUIRE(parsed.checks.empty());
  REQUIRE(parsed.score.total == 0);

  REQUIRE_FALSE(schema::ParseResultDocumentText("[1,2]", parsed, error));
  REQUIRE_FALSE(schema::ParseResultDocumentText(R"({"checks":{}})", parsed, error));
}
