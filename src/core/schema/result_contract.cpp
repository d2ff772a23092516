#include "core/schema/result_contract.hpp"

#include "core/fs_utils.hpp"

#include <cmath>
#include <limits>

namespace plugeval::core::schema {

namespace {

using json::Value;

Value PassStateValue(PassState state) {
  switch (state) {
  case PassState::kPassed:
    return json::MakeBool(true);
  case PassState::kFailed:
    return json::MakeBool(false);
  case PassState::kUnknown:
    return json::MakeNull();
  }
  return json::MakeNull();
}

Value OptionalStringValue(const std::optional<std::string>& text) {
  if (!text.has_value()) {
    return json::MakeNull();
  }
  return json::MakeString(*text);
}

Value IntegerValue(std::int64_t number) {
  return json::MakeNumber(static_cast<double>(number));
}

std::int64_t ReadInteger(const Value& object, std::string_view key, std::int64_t fallback) {
  const std::optional<double> number = json::GetNumber(object, key);
  if (!number.has_value()) {
    return fallback;
  }
  const double floored = std::floor(*number);
  if (floored < static_cast<double>(std::numeric_limits<std::int64_t>::min()) ||
      floored > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return fallback;
  }
  return static_cast<std::int64_t>(floored);
}

// `passed` may be true, false or null; an explicit `skipped: true` wins.
PassState ReadPassState(const Value& object) {
  if (json::GetBool(object, "skipped").value_or(false)) {
    return PassState::kUnknown;
  }
  const Value* passed = object.Find("passed");
  if (passed == nullptr || !passed->IsBool()) {
    return passed != nullptr && passed->IsNull() ? PassState::kUnknown : PassState::kFailed;
  }
  return passed->bool_value ? PassState::kPassed : PassState::kFailed;
}

Value CategoryScoreValue(const CategoryScore& category) {
  Value value = json::MakeObject();
  value.Set("passed", PassStateValue(category.passed));
  if (category.Skipped()) {
    value.Set("skipped", json::MakeBool(true));
    value.Set("reason", OptionalStringValue(category.reason));
  }
  value.Set("points", IntegerValue(category.points));
  value.Set("max_points", IntegerValue(category.max_points));
  return value;
}

Value ComparisonSideValue(const ComparisonSide& side) {
  Value value = json::MakeObject();
  value.Set("mode", json::MakeString(side.mode));
  value.Set("timestamp", json::MakeString(side.timestamp));
  value.Set("score", ToJsonValue(side.score));
  return value;
}

Value CategoryDeltaValue(const CategoryDelta& delta) {
  Value value = json::MakeObject();
  value.Set("category", json::MakeString(delta.category));
  value.Set("baseline", IntegerValue(delta.baseline_points));
  value.Set("with_plugin", IntegerValue(delta.with_plugin_points));
  value.Set("delta", IntegerValue(delta.delta));
  return value;
}

Value UnchangedCategoryValue(const UnchangedCategory& entry) {
  Value value = json::MakeObject();
  value.Set("category", json::MakeString(entry.category));
  value.Set("status", json::MakeString(entry.status));
  if (entry.status == "skipped") {
    value.Set("reason", OptionalStringValue(entry.reason));
  } else {
    value.Set("points", IntegerValue(entry.points));
  }
  return value;
}

} // namespace

const char* ToString(PassState state) {
  switch (state) {
  case PassState::kFailed:
    return "failed";
  case PassState::kPassed:
    return "passed";
  case PassState::kUnknown:
    return "skipped";
  }
  return "failed";
}

const char* ToString(CheckKind kind) {
  switch (kind) {
  case CheckKind::kFileContains:
    return "file_contains";
  case CheckKind::kCodeRuns:
    return "code_runs";
  case CheckKind::kApiVerify:
    return "api_verify";
  case CheckKind::kUnknown:
    return "unknown";
  }
  return "unknown";
}

std::optional<CheckKind> ParseCheckKind(std::string_view name) {
  if (name == "file_contains") {
    return CheckKind::kFileContains;
  }
  if (name == "code_runs") {
    return CheckKind::kCodeRuns;
  }
  if (name == "api_verify") {
    return CheckKind::kApiVerify;
  }
  return std::nullopt;
}

const char* ToString(Verdict verdict) {
  switch (verdict) {
  case Verdict::kImproved:
    return "improved";
  case Verdict::kReduced:
    return "reduced";
  case Verdict::kUnchanged:
    return "unchanged";
  }
  return "unchanged";
}

Value ToJsonValue(const CheckOutcome& outcome) {
  Value value = json::MakeObject();
  // Kind-specific fields first so the common fields below always win.
  for (const auto& [key, detail] : outcome.details) {
    value.Set(key, detail);
  }

  value.Set("check", json::MakeString(outcome.check_name.empty() ? ToString(outcome.kind)
                                                                 : outcome.check_name));
  if (outcome.kind == CheckKind::kApiVerify || !outcome.method.empty()) {
    value.Set("method", json::MakeString(outcome.method));
  }
  value.Set("description", json::MakeString(outcome.description));
  value.Set("passed", PassStateValue(outcome.passed));
  if (outcome.Skipped()) {
    value.Set("skipped", json::MakeBool(true));
  }
  if (outcome.reason.has_value()) {
    value.Set("reason", json::MakeString(*outcome.reason));
  }
  if (outcome.error.has_value()) {
    value.Set("error", json::MakeString(*outcome.error));
  }
  if (outcome.warning.has_value()) {
    value.Set("warning", json::MakeString(*outcome.warning));
  }
  return value;
}

Value ToJsonValue(const ScoreResult& score) {
  Value categories = json::MakeObject();
  for (const auto& [name, category] : score.categories) {
    categories.Set(name, CategoryScoreValue(category));
  }

  Value value = json::MakeObject();
  value.Set("categories", std::move(categories));
  value.Set("total", IntegerValue(score.total));
  value.Set("max_total", IntegerValue(score.max_total));
  value.Set("percentage", json::MakeNumber(score.percentage));
  return value;
}

Value ToJsonValue(const ResultDocument& document) {
  Value checks = json::MakeArray();
  for (const auto& outcome : document.checks) {
    checks.Push(ToJsonValue(outcome));
  }

  Value timing = json::MakeObject();
  timing.Set("start_time", OptionalStringValue(document.timing.start_time));
  timing.Set("end_time", OptionalStringValue(document.timing.end_time));
  timing.Set("duration_seconds", IntegerValue(document.timing.duration_seconds));

  Value value = json::MakeObject();
  value.Set("scenario", json::MakeString(document.scenario));
  value.Set("mode", json::MakeString(document.mode));
  value.Set("timestamp", json::MakeString(document.timestamp));
  value.Set("project_dir", json::MakeString(document.project_dir));
  value.Set("timing", std::move(timing));
  value.Set("checks", std::move(checks));
  value.Set("score", ToJsonValue(document.score));
  return value;
}

Value ToJsonValue(const ComparisonReport& report) {
  Value improvements = json::MakeArray();
  for (const auto& delta : report.improvements) {
    improvements.Push(CategoryDeltaValue(delta));
  }
  Value regressions = json::MakeArray();
  for (const auto& delta : report.regressions) {
    regressions.Push(CategoryDeltaValue(delta));
  }
  Value unchanged = json::MakeArray();
  for (const auto& entry : report.unchanged) {
    unchanged.Push(UnchangedCategoryValue(entry));
  }

  Value summary = json::MakeObject();
  summary.Set("baseline_total", IntegerValue(report.summary.baseline_total));
  summary.Set("plugin_total", IntegerValue(report.summary.plugin_total));
  summary.Set("delta", IntegerValue(report.summary.delta));
  summary.Set("baseline_percentage", json::MakeNumber(report.summary.baseline_percentage));
  summary.Set("plugin_percentage", json::MakeNumber(report.summary.plugin_percentage));
  summary.Set("percentage_delta", json::MakeNumber(report.summary.percentage_delta));
  summary.Set("verdict", json::MakeString(ToString(report.summary.verdict)));

  Value value = json::MakeObject();
  value.Set("scenario", json::MakeString(report.scenario));
  value.Set("baseline", ComparisonSideValue(report.baseline));
  value.Set("with_plugin", ComparisonSideValue(report.with_plugin));
  value.Set("improvements", std::move(improvements));
  value.Set("regressions", std::move(regressions));
  value.Set("unchanged", std::move(unchanged));
  value.Set("summary", std::move(summary));
  return value;
}

std::string ToJson(const ResultDocument& document) {
  return json::Serialize(ToJsonValue(document)) + "\n";
}

std::string ToJson(const ComparisonReport& report) {
  return json::Serialize(ToJsonValue(report)) + "\n";
}

bool ParseCheckOutcome(const Value& value, CheckOutcome& outcome, std::string& error) {
  if (!value.IsObject()) {
    error = "check entry must be an object";
    return false;
  }

  outcome = CheckOutcome{};
  outcome.check_name = json::GetString(value, "check").value_or("");
  outcome.kind = ParseCheckKind(outcome.check_name).value_or(CheckKind::kUnknown);
  outcome.method = json::GetString(value, "method").value_or("");
  outcome.description = json::GetString(value, "description").value_or("");
  outcome.passed = ReadPassState(value);
  outcome.reason = json::GetString(value, "reason");
  outcome.error = json::GetString(value, "error");
  outcome.warning = json::GetString(value, "warning");

  for (const auto& [key, member] : value.object_value) {
    if (key == "check" || key == "method" || key == "description" || key == "passed" ||
        key == "skipped" || key == "reason" || key == "error" || key == "warning") {
      continue;
    }
    outcome.details[key] = member;
  }
  return true;
}

bool ParseScoreResult(const Value& value, ScoreResult& score, std::string& error) {
  if (!value.IsObject()) {
    error = "score must be an object";
    return false;
  }

  score = ScoreResult{};
  if (const Value* categories = value.Find("categories"); categories != nullptr) {
    if (!categories->IsObject()) {
      error = "score.categories must be an object";
      return false;
    }
    for (const auto& [name, entry] : categories->object_value) {
      if (!entry.IsObject()) {
        error = "score.categories." + name + " must be an object";
        return false;
      }
      CategoryScore category;
      category.passed = ReadPassState(entry);
      category.reason = json::GetString(entry, "reason");
      category.points = ReadInteger(entry, "points", 0);
      category.max_points = ReadInteger(entry, "max_points", 0);
      score.categories.emplace(name, std::move(category));
    }
  }
  score.total = ReadInteger(value, "total", 0);
  score.max_total = ReadInteger(value, "max_total", 0);
  score.percentage = json::GetNumber(value, "percentage").value_or(0.0);
  return true;
}

bool ParseResultDocumentText(std::string_view json_text, ResultDocument& document,
                             std::string& error) {
  Value root;
  if (!json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "result document root must be a JSON object";
    return false;
  }

  document = ResultDocument{};
  document.scenario = json::GetString(root, "scenario").value_or("");
  document.mode = json::GetString(root, "mode").value_or("");
  document.timestamp = json::GetString(root, "timestamp").value_or("");
  document.project_dir = json::GetString(root, "project_dir").value_or("");

  if (const Value* timing = root.Find("timing"); timing != nullptr && timing->IsObject()) {
    document.timing.start_time = json::GetString(*timing, "start_time");
    document.timing.end_time = json::GetString(*timing, "end_time");
    document.timing.duration_seconds = ReadInteger(*timing, "duration_seconds", 0);
  }

  if (const Value* checks = root.Find("checks"); checks != nullptr) {
    if (!checks->IsArray()) {
      error = "result document checks must be an array";
      return false;
    }
    for (const auto& entry : checks->array_value) {
      CheckOutcome outcome;
      if (!ParseCheckOutcome(entry, outcome, error)) {
        return false;
      }
      document.checks.push_back(std::move(outcome));
    }
  }

  if (const Value* score = root.Find("score"); score != nullptr) {
    if (!ParseScoreResult(*score, document.score, error)) {
      return false;
    }
  }
  return true;
}

bool LoadResultDocumentFile(const std::filesystem::path& path, ResultDocument& document,
                            std::string& error) {
  std::string text;
  if (!ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseResultDocumentText(text, document, error)) {
    error = "invalid result document '" + path.string() + "': " + error;
    return false;
  }
  return true;
}

} // namespace plugeval::core::schema
