#include "scenarios/validator.hpp"

#include "checks/api_verify_check.hpp"
#include "checks/code_runs_check.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/string_utils.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace plugeval::scenarios {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsNonNegativeInteger(const JsonValue& value) {
  if (!value.IsNumber() || !std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  return floored == value.number_value &&
         floored <= static_cast<double>(std::numeric_limits<std::int64_t>::max());
}

void ValidateOptionalString(const JsonValue& object, std::string_view key, const std::string& path,
                            ValidationReport& report) {
  if (const JsonValue* field = object.Find(key); field != nullptr && !field->IsString()) {
    AddIssue(report, path + "." + std::string(key), "must be a string");
  }
}

void ValidateRequiredString(const JsonValue& object, std::string_view key, const std::string& path,
                            std::string hint, ValidationReport& report) {
  const std::string field_path = path + "." + std::string(key);
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    AddIssue(report, field_path, "is required; " + hint);
    return;
  }
  if (!field->IsString()) {
    AddIssue(report, field_path, "must be a string");
    return;
  }
  if (field->string_value.empty()) {
    AddIssue(report, field_path, "must not be empty");
  }
}

void ValidateOptionalCount(const JsonValue& object, std::string_view key, const std::string& path,
                           ValidationReport& report) {
  if (const JsonValue* field = object.Find(key); field != nullptr && !IsNonNegativeInteger(*field)) {
    AddIssue(report, path + "." + std::string(key), "must be a non-negative integer");
  }
}

void ValidateFileContains(const JsonValue& criterion, const std::string& path,
                          ValidationReport& report) {
  ValidateRequiredString(criterion, "file", path, "example: \"main.py\"", report);

  const JsonValue* patterns = criterion.Find("patterns");
  if (patterns == nullptr) {
    AddIssue(report, path + ".patterns", "is required and must be a non-empty array of strings");
    return;
  }
  if (!patterns->IsArray() || patterns->array_value.empty()) {
    AddIssue(report, path + ".patterns", "must be a non-empty array of strings");
    return;
  }
  for (std::size_t i = 0; i < patterns->array_value.size(); ++i) {
    const JsonValue& pattern = patterns->array_value[i];
    if (!pattern.IsString() || pattern.string_value.empty()) {
      AddIssue(report, path + ".patterns[" + std::to_string(i) + "]",
               "must be a non-empty string");
    }
  }
}

void ValidateCodeRuns(const JsonValue& criterion, const std::string& path,
                      ValidationReport& report) {
  if (const JsonValue* command = criterion.Find("command"); command != nullptr) {
    if (!command->IsString() || core::TrimView(command->string_value).empty()) {
      AddIssue(report, path + ".command", "must be a non-empty command string");
    }
  }
  if (const JsonValue* timeout = criterion.Find("timeout"); timeout != nullptr) {
    if (!IsNonNegativeInteger(*timeout) || timeout->number_value == 0.0) {
      AddIssue(report, path + ".timeout", "must be a positive integer (seconds)");
    } else if (timeout->number_value > static_cast<double>(checks::kMaxCommandTimeoutSeconds)) {
      AddIssue(report, path + ".timeout",
               "must not exceed " + std::to_string(checks::kMaxCommandTimeoutSeconds) +
                   " seconds");
    }
  }
}

void ValidateApiVerify(const JsonValue& criterion, const std::string& path,
                       ValidationReport& report) {
  const JsonValue* method = criterion.Find("method");
  if (method == nullptr || !method->IsString()) {
    AddIssue(report, path + ".method", "is required and must be a string");
  } else if (!checks::IsKnownApiVerifyMethod(method->string_value)) {
    AddIssue(report, path + ".method",
             "unknown api_verify method '" + method->string_value + "' (expected one of " +
                 checks::ExpectedApiVerifyMethodList() + ")");
  }

  ValidateOptionalString(criterion, "prompt_name", path, report);
  ValidateOptionalString(criterion, "variable_name", path, report);
  ValidateOptionalString(criterion, "dataset_name", path, report);
  ValidateOptionalCount(criterion, "min_test_cases", path, report);
  ValidateOptionalCount(criterion, "min_sessions", path, report);

  if (method == nullptr || !method->IsString()) {
    return;
  }
  const std::string& name = method->string_value;
  if (name == "check_prompt_exists" || name == "check_prompt_has_variable") {
    ValidateRequiredString(criterion, "prompt_name", path, "name of the prompt template", report);
  }
  if (name == "check_prompt_has_variable") {
    ValidateRequiredString(criterion, "variable_name", path, "example: \"user_input\"", report);
  }
  if (name == "check_dataset_exists") {
    ValidateRequiredString(criterion, "dataset_name", path, "name of the dataset", report);
  }
}

void ValidateCriteria(const JsonValue& root, ValidationReport& report) {
  const JsonValue* criteria = root.Find("success_criteria");
  if (criteria == nullptr) {
    AddIssue(report, "success_criteria", "is required and must be a non-empty array");
    return;
  }
  if (!criteria->IsArray() || criteria->array_value.empty()) {
    AddIssue(report, "success_criteria", "must be a non-empty array");
    return;
  }

  for (std::size_t i = 0; i < criteria->array_value.size(); ++i) {
    const JsonValue& criterion = criteria->array_value[i];
    const std::string path = "success_criteria[" + std::to_string(i) + "]";
    if (!criterion.IsObject()) {
      AddIssue(report, path, "must be an object");
      continue;
    }

    ValidateOptionalString(criterion, "description", path, report);

    const JsonValue* type = criterion.Find("type");
    if (type == nullptr || !type->IsString()) {
      AddIssue(report, path + ".type",
               "is required and must be one of file_contains|code_runs|api_verify");
      continue;
    }

    if (type->string_value == "file_contains") {
      ValidateFileContains(criterion, path, report);
    } else if (type->string_value == "code_runs") {
      ValidateCodeRuns(criterion, path, report);
    } else if (type->string_value == "api_verify") {
      ValidateApiVerify(criterion, path, report);
    } else {
      AddIssue(report, path + ".type",
               "unknown check type '" + type->string_value +
                   "' (expected file_contains|code_runs|api_verify)");
    }
  }
}

void ValidateScoring(const JsonValue& root, ValidationReport& report) {
  const JsonValue* scoring = root.Find("scoring");
  if (scoring == nullptr) {
    AddIssue(report, "scoring", "is required and must map category names to {\"points\": N}");
    return;
  }
  if (!scoring->IsObject()) {
    AddIssue(report, "scoring", "must be an object");
    return;
  }

  for (const auto& [category, entry] : scoring->object_value) {
    const std::string path = "scoring." + category;
    if (!entry.IsObject()) {
      AddIssue(report, path, "must be an object with points");
      continue;
    }
    const JsonValue* points = entry.Find("points");
    if (points == nullptr || !IsNonNegativeInteger(*points)) {
      AddIssue(report, path + ".points", "must be a non-negative integer");
    }
  }
}

void ValidateScenarioObject(const JsonValue& root, ValidationReport& report) {
  if (!root.IsObject()) {
    AddIssue(report, "$", "root JSON value must be an object");
    return;
  }

  ValidateOptionalString(root, "name", "$", report);
  ValidateOptionalString(root, "description", "$", report);
  ValidateOptionalString(root, "user_prompt", "$", report);
  if (const JsonValue* timeout = root.Find("timeout");
      timeout != nullptr && (!IsNonNegativeInteger(*timeout) || timeout->number_value == 0.0)) {
    AddIssue(report, "timeout", "must be a positive integer (seconds)");
  }

  ValidateCriteria(root, report);
  ValidateScoring(root, report);
}

void ReportParseFailure(std::string_view parse_error, ValidationReport& report) {
  AddIssue(report, "$",
           std::string(parse_error) + " (fix JSON syntax and rerun 'plugeval validate <scenario>')");
  report.valid = false;
}

} // namespace

bool ValidateScenarioText(std::string_view json_text, ValidationReport& report,
                          std::string& error) {
  report = ValidationReport{};
  error.clear();

  if (core::TrimView(json_text).empty()) {
    AddIssue(report, "$", "scenario file is empty; provide a valid JSON object");
    report.valid = false;
    return true;
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    ReportParseFailure(parse_error, report);
    return true;
  }

  ValidateScenarioObject(root, report);
  report.valid = report.issues.empty();
  return true;
}

bool ValidateScenarioFile(const std::filesystem::path& scenario_path, ValidationReport& report,
                          std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(scenario_path, contents, error)) {
    error = "unable to read scenario file: " + scenario_path.string();
    return false;
  }
  return ValidateScenarioText(contents, report, error);
}

} // namespace plugeval::scenarios
