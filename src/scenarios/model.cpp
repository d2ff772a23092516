#include "scenarios/model.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace plugeval::scenarios {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kScenarioFileName = "scenario.json";

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (!value.IsNumber()) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value ||
      floored > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

std::string ReadString(const JsonValue& object, std::string_view key, std::string fallback = {}) {
  std::optional<std::string> value = core::json::GetString(object, key);
  return value.has_value() ? std::move(*value) : std::move(fallback);
}

std::uint64_t ReadU64(const JsonValue& object, std::string_view key, std::uint64_t fallback) {
  const JsonValue* value = object.Find(key);
  std::uint64_t parsed = 0;
  if (value == nullptr || !TryGetNonNegativeInteger(*value, parsed)) {
    return fallback;
  }
  return parsed;
}

CriterionParams ParseCriterionParams(const JsonValue& criterion) {
  const std::string type = ReadString(criterion, "type");

  if (type == "file_contains") {
    FileContainsCriterion params;
    params.file = ReadString(criterion, "file");
    if (const JsonValue* patterns = criterion.Find("patterns");
        patterns != nullptr && patterns->IsArray()) {
      for (const auto& pattern : patterns->array_value) {
        if (pattern.IsString()) {
          params.patterns.push_back(pattern.string_value);
        }
      }
    }
    return params;
  }

  if (type == "code_runs") {
    CodeRunsCriterion params;
    params.command = ReadString(criterion, "command", params.command);
    params.timeout_seconds = ReadU64(criterion, "timeout", params.timeout_seconds);
    return params;
  }

  if (type == "api_verify") {
    ApiVerifyCriterion params;
    params.method = ReadString(criterion, "method");
    params.prompt_name = ReadString(criterion, "prompt_name");
    params.variable_name = ReadString(criterion, "variable_name");
    params.dataset_name = ReadString(criterion, "dataset_name");
    params.min_test_cases = ReadU64(criterion, "min_test_cases", params.min_test_cases);
    params.min_sessions = ReadU64(criterion, "min_sessions", params.min_sessions);
    return params;
  }

  return UnknownCriterion{type};
}

bool ParseRubric(const JsonValue& root, ScoringRubric& rubric, std::string& error) {
  rubric.clear();
  const JsonValue* scoring = root.Find("scoring");
  if (scoring == nullptr || !scoring->IsObject()) {
    return true;
  }

  for (const auto& [category, entry] : scoring->object_value) {
    const JsonValue* points = entry.Find("points");
    std::uint64_t parsed = 0;
    if (points == nullptr || !TryGetNonNegativeInteger(*points, parsed)) {
      error = "scenario scoring." + category + ".points must be a non-negative integer";
      return false;
    }
    rubric[category] = RubricEntry{static_cast<std::int64_t>(parsed)};
  }
  return true;
}

} // namespace

bool ParseScenarioText(std::string_view json_text, std::string_view default_name,
                       Scenario& scenario, std::string& error) {
  scenario = Scenario{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid scenario JSON: " + parse_error;
    return false;
  }
  if (!root.IsObject()) {
    error = "scenario root must be a JSON object";
    return false;
  }

  scenario.name = ReadString(root, "name", std::string(default_name));
  scenario.description = ReadString(root, "description");
  scenario.user_prompt = ReadString(root, "user_prompt");
  scenario.timeout_seconds = ReadU64(root, "timeout", scenario.timeout_seconds);

  if (const JsonValue* criteria = root.Find("success_criteria");
      criteria != nullptr && criteria->IsArray()) {
    scenario.criteria.reserve(criteria->array_value.size());
    for (const auto& criterion : criteria->array_value) {
      SuccessCriterion parsed;
      if (criterion.IsObject()) {
        parsed.params = ParseCriterionParams(criterion);
        parsed.description = ReadString(criterion, "description");
      } else {
        parsed.params = UnknownCriterion{};
      }
      scenario.criteria.push_back(std::move(parsed));
    }
  }

  return ParseRubric(root, scenario.scoring, error);
}

bool LoadScenarioFile(const fs::path& scenario_path, Scenario& scenario, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(scenario_path, contents, error)) {
    error = "unable to read scenario file: " + scenario_path.string();
    return false;
  }

  std::string default_name = scenario_path.parent_path().filename().string();
  if (default_name.empty()) {
    default_name = scenario_path.stem().string();
  }
  return ParseScenarioText(contents, default_name, scenario, error);
}

bool ResolveScenarioPath(std::string_view scenario_arg, const fs::path& scenarios_dir,
                         fs::path& scenario_path, std::string& error) {
  error.clear();
  if (scenario_arg.empty()) {
    error = "scenario name must not be empty";
    return false;
  }

  const fs::path direct(scenario_arg);
  std::error_code ec;
  if (direct.extension() == ".json" || fs::is_regular_file(direct, ec)) {
    if (!fs::is_regular_file(direct, ec)) {
      error = "scenario file not found: " + direct.string();
      return false;
    }
    scenario_path = direct;
    return true;
  }

  const fs::path candidate = scenarios_dir / direct / kScenarioFileName;
  if (!fs::is_regular_file(candidate, ec)) {
    error = "scenario '" + std::string(scenario_arg) + "' not found (looked for " +
            candidate.string() + ")";
    return false;
  }
  scenario_path = candidate;
  return true;
}

bool ListScenarioNames(const fs::path& scenarios_dir, std::vector<std::string>& names,
                       std::string& error) {
  names.clear();
  error.clear();

  std::error_code ec;
  if (!fs::is_directory(scenarios_dir, ec)) {
    error = "scenarios directory not found: " + scenarios_dir.string();
    return false;
  }

  fs::directory_iterator it(scenarios_dir, ec);
  if (ec) {
    error = "unable to list scenarios directory '" + scenarios_dir.string() + "': " + ec.message();
    return false;
  }
  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (entry.is_directory(entry_ec) &&
        fs::is_regular_file(entry.path() / kScenarioFileName, entry_ec)) {
      names.push_back(entry.path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return true;
}

} // namespace plugeval::scenarios
