#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace plugeval::scenarios {

struct FileContainsCriterion {
  // Relative to the project directory.
  std::string file;
  std::vector<std::string> patterns;
};

struct CodeRunsCriterion {
  std::string command = "python main.py";
  std::uint64_t timeout_seconds = 60;
};

struct ApiVerifyCriterion {
  std::string method;
  std::string prompt_name;
  std::string variable_name;
  std::string dataset_name;
  std::uint64_t min_test_cases = 1;
  std::uint64_t min_sessions = 1;
};

// A declared `type` no executor understands. Kept so the run reports it as an
// outcome instead of dropping it.
struct UnknownCriterion {
  std::string type;
};

using CriterionParams =
    std::variant<FileContainsCriterion, CodeRunsCriterion, ApiVerifyCriterion, UnknownCriterion>;

struct SuccessCriterion {
  CriterionParams params;
  std::string description;
};

struct RubricEntry {
  std::int64_t points = 0;
};

// category -> points. Ordered so iteration and serialization are stable.
using ScoringRubric = std::map<std::string, RubricEntry>;

// Parsed scenario definition. Immutable once loaded.
//
// Loading is lenient the way the outer runner expects: optional members with
// the wrong type fall back to their defaults. The validator is the strict
// schema gate.
struct Scenario {
  std::string name;
  std::string description;
  // Carried through for the outer agent runner; not interpreted here.
  std::string user_prompt;
  std::uint64_t timeout_seconds = 180;
  std::vector<SuccessCriterion> criteria;
  ScoringRubric scoring;
};

// Parses scenario JSON. `default_name` is used when the document has no
// string `name`. Returns false on invalid JSON, a non-object root, or a
// rubric entry without non-negative integer `points`.
bool ParseScenarioText(std::string_view json_text, std::string_view default_name,
                       Scenario& scenario, std::string& error);

// Loads a scenario file; the default name is the file's parent directory name.
bool LoadScenarioFile(const std::filesystem::path& scenario_path, Scenario& scenario,
                      std::string& error);

// Resolves a CLI scenario argument. Anything ending in `.json` or naming an
// existing regular file is taken as a path; otherwise it is a scenario name
// looked up as `<scenarios_dir>/<name>/scenario.json`.
bool ResolveScenarioPath(std::string_view scenario_arg, const std::filesystem::path& scenarios_dir,
                         std::filesystem::path& scenario_path, std::string& error);

// Sorted names of directories under `scenarios_dir` holding a scenario.json.
bool ListScenarioNames(const std::filesystem::path& scenarios_dir, std::vector<std::string>& names,
                       std::string& error);

} // namespace plugeval::scenarios
