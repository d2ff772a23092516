#include "common/assertions.hpp"
#include "common/scenario_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "scenarios/model.hpp"

#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using namespace plugeval::scenarios;
using namespace plugeval::tests::common;

int main() {
  {
    Scenario scenario;
    std::string error;
    const bool ok = ParseScenarioText(R"json(
{
  "description": "demo",
  "user_prompt": "Do the thing",
  "success_criteria": [
    {"type": "file_contains", "file": "main.py", "patterns": ["a", 3, "b"], "description": "d0"},
    {"type": "code_runs"},
    {"type": "api_verify", "method": "check_dataset_has_test_cases",
     "dataset_name": "qa", "min_test_cases": 3},
    {"type": "mystery"}
  ],
  "scoring": {"code_runs": {"points": 20}, "code_modified": {"points": 10}}
}
)json",
                                      "fallback-name", scenario, error);
    AssertTrue(ok, "expected scenario to parse: " + error);
    AssertTrue(scenario.name == "fallback-name", "default name applies without a name member");
    AssertTrue(scenario.timeout_seconds == 180U, "default scenario timeout");
    AssertTrue(scenario.criteria.size() == 4U, "all criteria kept in order");

    const auto* file = std::get_if<FileContainsCriterion>(&scenario.criteria[0].params);
    AssertTrue(file != nullptr && file->patterns == std::vector<std::string>{"a", "b"},
               "non-string patterns are dropped");
    AssertTrue(scenario.criteria[0].description == "d0", "description carried");

    const auto* code = std::get_if<CodeRunsCriterion>(&scenario.criteria[1].params);
    AssertTrue(code != nullptr && code->command == "python main.py" && code->timeout_seconds == 60U,
               "code_runs defaults");

    const auto* api = std::get_if<ApiVerifyCriterion>(&scenario.criteria[2].params);
    AssertTrue(api != nullptr && api->min_test_cases == 3U && api->min_sessions == 1U &&
                   api->dataset_name == "qa",
               "api_verify params");

    const auto* unknown = std::get_if<UnknownCriterion>(&scenario.criteria[3].params);
    AssertTrue(unknown != nullptr && unknown->type == "mystery", "unknown type kept");

    AssertTrue(scenario.scoring.at("code_runs").points == 20, "rubric points");
  }

  {
    Scenario scenario;
    std::string error;
    AssertTrue(!ParseScenarioText(R"({"scoring":{"code_runs":{"points":"many"}}})", "x", scenario,
                                  error),
               "non-integer points are rejected");
    AssertContains(error, "scoring.code_runs.points");
    AssertTrue(!ParseScenarioText("nope", "x", scenario, error), "invalid JSON is rejected");
  }

  {
    ScopedTempDir temp("plugeval-scenario-model-smoke");
    const fs::path scenarios_dir = temp.path() / "scenarios";
    const fs::path alpha = WriteScenarioFixture(scenarios_dir, "alpha",
                                                R"({"success_criteria":[],"scoring":{}})");
    WriteScenarioFixture(scenarios_dir, "beta", R"({"name":"beta-named"})");
    WriteFixtureFile(scenarios_dir / "notes" / "README.md", "not a scenario\n");

    Scenario scenario;
    std::string error;
    AssertTrue(LoadScenarioFile(alpha, scenario, error), "load alpha: " + error);
    AssertTrue(scenario.name == "alpha", "name defaults to the parent directory");

    fs::path resolved;
    AssertTrue(ResolveScenarioPath("beta", scenarios_dir, resolved, error), "resolve by name");
    AssertTrue(resolved == scenarios_dir / "beta" / "scenario.json", "name lookup path");
    AssertTrue(ResolveScenarioPath(alpha.string(), scenarios_dir, resolved, error),
               "resolve by path");
    AssertTrue(resolved == alpha, "direct path kept");
    AssertTrue(!ResolveScenarioPath("gamma", scenarios_dir, resolved, error),
               "unknown name fails");
    AssertContains(error, "gamma");
    AssertTrue(!ResolveScenarioPath("missing.json", scenarios_dir, resolved, error),
               "missing .json path fails");

    std::vector<std::string> names;
    AssertTrue(ListScenarioNames(scenarios_dir, names, error), "list: " + error);
    AssertTrue(names == std::vector<std::string>{"alpha", "beta"},
               "only directories with scenario.json, sorted");
    AssertTrue(!ListScenarioNames(temp.path() / "absent", names, error),
               "missing directory fails");
  }

  return 0;
}
