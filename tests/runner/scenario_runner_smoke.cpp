#include "common/assertions.hpp"
#include "common/scenario_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "remote/testing/fake_record_client.hpp"
#include "runner/scenario_runner.hpp"

#include <chrono>
#include <sstream>
#include <string>

namespace json = plugeval::core::json;
using namespace plugeval;
using namespace plugeval::tests::common;
using remote::testing::FakeRecordClient;

namespace {

scenarios::Scenario BuildScenario() {
  scenarios::Scenario scenario;
  scenario.name = "runner-smoke";
  scenario.criteria.push_back(
      {scenarios::FileContainsCriterion{"main.py", {"freeplay"}}, "SDK imported"});
  scenario.criteria.push_back({scenarios::CodeRunsCriterion{"sh run.sh", 10}, "Code runs"});
  scenarios::ApiVerifyCriterion prompt;
  prompt.method = "check_prompt_exists";
  prompt.prompt_name = "summarizer";
  scenario.criteria.push_back({prompt, "Prompt created"});
  scenario.criteria.push_back({scenarios::UnknownCriterion{"shell_exec"}, "Unknown kind"});
  scenario.scoring["code_modified"] = scenarios::RubricEntry{10};
  scenario.scoring["code_runs"] = scenarios::RubricEntry{20};
  scenario.scoring["prompt_created"] = scenarios::RubricEntry{20};
  return scenario;
}

json::Value PromptList() {
  json::Value record = json::MakeObject();
  record.Set("id", json::MakeString("t-1"));
  record.Set("name", json::MakeString("summarizer"));
  json::Value body = json::MakeObject();
  json::Value data = json::MakeArray();
  data.Push(std::move(record));
  body.Set("data", std::move(data));
  return body;
}

} // namespace

int main() {
  ScopedTempDir project("plugeval-runner-smoke");
  WriteFixtureFile(project.path() / "main.py", "import freeplay\n");
  WriteFixtureFile(project.path() / "run.sh", "echo ok\n");

  const scenarios::Scenario scenario = BuildScenario();
  const auto now = std::chrono::system_clock::time_point(std::chrono::seconds(1'705'314'600));

  {
    // Configured remote: every scored criterion passes.
    core::config::EvalConfig config;
    config.remote.api_key = "key";
    config.remote.project_id = "project";
    config.eval_start_time = "2024-01-15 10:00:00";
    config.eval_duration_seconds = 42;
    FakeRecordClient client;
    client.SetPromptTemplates(FakeRecordClient::Ok(PromptList()));
    std::ostringstream log_stream;
    core::logging::Logger logger(core::logging::LogLevel::kDebug, log_stream);

    runner::ScenarioRunner scenario_runner(config, client, logger);
    const core::schema::ResultDocument document =
        scenario_runner.Run(scenario, project.path(), "with-plugin", now);

    AssertTrue(document.scenario == "runner-smoke", "scenario name");
    AssertTrue(document.mode == "with-plugin", "mode");
    AssertTrue(document.timestamp == "2024-01-15T10:30:00.000Z", "timestamp from now");
    AssertTrue(document.timing.start_time == config.eval_start_time, "timing start passthrough");
    AssertTrue(document.timing.duration_seconds == 42, "timing duration passthrough");
    AssertTrue(document.checks.size() == 4U, "one outcome per criterion");
    AssertTrue(document.checks[0].Passed() && document.checks[0].description == "SDK imported",
               "file check passed with description");
    AssertTrue(document.checks[1].Passed(), "code check passed");
    AssertTrue(document.checks[2].Passed() && document.checks[2].method == "check_prompt_exists",
               "api check passed");
    AssertTrue(document.checks[3].error ==
                   std::optional<std::string>("Unknown check type: shell_exec"),
               "unknown type reported inline");
    AssertTrue(document.checks[3].check_name == "shell_exec", "unknown type name kept");

    AssertTrue(document.score.total == 50 && document.score.max_total == 50, "full score");
    AssertTrue(document.score.percentage == 100.0, "percentage");
    AssertTrue(!runner::AllCriteriaSatisfied(document), "unknown type blocks success");

    AssertContains(log_stream.str(), "check finished");
    AssertContains(log_stream.str(), "Unknown check type: shell_exec");
  }

  {
    // Unconfigured remote: the api check is skipped and does not fail the run.
    core::config::EvalConfig config;
    FakeRecordClient client;
    std::ostringstream log_stream;
    core::logging::Logger logger(core::logging::LogLevel::kInfo, log_stream);
    scenarios::Scenario scored = scenario;
    scored.criteria.pop_back();

    runner::ScenarioRunner scenario_runner(config, client, logger);
    const core::schema::ResultDocument document =
        scenario_runner.Run(scored, project.path(), "baseline", now);
    AssertTrue(document.checks[2].Skipped(), "api check skipped without credentials");
    AssertTrue(document.score.categories.at("prompt_created").Skipped(), "category skipped");
    AssertTrue(document.score.total == 30 && document.score.max_total == 50, "skip scores zero");
    AssertTrue(document.score.percentage == 60.0, "percentage with skip");
    AssertTrue(runner::AllCriteriaSatisfied(document), "pass-or-skip satisfies verify");
    AssertTrue(client.Calls().empty(), "no remote traffic without credentials");
  }

  return 0;
}
