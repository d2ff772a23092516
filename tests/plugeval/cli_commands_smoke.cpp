#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/scenario_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <string>

namespace fs = std::filesystem;
using namespace plugeval::tests::common;

int main() {
  ScopedTempDir temp("plugeval-cli-smoke");
  const fs::path scenarios_dir = temp.path() / "scenarios";
  WriteScenarioFixture(scenarios_dir, "good", R"json({
    "success_criteria": [{"type": "code_runs", "command": "python main.py"}],
    "scoring": {"code_runs": {"points": 20}}
  })json");
  WriteScenarioFixture(scenarios_dir, "bad", R"json({
    "success_criteria": [{"type": "api_verify", "method": "check_everything"}],
    "scoring": {"code_runs": {"points": 20}}
  })json");

  std::string output;

  AssertExitCode(DispatchArgsCapture({"plugeval", "version"}, output), 0, "version");
  AssertContains(output, "plugeval 0.1.0");
  AssertExitCode(DispatchArgsCapture({"plugeval", "version", "extra"}, output), 2,
                 "version with args");

  AssertExitCode(DispatchArgsCapture({"plugeval", "help"}, output), 0, "help");
  AssertContains(output, "plugeval verify <scenario> <project_dir> <mode>");
  AssertExitCode(DispatchArgsCapture({"plugeval"}, output), 2, "no command");
  AssertExitCode(DispatchArgsCapture({"plugeval", "frobnicate"}, output), 2, "unknown command");

  AssertExitCode(DispatchArgsCapture({"plugeval", "list", "--scenarios-dir",
                                      scenarios_dir.string()},
                                     output),
                 0, "list");
  AssertTrue(output == "bad\ngood\n", "list prints sorted scenario names");
  AssertExitCode(DispatchArgsCapture({"plugeval", "list", "--scenarios-dir",
                                      (temp.path() / "absent").string()},
                                     output),
                 1, "list missing dir");

  AssertExitCode(DispatchArgsCapture({"plugeval", "validate", "good", "--scenarios-dir",
                                      scenarios_dir.string()},
                                     output),
                 0, "validate good");
  AssertContains(output, "valid: ");
  AssertExitCode(DispatchArgsCapture({"plugeval", "validate", "bad", "--scenarios-dir",
                                      scenarios_dir.string()},
                                     output),
                 10, "validate bad");
  AssertExitCode(DispatchArgsCapture({"plugeval", "validate", "nope", "--scenarios-dir",
                                      scenarios_dir.string()},
                                     output),
                 10, "validate unknown");
  AssertExitCode(DispatchArgsCapture({"plugeval", "validate"}, output), 2, "validate usage");

  AssertExitCode(DispatchArgsCapture({"plugeval", "verify", "good", "project"}, output), 2,
                 "verify needs a mode");
  AssertExitCode(DispatchArgsCapture({"plugeval", "verify", "good", "project", "baseline",
                                      "--bogus"},
                                     output),
                 2, "verify unknown flag");
  AssertExitCode(DispatchArgsCapture({"plugeval", "verify", "good", "project", "baseline",
                                      "--log-level", "loud"},
                                     output),
                 2, "verify bad log level");

  const fs::path bad_env = temp.path() / "bad.env";
  WriteFixtureFile(bad_env, "this is not an assignment\n");
  AssertExitCode(DispatchArgsCapture({"plugeval", "verify", "good", "project", "baseline",
                                      "--scenarios-dir", scenarios_dir.string(), "--env-file",
                                      bad_env.string()},
                                     output),
                 11, "verify malformed env file");

  return 0;
}
