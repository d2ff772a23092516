#include "checks/file_contains_check.hpp"
#include "common/assertions.hpp"
#include "common/scenario_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <string>

using plugeval::checks::RunFileContainsCheck;
using plugeval::core::json::Value;
using plugeval::scenarios::FileContainsCriterion;
using namespace plugeval::tests::common;

namespace {

std::size_t ArraySize(const plugeval::core::schema::CheckOutcome& outcome, const char* key) {
  const auto it = outcome.details.find(key);
  AssertTrue(it != outcome.details.end() && it->second.IsArray(),
             std::string("expected array detail: ") + key);
  return it->second.array_value.size();
}

} // namespace

int main() {
  ScopedTempDir project("plugeval-file-contains-smoke");
  WriteFixtureFile(project.path() / "main.py",
                   "from FreePlay import Freeplay\nclient = Freeplay()\nmodel = 'GPT-4o-mini'\n");

  {
    // Matching ignores case on both sides.
    const auto outcome =
        RunFileContainsCheck(project.path(), FileContainsCriterion{"main.py", {"freeplay", "gpt-4o-MINI"}});
    AssertTrue(outcome.Passed(), "expected all patterns to be found");
    AssertTrue(!outcome.error.has_value(), "did not expect an error");
    AssertTrue(ArraySize(outcome, "found") == 2U, "expected two found patterns");
    AssertTrue(ArraySize(outcome, "missing") == 0U, "expected no missing patterns");
  }

  {
    const auto outcome = RunFileContainsCheck(
        project.path(), FileContainsCriterion{"main.py", {"freeplay", "prompt_template"}});
    AssertTrue(!outcome.Passed(), "expected missing pattern to fail the check");
    const Value& missing = outcome.details.at("missing");
    AssertTrue(missing.array_value.size() == 1U &&
                   missing.array_value.front().string_value == "prompt_template",
               "expected prompt_template to be reported missing");
  }

  {
    const auto outcome =
        RunFileContainsCheck(project.path(), FileContainsCriterion{"absent.py", {"x"}});
    AssertTrue(!outcome.Passed(), "expected missing file to fail");
    AssertTrue(outcome.error == std::optional<std::string>("File not found: absent.py"),
               "expected file-not-found error");
    AssertTrue(ArraySize(outcome, "missing") == 0U, "missing file must not list patterns");
  }

  {
    // Vacuous pass: an existing file with no patterns.
    const auto outcome = RunFileContainsCheck(project.path(), FileContainsCriterion{"main.py", {}});
    AssertTrue(outcome.Passed(), "expected empty pattern list to pass");
  }

  return 0;
}
