#include "checks/file_contains_check.hpp"

#include "core/fs_utils.hpp"
#include "core/string_utils.hpp"

#include <system_error>

namespace plugeval::checks {

namespace json = core::json;
using core::schema::CheckKind;
using core::schema::CheckOutcome;
using core::schema::PassState;

CheckOutcome RunFileContainsCheck(const std::filesystem::path& project_dir,
                                  const scenarios::FileContainsCriterion& criterion) {
  CheckOutcome outcome;
  outcome.kind = CheckKind::kFileContains;
  outcome.check_name = core::schema::ToString(CheckKind::kFileContains);
  outcome.details["file"] = json::MakeString(criterion.file);
  outcome.details["patterns"] = json::MakeStringArray(criterion.patterns);

  json::Value found = json::MakeArray();
  json::Value missing = json::MakeArray();

  const std::filesystem::path file_path = project_dir / criterion.file;
  std::error_code ec;
  if (criterion.file.empty() || !std::filesystem::exists(file_path, ec)) {
    outcome.details["found"] = std::move(found);
    outcome.details["missing"] = std::move(missing);
    outcome.error = "File not found: " + criterion.file;
    return outcome;
  }

  std::string contents;
  std::string read_error;
  if (!core::ReadTextFile(file_path, contents, read_error)) {
    outcome.details["found"] = std::move(found);
    outcome.details["missing"] = std::move(missing);
    outcome.error = read_error;
    return outcome;
  }

  const std::string haystack = core::ToLowerAscii(contents);
  for (const auto& pattern : criterion.patterns) {
    if (haystack.find(core::ToLowerAscii(pattern)) != std::string::npos) {
      found.Push(json::MakeString(pattern));
    } else {
      missing.Push(json::MakeString(pattern));
    }
  }

  outcome.passed = missing.array_value.empty() ? PassState::kPassed : PassState::kFailed;
  outcome.details["found"] = std::move(found);
  outcome.details["missing"] = std::move(missing);
  return outcome;
}

} // namespace plugeval::checks
