#pragma once

#include "core/json_dom.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plugeval::core::schema {

// Three-valued check verdict. `kUnknown` is reserved for skipped checks so a
// skip can never be counted as a pass or a failure by scoring code.
enum class PassState {
  kFailed,
  kPassed,
  kUnknown,
};

const char* ToString(PassState state);

// Closed set of executor families. `kUnknown` carries criteria whose declared
// type no executor understands.
enum class CheckKind {
  kFileContains,
  kCodeRuns,
  kApiVerify,
  kUnknown,
};

// Stable wire names: file_contains, code_runs, api_verify, unknown.
const char* ToString(CheckKind kind);
std::optional<CheckKind> ParseCheckKind(std::string_view name);

// Result of executing one success criterion.
//
// Contract:
// - `passed` starts at kFailed and executors flip it only on verified evidence.
// - skipped outcomes have `passed == kUnknown` and a `reason`.
// - `error` records transport/tooling faults inline; it never aborts a run.
// - `details` holds kind-specific fields (found/missing patterns, captured
//   output, remote counts) and is emitted next to the common fields.
struct CheckOutcome {
  CheckKind kind = CheckKind::kUnknown;
  // Declared criterion type; equals ToString(kind) except for unknown kinds.
  std::string check_name;
  std::string method;
  std::string description;
  PassState passed = PassState::kFailed;
  std::optional<std::string> reason;
  std::optional<std::string> error;
  std::optional<std::string> warning;
  json::Value::Object details;

  bool Passed() const {
    return passed == PassState::kPassed;
  }

  bool Skipped() const {
    return passed == PassState::kUnknown;
  }
};

struct CategoryScore {
  PassState passed = PassState::kFailed;
  std::optional<std::string> reason;
  std::int64_t points = 0;
  std::int64_t max_points = 0;

  bool Passed() const {
    return passed == PassState::kPassed;
  }

  bool Skipped() const {
    return passed == PassState::kUnknown;
  }
};

struct ScoreResult {
  std::map<std::string, CategoryScore> categories;
  std::int64_t total = 0;
  std::int64_t max_total = 0;
  double percentage = 0.0;
};

// Pass-through timing supplied by the outer runner.
struct RunTiming {
  std::optional<std::string> start_time;
  std::optional<std::string> end_time;
  std::int64_t duration_seconds = 0;
};

// One verify run artifact. `mode` ("baseline" / "with-plugin") is the join key
// used by comparisons.
struct ResultDocument {
  std::string scenario;
  std::string mode;
  std::string timestamp;
  std::string project_dir;
  RunTiming timing;
  std::vector<CheckOutcome> checks;
  ScoreResult score;
};

enum class Verdict {
  kImproved,
  kReduced,
  kUnchanged,
};

const char* ToString(Verdict verdict);

struct CategoryDelta {
  std::string category;
  std::int64_t baseline_points = 0;
  std::int64_t with_plugin_points = 0;
  std::int64_t delta = 0;
};

// `status` is one of passed, failed, skipped. Skipped entries carry `reason`
// instead of points.
struct UnchangedCategory {
  std::string category;
  std::string status;
  std::optional<std::string> reason;
  std::int64_t points = 0;
};

struct ComparisonSide {
  std::string mode;
  std::string timestamp;
  ScoreResult score;
};

struct ComparisonSummary {
  std::int64_t baseline_total = 0;
  std::int64_t plugin_total = 0;
  std::int64_t delta = 0;
  double baseline_percentage = 0.0;
  double plugin_percentage = 0.0;
  double percentage_delta = 0.0;
  Verdict verdict = Verdict::kUnchanged;
};

struct ComparisonReport {
  std::string scenario;
  ComparisonSide baseline;
  ComparisonSide with_plugin;
  std::vector<CategoryDelta> improvements;
  std::vector<CategoryDelta> regressions;
  std::vector<UnchangedCategory> unchanged;
  ComparisonSummary summary;
};

// DOM builders used by artifact writers and tests.
json::Value ToJsonValue(const CheckOutcome& outcome);
json::Value ToJsonValue(const ScoreResult& score);
json::Value ToJsonValue(const ResultDocument& document);
json::Value ToJsonValue(const ComparisonReport& report);

// Pretty-printed (2-space indent) text with a trailing newline.
std::string ToJson(const ResultDocument& document);
std::string ToJson(const ComparisonReport& report);

// Lenient readers for persisted artifacts: absent members fall back to their
// defaults the way a hand-edited or older result file would expect.
// Returns false only when the text is not JSON or the root is not an object.
bool ParseCheckOutcome(const json::Value& value, CheckOutcome& outcome, std::string& error);
bool ParseScoreResult(const json::Value& value, ScoreResult& score, std::string& error);
bool ParseResultDocumentText(std::string_view json_text, ResultDocument& document,
                             std::string& error);
bool LoadResultDocumentFile(const std::filesystem::path& path, ResultDocument& document,
                            std::string& error);

} // namespace plugeval::core::schema
