#include "report/console_report.hpp"

#include "core/string_utils.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace plugeval::report {

namespace schema = core::schema;

namespace {

constexpr std::string_view kPassMarker = "\xE2\x9C\x93";  // check mark
constexpr std::string_view kSkipMarker = "\xE2\x8A\x98";  // circled slash
constexpr std::string_view kFailMarker = "\xE2\x9C\x97";  // ballot x
constexpr std::string_view kArrow = "\xE2\x86\x92";
constexpr std::string_view kBullet = "\xE2\x80\xA2";

std::string_view Marker(schema::PassState state) {
  switch (state) {
  case schema::PassState::kPassed:
    return kPassMarker;
  case schema::PassState::kUnknown:
    return kSkipMarker;
  case schema::PassState::kFailed:
    return kFailMarker;
  }
  return kFailMarker;
}

std::string Percent(double value) {
  return core::FormatFixedDouble(value, 1);
}

std::string SignedInteger(std::int64_t value) {
  return (value > 0 ? "+" : "") + std::to_string(value);
}

std::string SignedPercent(double value) {
  return (value > 0.0 ? "+" : "") + Percent(value);
}

std::string JoinStrings(const core::json::Value* items) {
  std::string joined;
  if (items == nullptr || !items->IsArray()) {
    return joined;
  }
  for (const auto& item : items->array_value) {
    if (!item.IsString()) {
      continue;
    }
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += item.string_value;
  }
  return joined;
}

void PrintRule(std::ostream& out, char ch, std::size_t width) {
  out << std::string(width, ch) << '\n';
}

} // namespace

std::string FormatDuration(std::int64_t seconds) {
  const std::int64_t minutes = seconds / 60;
  const std::int64_t rest = seconds % 60;
  if (minutes != 0) {
    return std::to_string(minutes) + "m " + std::to_string(rest) + "s";
  }
  return std::to_string(rest) + "s";
}

std::string FormatVerdict(const schema::ComparisonSummary& summary) {
  switch (summary.verdict) {
  case schema::Verdict::kImproved:
    return "Plugin IMPROVED score by " + std::to_string(summary.delta) + " points (" +
           SignedPercent(summary.percentage_delta) + "%)";
  case schema::Verdict::kReduced:
    return "Plugin REDUCED score by " + std::to_string(std::llabs(summary.delta)) + " points (" +
           Percent(summary.percentage_delta) + "%)";
  case schema::Verdict::kUnchanged:
    break;
  }
  return "No change in score";
}

void PrintVerifyReport(const schema::ResultDocument& document, std::ostream& out) {
  out << "=== Check Results ===\n";
  for (const auto& check : document.checks) {
    const std::string& label = check.description.empty() ? check.check_name : check.description;
    out << Marker(check.passed) << ' ' << label << '\n';
    if (check.error.has_value()) {
      out << "  Error: " << *check.error << '\n';
    }
    if (check.warning.has_value()) {
      out << "  Warning: " << *check.warning << '\n';
    }
    const auto missing = check.details.find("missing");
    if (missing != check.details.end() && !missing->second.array_value.empty()) {
      out << "  Missing patterns: " << JoinStrings(&missing->second) << '\n';
    }
    if (check.Skipped()) {
      out << "  Skipped: " << check.reason.value_or("") << '\n';
    }
  }

  out << '\n' << "=== Score ===\n";
  const schema::ScoreResult& score = document.score;
  for (const auto& [category, entry] : score.categories) {
    out << Marker(entry.passed) << ' ' << category << ": " << entry.points << '/'
        << entry.max_points << '\n';
  }
  out << '\n'
      << "Total: " << score.total << '/' << score.max_total << " (" << Percent(score.percentage)
      << "%)\n";

  if (document.timing.duration_seconds != 0) {
    out << "Duration: " << FormatDuration(document.timing.duration_seconds) << '\n';
  }
}

void PrintComparisonReport(const schema::ComparisonReport& report, std::ostream& out) {
  const schema::ComparisonSummary& summary = report.summary;

  PrintRule(out, '=', 60);
  out << "EVALUATION COMPARISON: " << report.scenario << '\n';
  PrintRule(out, '=', 60);
  out << '\n';

  out << "OVERALL SCORES\n";
  PrintRule(out, '-', 40);
  out << std::left << std::setw(25) << "Metric" << std::right << ' ' << std::setw(10)
      << "Baseline" << ' ' << std::setw(10) << "Plugin" << ' ' << std::setw(10) << "Delta"
      << '\n';
  PrintRule(out, '-', 40);
  out << std::left << std::setw(25) << "Total Points" << std::right << ' ' << std::setw(10)
      << summary.baseline_total << ' ' << std::setw(10) << summary.plugin_total << ' '
      << std::setw(10) << SignedInteger(summary.delta) << '\n';
  out << std::left << std::setw(25) << "Percentage" << std::right << ' ' << std::setw(9)
      << Percent(summary.baseline_percentage) << "% " << std::setw(9)
      << Percent(summary.plugin_percentage) << "% " << std::setw(9)
      << SignedPercent(summary.percentage_delta) << "%\n";
  out << '\n';

  if (!report.improvements.empty()) {
    out << kPassMarker << " IMPROVEMENTS (Plugin passed where baseline failed)\n";
    PrintRule(out, '-', 40);
    for (const auto& item : report.improvements) {
      out << "  " << kBullet << ' ' << item.category << ": " << item.baseline_points << ' '
          << kArrow << ' ' << item.with_plugin_points << " (" << SignedInteger(item.delta)
          << ")\n";
    }
    out << '\n';
  }

  if (!report.regressions.empty()) {
    out << kFailMarker << " REGRESSIONS (Baseline passed where plugin failed)\n";
    PrintRule(out, '-', 40);
    for (const auto& item : report.regressions) {
      out << "  " << kBullet << ' ' << item.category << ": " << item.baseline_points << ' '
          << kArrow << ' ' << item.with_plugin_points << " (" << item.delta << ")\n";
    }
    out << '\n';
  }

  if (!report.unchanged.empty()) {
    out << "= UNCHANGED\n";
    PrintRule(out, '-', 40);
    for (const auto& item : report.unchanged) {
      if (item.status == schema::ToString(schema::PassState::kUnknown)) {
        out << "  " << kSkipMarker << ' ' << item.category << ": skipped ("
            << item.reason.value_or("unknown reason") << ")\n";
      } else {
        const bool passed = item.status == schema::ToString(schema::PassState::kPassed);
        out << "  " << (passed ? kPassMarker : kFailMarker) << ' ' << item.category << ": "
            << item.status << '\n';
      }
    }
    out << '\n';
  }

  PrintRule(out, '=', 60);
  out << "VERDICT: " << FormatVerdict(summary) << '\n';
  PrintRule(out, '=', 60);
}

} // namespace plugeval::report
