#include "compare/comparator.hpp"

#include "core/string_utils.hpp"

#include <set>
#include <string>

namespace plugeval::compare {

namespace schema = core::schema;

namespace {

const schema::CategoryScore& CategoryOrMissing(const schema::ScoreResult& score,
                                               const std::string& category) {
  static const schema::CategoryScore kMissing{};
  const auto it = score.categories.find(category);
  return it == score.categories.end() ? kMissing : it->second;
}

schema::ComparisonSide MakeSide(const schema::ResultDocument& document) {
  return schema::ComparisonSide{document.mode, document.timestamp, document.score};
}

schema::CategoryDelta MakeDelta(const std::string& category, const schema::CategoryScore& base,
                                const schema::CategoryScore& plugin) {
  return schema::CategoryDelta{category, base.points, plugin.points, plugin.points - base.points};
}

} // namespace

schema::ComparisonReport Compare(const schema::ResultDocument& baseline,
                                 const schema::ResultDocument& with_plugin) {
  schema::ComparisonReport report;
  report.scenario = baseline.scenario;
  report.baseline = MakeSide(baseline);
  report.with_plugin = MakeSide(with_plugin);

  std::set<std::string> categories;
  for (const auto& [name, entry] : baseline.score.categories) {
    categories.insert(name);
  }
  for (const auto& [name, entry] : with_plugin.score.categories) {
    categories.insert(name);
  }

  for (const auto& category : categories) {
    const schema::CategoryScore& base = CategoryOrMissing(baseline.score, category);
    const schema::CategoryScore& plugin = CategoryOrMissing(with_plugin.score, category);

    if (base.Skipped() || plugin.Skipped()) {
      schema::UnchangedCategory entry;
      entry.category = category;
      entry.status = schema::ToString(schema::PassState::kUnknown);
      entry.reason = plugin.reason.has_value() ? plugin.reason : base.reason;
      report.unchanged.push_back(std::move(entry));
    } else if (!base.Passed() && plugin.Passed()) {
      report.improvements.push_back(MakeDelta(category, base, plugin));
    } else if (base.Passed() && !plugin.Passed()) {
      report.regressions.push_back(MakeDelta(category, base, plugin));
    } else {
      schema::UnchangedCategory entry;
      entry.category = category;
      entry.status = schema::ToString(base.passed);
      entry.points = base.points;
      report.unchanged.push_back(std::move(entry));
    }
  }

  schema::ComparisonSummary& summary = report.summary;
  summary.baseline_total = baseline.score.total;
  summary.plugin_total = with_plugin.score.total;
  summary.delta = summary.plugin_total - summary.baseline_total;
  summary.baseline_percentage = baseline.score.percentage;
  summary.plugin_percentage = with_plugin.score.percentage;
  summary.percentage_delta =
      core::RoundToOneDecimal(summary.plugin_percentage - summary.baseline_percentage);
  if (summary.delta > 0) {
    summary.verdict = schema::Verdict::kImproved;
  } else if (summary.delta < 0) {
    summary.verdict = schema::Verdict::kReduced;
  } else {
    summary.verdict = schema::Verdict::kUnchanged;
  }
  return report;
}

} // namespace plugeval::compare
