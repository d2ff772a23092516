#pragma once

#include "core/schema/result_contract.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace plugeval::report {

// Human-readable verify output: check list with pass/skip/fail markers, score
// table, total and (when non-zero) the run duration.
void PrintVerifyReport(const core::schema::ResultDocument& document, std::ostream& out);

// Comparison table, improvements, regressions, unchanged entries and verdict.
void PrintComparisonReport(const core::schema::ComparisonReport& report, std::ostream& out);

// `Xm Ys` when at least a minute, else `Ys`.
std::string FormatDuration(std::int64_t seconds);

// One-line verdict, e.g. `Plugin IMPROVED score by 10 points (+50.0%)`.
std::string FormatVerdict(const core::schema::ComparisonSummary& summary);

} // namespace plugeval::report
