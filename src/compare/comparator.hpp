#pragma once

#include "core/schema/result_contract.hpp"

namespace plugeval::compare {

// Diffs a baseline and a treatment result document category by category.
//
// Contract:
// - categories are the union of both sides, visited in lexicographic order.
// - a category absent on one side counts as failed with 0 points there.
// - skipped on either side: unchanged with status "skipped" and the treatment
//   reason (baseline reason when the treatment has none).
// - failed -> passed is an improvement, passed -> failed a regression, anything
//   else is unchanged with the baseline status and points.
// - the verdict is the sign of the total-point delta.
//
// Pure function of its inputs: the same pair always yields the same report.
core::schema::ComparisonReport Compare(const core::schema::ResultDocument& baseline,
                                       const core::schema::ResultDocument& with_plugin);

} // namespace plugeval::compare
