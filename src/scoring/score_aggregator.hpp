#pragma once

#include "core/schema/result_contract.hpp"
#include "scenarios/model.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace plugeval::scoring {

// Fixed (check kind, api method) -> rubric category lookup. Returns nullopt for
// outcomes that never participate in scoring (unknown kinds or methods).
std::optional<std::string_view> CategoryFor(core::schema::CheckKind kind, std::string_view method);

std::optional<std::string_view> CategoryFor(const core::schema::CheckOutcome& outcome);

// Converts ordered outcomes into category scores.
//
// Contract:
// - only outcomes whose category has a rubric entry are scored.
// - skipped outcomes score 0 and keep their reason; everything else earns the
//   full category points iff passed.
// - when several outcomes share a category, the later one wins.
// - percentage is total/max_total*100 rounded to one decimal, or 0 when
//   max_total is 0.
core::schema::ScoreResult ComputeScore(const scenarios::ScoringRubric& rubric,
                                       const std::vector<core::schema::CheckOutcome>& outcomes);

} // namespace plugeval::scoring
