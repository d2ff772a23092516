#pragma once

#include "core/schema/result_contract.hpp"
#include "scenarios/model.hpp"

#include <filesystem>

namespace plugeval::checks {

// Case-insensitive substring check over one project file.
//
// Passes iff every pattern occurs in the file. A missing file is an unmet
// criterion with an explanatory `error`, never a skip.
core::schema::CheckOutcome RunFileContainsCheck(const std::filesystem::path& project_dir,
                                                const scenarios::FileContainsCriterion& criterion);

} // namespace plugeval::checks
