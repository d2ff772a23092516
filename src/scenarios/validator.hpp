#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace plugeval::scenarios {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Validates scenario JSON text against the scenario schema.
//
// Contract:
// - Returns true when validation completed (even if the scenario is invalid).
// - Populates `report.valid` and `report.issues`.
// - On parse errors, emits a single issue under path `$`.
bool ValidateScenarioText(std::string_view json_text, ValidationReport& report, std::string& error);

// Loads and validates a scenario file.
//
// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report`.
bool ValidateScenarioFile(const std::filesystem::path& scenario_path, ValidationReport& report,
                          std::string& error);

} // namespace plugeval::scenarios
