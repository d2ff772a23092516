#pragma once

#include "core/config/eval_config.hpp"
#include "core/logging/logger.hpp"
#include "core/schema/result_contract.hpp"
#include "remote/record_client.hpp"
#include "scenarios/model.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace plugeval::runner {

// Executes every criterion of a scenario against one project directory and
// assembles the result document.
//
// Criteria run strictly in declared order, one at a time. A fault inside one
// executor becomes that criterion's error outcome; the remaining criteria
// still run.
class ScenarioRunner {
public:
  ScenarioRunner(const core::config::EvalConfig& config, remote::IRecordClient& client,
                 core::logging::Logger& logger);

  // `now` anchors both the document timestamp and the default remote window.
  core::schema::ResultDocument Run(const scenarios::Scenario& scenario,
                                   const std::filesystem::path& project_dir,
                                   const std::string& mode,
                                   std::chrono::system_clock::time_point now =
                                       std::chrono::system_clock::now());

private:
  const core::config::EvalConfig& config_;
  remote::IRecordClient& client_;
  core::logging::Logger& logger_;
};

// Verify exit policy: every criterion either passed or was skipped.
bool AllCriteriaSatisfied(const core::schema::ResultDocument& document);

} // namespace plugeval::runner
