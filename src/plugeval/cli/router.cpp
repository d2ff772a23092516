#include "plugeval/cli/router.hpp"

#include "compare/comparator.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/schema/result_contract.hpp"
#include "remote/http_record_client.hpp"
#include "report/console_report.hpp"
#include "runner/scenario_runner.hpp"
#include "scenarios/model.hpp"
#include "scenarios/validator.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace plugeval::cli {

namespace {

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitScenarioInvalid = core::errors::ToInt(core::errors::ExitCode::kScenarioInvalid);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  plugeval verify <scenario> <project_dir> <mode> [output_file] "
         "[--scenarios-dir <dir>] [--env-file <path>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  plugeval compare <baseline.json> <with_plugin.json> [output_file] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  plugeval validate <scenario> [--scenarios-dir <dir>]\n"
      << "  plugeval list [--scenarios-dir <dir>]\n"
      << "  plugeval version\n";
}

struct CompareOptions {
  fs::path baseline_path;
  fs::path with_plugin_path;
  std::optional<fs::path> output_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Consumes the value of a `--flag <value>` pair at `i`.
bool TakeFlagValue(const std::vector<std::string_view>& args, std::size_t& i,
                   std::string_view flag, std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

bool ParseLogLevelFlag(const std::vector<std::string_view>& args, std::size_t& i,
                       core::logging::LogLevel& level, std::string& error) {
  std::string_view value;
  if (!TakeFlagValue(args, i, "--log-level", value, error)) {
    return false;
  }
  return core::logging::ParseLogLevel(value, level, error);
}

// Parse `verify` args with an explicit contract:
// - three or four positionals: scenario, project dir, mode, optional output
// - optional flags anywhere among them
// Unknown flags and extra positionals are usage errors.
bool ParseVerifyOptions(const std::vector<std::string_view>& args, VerifyOptions& options,
                        std::string& error) {
  std::vector<std::string_view> positionals;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--scenarios-dir") {
      if (!TakeFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.scenarios_dir = fs::path(value);
      continue;
    }
    if (token == "--env-file") {
      if (!TakeFlagValue(args, i, token, value, error)) {
        return false;
      }
      options.env_file = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positionals.push_back(token);
  }

  if (positionals.size() < 3U) {
    error = "verify requires <scenario> <project_dir> <mode>";
    return false;
  }
  if (positionals.size() > 4U) {
    error = "verify accepts at most 4 positional arguments";
    return false;
  }

  options.scenario = std::string(positionals[0]);
  options.project_dir = fs::path(positionals[1]);
  options.mode = std::string(positionals[2]);
  if (positionals.size() == 4U) {
    options.output_path = fs::path(positionals[3]);
  }
  if (options.mode.empty()) {
    error = "mode must not be empty (e.g. baseline, with-plugin)";
    return false;
  }
  return true;
}

bool ParseCompareOptions(const std::vector<std::string_view>& args, CompareOptions& options,
                         std::string& error) {
  std::vector<std::string_view> positionals;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--log-level") {
      if (!ParseLogLevelFlag(args, i, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positionals.push_back(token);
  }

  if (positionals.size() < 2U) {
    error = "compare requires <baseline.json> <with_plugin.json>";
    return false;
  }
  if (positionals.size() > 3U) {
    error = "compare accepts at most 3 positional arguments";
    return false;
  }

  options.baseline_path = fs::path(positionals[0]);
  options.with_plugin_path = fs::path(positionals[1]);
  if (positionals.size() == 3U) {
    options.output_path = fs::path(positionals[2]);
  }
  return true;
}

// `--scenarios-dir` is the only flag shared by validate and list.
bool ParseScenarioDirArgs(const std::vector<std::string_view>& args, fs::path& scenarios_dir,
                          std::vector<std::string_view>& positionals, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--scenarios-dir") {
      std::string_view value;
      if (!TakeFlagValue(args, i, token, value, error)) {
        return false;
      }
      scenarios_dir = fs::path(value);
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positionals.push_back(token);
  }
  return true;
}

bool BuildEnvironment(const VerifyOptions& options, const core::config::EnvLookup& base,
                      core::config::EnvLookup& env, std::string& error) {
  if (!options.env_file.has_value()) {
    env = base;
    return true;
  }
  std::map<std::string, std::string> entries;
  if (!core::config::LoadEnvFile(*options.env_file, entries, error)) {
    return false;
  }
  env = core::config::OverlayEnvironment(std::move(entries), base);
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "plugeval " << kVersion << '\n';
  return kExitSuccess;
}

int CommandVerify(const std::vector<std::string_view>& args) {
  VerifyOptions options;
  std::string error;
  if (!ParseVerifyOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteVerify(options, VerifyDependencies{});
}

int CommandCompare(const std::vector<std::string_view>& args) {
  CompareOptions options;
  std::string error;
  if (!ParseCompareOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetContext("compare");

  std::error_code ec;
  if (!fs::is_regular_file(options.baseline_path, ec)) {
    std::cerr << "error: baseline file not found: " << options.baseline_path.string() << '\n';
    return kExitFailure;
  }
  if (!fs::is_regular_file(options.with_plugin_path, ec)) {
    std::cerr << "error: plugin file not found: " << options.with_plugin_path.string() << '\n';
    return kExitFailure;
  }

  core::schema::ResultDocument baseline;
  if (!core::schema::LoadResultDocumentFile(options.baseline_path, baseline, error)) {
    logger.Error("failed to load baseline results", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  core::schema::ResultDocument with_plugin;
  if (!core::schema::LoadResultDocumentFile(options.with_plugin_path, with_plugin, error)) {
    logger.Error("failed to load plugin results", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (baseline.scenario != with_plugin.scenario) {
    logger.Warn("comparing results from different scenarios",
                {{"baseline", baseline.scenario}, {"with_plugin", with_plugin.scenario}});
  }

  const core::schema::ComparisonReport report = compare::Compare(baseline, with_plugin);
  report::PrintComparisonReport(report, std::cout);
  logger.Debug("comparison computed",
               {{"improvements", std::to_string(report.improvements.size())},
                {"regressions", std::to_string(report.regressions.size())},
                {"verdict", core::schema::ToString(report.summary.verdict)}});

  if (options.output_path.has_value()) {
    if (!core::WriteTextFileAtomic(*options.output_path, core::schema::ToJson(report), error)) {
      logger.Error("failed to write comparison report", {{"error", error}});
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    std::cout << "\nComparison saved to: " << options.output_path->string() << '\n';
  }
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  fs::path scenarios_dir = "scenarios";
  std::vector<std::string_view> positionals;
  std::string error;
  if (!ParseScenarioDirArgs(args, scenarios_dir, positionals, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (positionals.size() != 1U) {
    std::cerr << "error: validate requires exactly 1 argument: <scenario>\n";
    return kExitUsage;
  }

  fs::path scenario_path;
  if (!scenarios::ResolveScenarioPath(positionals.front(), scenarios_dir, scenario_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitScenarioInvalid;
  }

  scenarios::ValidationReport report;
  if (!scenarios::ValidateScenarioFile(scenario_path, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitScenarioInvalid;
  }

  if (!report.valid) {
    std::cerr << "invalid scenario: " << scenario_path.string() << '\n';
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    return kExitScenarioInvalid;
  }

  std::cout << "valid: " << scenario_path.string() << '\n';
  return kExitSuccess;
}

int CommandList(const std::vector<std::string_view>& args) {
  fs::path scenarios_dir = "scenarios";
  std::vector<std::string_view> positionals;
  std::string error;
  if (!ParseScenarioDirArgs(args, scenarios_dir, positionals, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!positionals.empty()) {
    std::cerr << "error: list does not accept positional arguments\n";
    return kExitUsage;
  }

  std::vector<std::string> names;
  if (!scenarios::ListScenarioNames(scenarios_dir, names, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  for (const auto& name : names) {
    std::cout << name << '\n';
  }
  return kExitSuccess;
}

} // namespace

int ExecuteVerify(const VerifyOptions& options, const VerifyDependencies& deps) {
  std::ostream& out = *deps.out;
  core::logging::Logger logger(options.log_level, *deps.log);
  logger.SetContext(options.scenario + ":" + options.mode);

  std::string error;
  core::config::EnvLookup env;
  if (!BuildEnvironment(options, deps.env, env, error)) {
    logger.Error("failed to load env file", {{"error", error}});
    return kExitConfigInvalid;
  }

  core::config::EvalConfig config;
  if (!core::config::LoadEvalConfig(env, config, error)) {
    logger.Error("invalid configuration", {{"error", error}});
    return kExitConfigInvalid;
  }

  fs::path scenario_path;
  if (!scenarios::ResolveScenarioPath(options.scenario, options.scenarios_dir, scenario_path,
                                      error)) {
    logger.Error("scenario not found", {{"error", error}});
    return kExitScenarioInvalid;
  }
  scenarios::Scenario scenario;
  if (!scenarios::LoadScenarioFile(scenario_path, scenario, error)) {
    logger.Error("failed to load scenario",
                 {{"path", scenario_path.string()}, {"error", error}});
    return kExitScenarioInvalid;
  }

  std::error_code ec;
  if (!fs::is_directory(options.project_dir, ec)) {
    logger.Warn("project directory does not exist", {{"path", options.project_dir.string()}});
  }

  logger.Info("verify requested",
              {{"scenario_path", scenario_path.string()},
               {"project_dir", options.project_dir.string()},
               {"criteria", std::to_string(scenario.criteria.size())},
               {"remote", config.remote.HasCredentials() ? "configured" : "unconfigured"}});

  out << "Verifying scenario: " << scenario.name << '\n'
      << "Project directory: " << options.project_dir.string() << '\n'
      << "Mode: " << options.mode << '\n'
      << '\n';

  std::unique_ptr<remote::HttpRecordClient> http_client;
  remote::IRecordClient* client = deps.client;
  if (client == nullptr) {
    http_client = std::make_unique<remote::HttpRecordClient>(config.remote);
    client = http_client.get();
  }

  runner::ScenarioRunner scenario_runner(config, *client, logger);
  const core::schema::ResultDocument document =
      scenario_runner.Run(scenario, options.project_dir, options.mode);

  report::PrintVerifyReport(document, out);

  if (options.output_path.has_value()) {
    if (!core::WriteTextFileAtomic(*options.output_path, core::schema::ToJson(document), error)) {
      logger.Error("failed to write result document", {{"error", error}});
      return kExitFailure;
    }
    out << "\nResults saved to: " << options.output_path->string() << '\n';
  }

  const bool satisfied = runner::AllCriteriaSatisfied(document);
  logger.Info("verify finished",
              {{"total", std::to_string(document.score.total)},
               {"max_total", std::to_string(document.score.max_total)},
               {"all_satisfied", satisfied ? "true" : "false"}});
  return satisfied ? kExitSuccess : kExitFailure;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "verify") {
    return CommandVerify(args);
  }

  if (command == "compare") {
    return CommandCompare(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "list") {
    return CommandList(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace plugeval::cli
