#include "checks/api_verify_check.hpp"

#include <array>
#include <cmath>
#include <optional>
#include <utility>

namespace plugeval::checks {

namespace json = core::json;
using core::schema::CheckKind;
using core::schema::CheckOutcome;
using core::schema::PassState;
using scenarios::ApiVerifyCriterion;

namespace {

constexpr std::string_view kTestRunTimeField = "created_at";

void RecordReachable(const remote::ApiResponse& response, CheckOutcome& outcome) {
  outcome.details["api_reachable"] = json::MakeBool(true);
  outcome.details["status_code"] = json::MakeNumber(static_cast<double>(response.status_code));
}

void RecordFailure(const remote::ApiError& error, CheckOutcome& outcome) {
  outcome.details["api_reachable"] = json::MakeBool(error.ApiReachable());
  outcome.details["error_kind"] = json::MakeString(remote::ToString(error.kind));
  if (error.status_code != 0) {
    outcome.details["status_code"] = json::MakeNumber(static_cast<double>(error.status_code));
  }
  outcome.error = error.message;
  outcome.passed = PassState::kFailed;
}

void PassIf(bool condition, CheckOutcome& outcome) {
  outcome.passed = condition ? PassState::kPassed : PassState::kFailed;
}

json::Value MakeCount(std::size_t count) {
  return json::MakeNumber(static_cast<double>(count));
}

std::size_t RecordCount(const json::Value* records) {
  return records == nullptr ? 0U : records->array_value.size();
}

// Python-style truthiness for loosely typed metadata values.
bool IsTruthy(const json::Value& value) {
  switch (value.type) {
  case json::Value::Type::kObject:
    return !value.object_value.empty();
  case json::Value::Type::kArray:
    return !value.array_value.empty();
  case json::Value::Type::kString:
    return !value.string_value.empty();
  case json::Value::Type::kNumber:
    return value.number_value != 0.0;
  case json::Value::Type::kBool:
    return value.bool_value;
  case json::Value::Type::kNull:
    return false;
  }
  return false;
}

// Ids arrive as strings or numbers depending on the endpoint.
std::optional<std::string> ReadId(const json::Value& record, std::string_view key) {
  const json::Value* value = record.Find(key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->IsString() && !value->string_value.empty()) {
    return value->string_value;
  }
  if (value->IsNumber() && std::isfinite(value->number_value)) {
    return json::FormatNumber(value->number_value);
  }
  return std::nullopt;
}

const json::Value* FindByName(const json::Value* records, std::string_view name) {
  if (records == nullptr) {
    return nullptr;
  }
  for (const auto& record : records->array_value) {
    const std::optional<std::string> record_name = json::GetString(record, "name");
    if (record_name.has_value() && *record_name == name) {
      return &record;
    }
  }
  return nullptr;
}

// Some detail endpoints wrap the record as `{"data": {...}}`.
const json::Value& UnwrapRecord(const json::Value& body) {
  const json::Value* data = body.Find("data");
  if (data != nullptr && data->IsObject()) {
    return *data;
  }
  return body;
}

bool MessageHasPlaceholder(const json::Value& message, const std::string& placeholder) {
  if (message.IsString()) {
    return message.string_value.find(placeholder) != std::string::npos;
  }
  const std::optional<std::string> content = json::GetString(message, "content");
  return content.has_value() && content->find(placeholder) != std::string::npos;
}

} // namespace

bool IsKnownApiVerifyMethod(std::string_view method) {
  return ApiVerifier::Supports(method);
}

std::string ExpectedApiVerifyMethodList() {
  return "search_completions|check_prompt_exists|check_completion_has_prompt|"
         "check_prompt_has_variable|check_dataset_exists|check_dataset_has_test_cases|"
         "check_test_run_exists|check_test_run_has_sessions";
}

ApiVerifier::ApiVerifier(const core::config::EvalConfig& config, remote::IRecordClient& client,
                         std::chrono::system_clock::time_point now)
    : config_(config), client_(client), now_(now) {}

bool ApiVerifier::Supports(std::string_view method) {
  return FindMethod(method) != nullptr;
}

ApiVerifier::Method ApiVerifier::FindMethod(std::string_view name) {
  static const std::array<std::pair<std::string_view, Method>, 8> kMethods = {{
      {"search_completions", &ApiVerifier::SearchCompletions},
      {"check_prompt_exists", &ApiVerifier::CheckPromptExists},
      {"check_completion_has_prompt", &ApiVerifier::CheckCompletionHasPrompt},
      {"check_prompt_has_variable", &ApiVerifier::CheckPromptHasVariable},
      {"check_dataset_exists", &ApiVerifier::CheckDatasetExists},
      {"check_dataset_has_test_cases", &ApiVerifier::CheckDatasetHasTestCases},
      {"check_test_run_exists", &ApiVerifier::CheckTestRunExists},
      {"check_test_run_has_sessions", &ApiVerifier::CheckTestRunHasSessions},
  }};
  for (const auto& [method_name, handler] : kMethods) {
    if (method_name == name) {
      return handler;
    }
  }
  return nullptr;
}

CheckOutcome ApiVerifier::Run(const ApiVerifyCriterion& criterion) {
  CheckOutcome outcome;
  outcome.kind = CheckKind::kApiVerify;
  outcome.check_name = core::schema::ToString(CheckKind::kApiVerify);
  outcome.method = criterion.method;

  const Method handler = FindMethod(criterion.method);
  if (handler == nullptr) {
    outcome.error = "Unknown api_verify method: " + criterion.method;
    return outcome;
  }

  if (!config_.remote.HasCredentials()) {
    outcome.passed = PassState::kUnknown;
    outcome.reason = std::string(kMissingCredentialsReason);
    return outcome;
  }

  (this->*handler)(criterion, outcome);
  return outcome;
}

bool ApiVerifier::ResolveBoundary(CheckOutcome& outcome, reconcile::WindowBoundary& boundary) {
  std::string error;
  if (!reconcile::ResolveWindowBoundary(config_.eval_start_time, now_, boundary, error)) {
    outcome.error = error;
    outcome.passed = PassState::kFailed;
    return false;
  }
  outcome.details["since"] = json::MakeString(boundary.text);
  return true;
}

bool ApiVerifier::FetchRecentCompletions(CheckOutcome& outcome, remote::ApiResponse& response,
                                         reconcile::ReconciledSet& recent) {
  reconcile::WindowBoundary boundary;
  if (!ResolveBoundary(outcome, boundary)) {
    return false;
  }

  // The server may ignore this filter; the reconciler re-applies it locally.
  json::Value filters = json::MakeObject();
  filters.Set("field", json::MakeString("start_time"));
  filters.Set("operator", json::MakeString("gte"));
  filters.Set("value", json::MakeString(boundary.text));

  remote::ApiError error;
  if (!client_.SearchCompletions(filters, response, error)) {
    RecordFailure(error, outcome);
    return false;
  }
  RecordReachable(response, outcome);

  recent = reconcile::ReconcileByTimestamp(remote::ListPayload(response), boundary);
  outcome.details["completion_count"] = MakeCount(recent.Count());
  outcome.details["total_returned"] = MakeCount(recent.total_returned);
  return true;
}

bool ApiVerifier::FetchRecentTestRuns(CheckOutcome& outcome, remote::ApiResponse& response,
                                      reconcile::ReconciledSet& recent) {
  reconcile::WindowBoundary boundary;
  if (!ResolveBoundary(outcome, boundary)) {
    return false;
  }
  outcome.details["since_epoch"] = json::MakeNumber(static_cast<double>(boundary.epoch_seconds));

  remote::ApiError error;
  if (!client_.ListTestRuns(response, error)) {
    RecordFailure(error, outcome);
    return false;
  }
  RecordReachable(response, outcome);

  recent = reconcile::ReconcileByEpoch(remote::ListPayload(response), kTestRunTimeField, boundary);
  outcome.details["test_run_count"] = MakeCount(recent.Count());
  outcome.details["total_returned"] = MakeCount(recent.total_returned);
  return true;
}

void ApiVerifier::SearchCompletions(const ApiVerifyCriterion& /*criterion*/,
                                    CheckOutcome& outcome) {
  remote::ApiResponse response;
  reconcile::ReconciledSet recent;
  if (!FetchRecentCompletions(outcome, response, recent)) {
    return;
  }
  PassIf(recent.Count() > 0U, outcome);
}

void ApiVerifier::CheckPromptExists(const ApiVerifyCriterion& criterion, CheckOutcome& outcome) {
  outcome.details["prompt_name"] = json::MakeString(criterion.prompt_name);

  remote::ApiResponse response;
  remote::ApiError error;
  if (!client_.ListPromptTemplates(response, error)) {
    RecordFailure(error, outcome);
    return;
  }
  RecordReachable(response, outcome);

  const json::Value* templates = remote::ListPayload(response);
  const bool found = FindByName(templates, criterion.prompt_name) != nullptr;
  outcome.details["template_count"] = MakeCount(RecordCount(templates));
  outcome.details["found"] = json::MakeBool(found);
  PassIf(found, outcome);
}

void ApiVerifier::CheckCompletionHasPrompt(const ApiVerifyCriterion& /*criterion*/,
                                           CheckOutcome& outcome) {
  outcome.details["has_prompt"] = json::MakeBool(false);
  outcome.details["prompt_template"] = json::MakeNull();

  remote::ApiResponse response;
  reconcile::ReconciledSet recent;
  if (!FetchRecentCompletions(outcome, response, recent)) {
    return;
  }

  for (const json::Value* completion : recent.in_window) {
    const json::Value* prompt_template =
        json::FindPath(*completion, {"completion_metadata", "prompt_template"});
    if (prompt_template != nullptr && IsTruthy(*prompt_template)) {
      outcome.details["has_prompt"] = json::MakeBool(true);
      outcome.details["prompt_template"] = *prompt_template;
      outcome.passed = PassState::kPassed;
      return;
    }
  }
  outcome.passed = PassState::kFailed;
}

void ApiVerifier::CheckPromptHasVariable(const ApiVerifyCriterion& criterion,
                                         CheckOutcome& outcome) {
  outcome.details["prompt_name"] = json::MakeString(criterion.prompt_name);
  outcome.details["variable_name"] = json::MakeString(criterion.variable_name);
  outcome.details["found"] = json::MakeBool(false);

  remote::ApiResponse templates_response;
  remote::ApiError error;
  if (!client_.ListPromptTemplates(templates_response, error)) {
    RecordFailure(error, outcome);
    return;
  }
  RecordReachable(templates_response, outcome);

  const json::Value* prompt_template =
      FindByName(remote::ListPayload(templates_response), criterion.prompt_name);
  if (prompt_template == nullptr) {
    outcome.error = "Prompt template '" + criterion.prompt_name + "' not found";
    return;
  }

  const std::optional<std::string> template_id = ReadId(*prompt_template, "id");
  std::optional<std::string> version_id = ReadId(*prompt_template, "latest_version_id");
  if (!version_id.has_value()) {
    version_id = ReadId(*prompt_template, "latest_template_version_id");
  }
  if (!template_id.has_value() || !version_id.has_value()) {
    outcome.error = "Prompt template '" + criterion.prompt_name + "' has no latest version";
    return;
  }
  outcome.details["template_id"] = json::MakeString(*template_id);
  outcome.details["version_id"] = json::MakeString(*version_id);

  remote::ApiResponse version_response;
  if (!client_.GetPromptTemplateVersion(*template_id, *version_id, version_response, error)) {
    RecordFailure(error, outcome);
    return;
  }
  RecordReachable(version_response, outcome);

  const json::Value& version = UnwrapRecord(version_response.data);
  const std::string placeholder = "{{" + criterion.variable_name + "}}";
  bool found = false;
  std::size_t message_count = 0;
  if (const json::Value* content = version.Find("content"); content != nullptr) {
    if (content->IsArray()) {
      message_count = content->array_value.size();
      for (const auto& message : content->array_value) {
        if (MessageHasPlaceholder(message, placeholder)) {
          found = true;
          break;
        }
      }
    } else if (content->IsString()) {
      message_count = 1;
      found = MessageHasPlaceholder(*content, placeholder);
    }
  }

  outcome.details["message_count"] = MakeCount(message_count);
  outcome.details["found"] = json::MakeBool(found);
  PassIf(!criterion.variable_name.empty() && found, outcome);
}

void ApiVerifier::CheckDatasetExists(const ApiVerifyCriterion& criterion, CheckOutcome& outcome) {
  outcome.details["dataset_name"] = json::MakeString(criterion.dataset_name);

  remote::ApiResponse response;
  remote::ApiError error;
  if (!client_.ListDatasets(response, error)) {
    RecordFailure(error, outcome);
    return;
  }
  RecordReachable(response, outcome);

  const json::Value* datasets = remote::ListPayload(response);
  const bool found = FindByName(datasets, criterion.dataset_name) != nullptr;
  outcome.details["dataset_count"] = MakeCount(RecordCount(datasets));
  outcome.details["found"] = json::MakeBool(found);
  PassIf(found, outcome);
}

void ApiVerifier::CheckDatasetHasTestCases(const ApiVerifyCriterion& criterion,
                                           CheckOutcome& outcome) {
  outcome.details["min_test_cases"] = MakeCount(criterion.min_test_cases);

  remote::ApiResponse datasets_response;
  remote::ApiError error;
  if (!client_.ListDatasets(datasets_response, error)) {
    RecordFailure(error, outcome);
    return;
  }
  RecordReachable(datasets_response, outcome);

  const json::Value* datasets = remote::ListPayload(datasets_response);
  outcome.details["dataset_count"] = MakeCount(RecordCount(datasets));
  if (RecordCount(datasets) == 0U) {
    outcome.error = "No datasets found";
    return;
  }

  // Falls back to the first listed dataset when no name is given or none
  // matches; list order is the server's, so this is not deterministic under
  // concurrent dataset creation.
  const json::Value* dataset = nullptr;
  if (!criterion.dataset_name.empty()) {
    dataset = FindByName(datasets, criterion.dataset_name);
  }
  const bool used_fallback = dataset == nullptr;
  if (used_fallback) {
    dataset = &datasets->array_value.front();
  }
  outcome.details["used_fallback"] = json::MakeBool(used_fallback);
  outcome.details["dataset_name"] =
      json::MakeString(json::GetString(*dataset, "name").value_or(std::string{}));

  const std::optional<std::string> dataset_id = ReadId(*dataset, "id");
  if (!dataset_id.has_value()) {
    outcome.error = "Dataset record has no id";
    return;
  }
  outcome.details["dataset_id"] = json::MakeString(*dataset_id);

  remote::ApiResponse cases_response;
  if (!client_.ListDatasetTestCases(*dataset_id, cases_response, error)) {
    RecordFailure(error, outcome);
    return;
  }
  RecordReachable(cases_response, outcome);

  const std::size_t test_case_count = RecordCount(remote::ListPayload(cases_response));
  outcome.details["test_case_count"] = MakeCount(test_case_count);
  PassIf(test_case_count >= criterion.min_test_cases, outcome);
}

void ApiVerifier::CheckTestRunExists(const ApiVerifyCriterion& /*criterion*/,
                                     CheckOutcome& outcome) {
  remote::ApiResponse response;
  reconcile::ReconciledSet recent;
  if (!FetchRecentTestRuns(outcome, response, recent)) {
    return;
  }
  PassIf(recent.Count() > 0U, outcome);
}

void ApiVerifier::CheckTestRunHasSessions(const ApiVerifyCriterion& criterion,
                                          CheckOutcome& outcome) {
  outcome.details["min_sessions"] = MakeCount(criterion.min_sessions);

  remote::ApiResponse runs_response;
  reconcile::ReconciledSet recent;
  if (!FetchRecentTestRuns(outcome, runs_response, recent)) {
    return;
  }
  if (recent.in_window.empty()) {
    outcome.passed = PassState::kFailed;
    return;
  }

  // The platform does not document the order of the test-run listing, so the
  // most recent run is picked by `created_at` rather than by list position.
  // The earliest listed wins a tie.
  const json::Value* latest = recent.in_window.front();
  double latest_epoch = json::GetNumber(*latest, kTestRunTimeField).value_or(0.0);
  for (const json::Value* run : recent.in_window) {
    const double epoch = json::GetNumber(*run, kTestRunTimeField).value_or(0.0);
    if (epoch > latest_epoch) {
      latest = run;
      latest_epoch = epoch;
    }
  }

  const std::optional<std::string> run_id = ReadId(*latest, "id");
  if (!run_id.has_value()) {
    outcome.error = "Test run record has no id";
    return;
  }
  outcome.details["test_run_id"] = json::MakeString(*run_id);

  remote::ApiResponse detail_response;
  remote::ApiError error;
  if (!client_.GetTestRun(*run_id, detail_response, error)) {
    RecordFailure(error, outcome);
    return;
  }
  RecordReachable(detail_response, outcome);

  const json::Value& detail = UnwrapRecord(detail_response.data);
  std::size_t session_count = 0;
  if (const json::Value* sessions = detail.Find("sessions");
      sessions != nullptr && sessions->IsArray()) {
    session_count = sessions->array_value.size();
  } else if (const std::optional<double> count = json::GetNumber(detail, "session_count");
             count.has_value() && *count > 0.0) {
    session_count = static_cast<std::size_t>(*count);
  }

  outcome.details["session_count"] = MakeCount(session_count);
  PassIf(session_count >= criterion.min_sessions, outcome);
}

} // namespace plugeval::checks
