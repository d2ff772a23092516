#include "remote/testing/fake_record_client.hpp"

namespace plugeval::remote::testing {

FakeRecordClient::Reply FakeRecordClient::Ok(core::json::Value data, long status_code) {
  Reply reply;
  reply.ok = true;
  reply.response.status_code = status_code;
  reply.response.data = std::move(data);
  return reply;
}

FakeRecordClient::Reply FakeRecordClient::List(core::json::Value::Array records) {
  core::json::Value array = core::json::MakeArray();
  array.array_value = std::move(records);
  core::json::Value body = core::json::MakeObject();
  body.Set("data", std::move(array));
  return Ok(std::move(body));
}

FakeRecordClient::Reply FakeRecordClient::Fail(ApiErrorKind kind, long status_code,
                                               std::string message) {
  Reply reply;
  reply.ok = false;
  reply.error.kind = kind;
  reply.error.status_code = status_code;
  reply.error.message = std::move(message);
  reply.response.status_code = status_code;
  return reply;
}

bool FakeRecordClient::Answer(const Reply& reply, ApiResponse& response, ApiError& error) {
  if (reply.ok) {
    response = reply.response;
    error = ApiError{};
    return true;
  }
  response = reply.response;
  error = reply.error;
  return false;
}

bool FakeRecordClient::AnswerKeyed(const std::map<std::string, Reply>& replies,
                                   const std::string& key, ApiResponse& response,
                                   ApiError& error) {
  const auto it = replies.find(key);
  if (it == replies.end()) {
    return Answer(Fail(ApiErrorKind::kHttpStatus, 404, "HTTP Error 404: Not Found"), response,
                  error);
  }
  return Answer(it->second, response, error);
}

bool FakeRecordClient::SearchCompletions(const core::json::Value& filters, ApiResponse& response,
                                         ApiError& error) {
  calls_.push_back("search_completions");
  last_completion_filters_ = filters;
  return Answer(completions_, response, error);
}

bool FakeRecordClient::ListPromptTemplates(ApiResponse& response, ApiError& error) {
  calls_.push_back("list_prompt_templates");
  return Answer(prompt_templates_, response, error);
}

bool FakeRecordClient::GetPromptTemplateVersion(const std::string& template_id,
                                                const std::string& version_id,
                                                ApiResponse& response, ApiError& error) {
  calls_.push_back("get_prompt_template_version:" + template_id + "/" + version_id);
  return AnswerKeyed(template_versions_, template_id + "/" + version_id, response, error);
}

bool FakeRecordClient::ListDatasets(ApiResponse& response, ApiError& error) {
  calls_.push_back("list_datasets");
  return Answer(datasets_, response, error);
}

bool FakeRecordClient::ListDatasetTestCases(const std::string& dataset_id,
                                            ApiResponse& response, ApiError& error) {
  calls_.push_back("list_dataset_test_cases:" + dataset_id);
  return AnswerKeyed(dataset_test_cases_, dataset_id, response, error);
}

bool FakeRecordClient::ListTestRuns(ApiResponse& response, ApiError& error) {
  calls_.push_back("list_test_runs");
  return Answer(test_runs_, response, error);
}

bool FakeRecordClient::GetTestRun(const std::string& test_run_id, ApiResponse& response,
                                  ApiError& error) {
  calls_.push_back("get_test_run:" + test_run_id);
  return AnswerKeyed(test_run_details_, test_run_id, response, error);
}

} // namespace plugeval::remote::testing
