#pragma once

#include "core/config/eval_config.hpp"
#include "remote/record_client.hpp"

#include <optional>
#include <string>

namespace plugeval::remote {

// libcurl-backed client for the platform's v2 REST API.
//
// - bearer authentication from RemoteSettings::api_key
// - fixed per-request timeout (RemoteSettings::request_timeout)
// - peer/host verification disabled when RemoteSettings::verify_tls is false
// - one attempt per call; failures are reported, never retried
class HttpRecordClient final : public IRecordClient {
public:
  explicit HttpRecordClient(core::config::RemoteSettings settings);

  bool SearchCompletions(const core::json::Value& filters, ApiResponse& response,
                         ApiError& error) override;
  bool ListPromptTemplates(ApiResponse& response, ApiError& error) override;
  bool GetPromptTemplateVersion(const std::string& template_id, const std::string& version_id,
                                ApiResponse& response, ApiError& error) override;
  bool ListDatasets(ApiResponse& response, ApiError& error) override;
  bool ListDatasetTestCases(const std::string& dataset_id, ApiResponse& response,
                            ApiError& error) override;
  bool ListTestRuns(ApiResponse& response, ApiError& error) override;
  bool GetTestRun(const std::string& test_run_id, ApiResponse& response,
                  ApiError& error) override;

private:
  std::string ProjectPath(const std::string& suffix) const;

  bool Request(const char* method, const std::string& path,
               const std::optional<core::json::Value>& body, ApiResponse& response,
               ApiError& error);

  core::config::RemoteSettings settings_;
};

} // namespace plugeval::remote
