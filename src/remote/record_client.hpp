#pragma once

#include "core/json_dom.hpp"

#include <string>

namespace plugeval::remote {

// Classifies remote failures so checks can report `api_reachable` and
// `status_code` without inspecting transport internals.
enum class ApiErrorKind {
  kTransport,   // host unreachable, TLS failure, timeout
  kHttpStatus,  // server answered with a non-2xx status
  kProtocol,    // 2xx answer whose body is not the expected JSON
};

const char* ToString(ApiErrorKind kind);

struct ApiError {
  ApiErrorKind kind = ApiErrorKind::kTransport;
  long status_code = 0;
  std::string message;

  // The server answered, even if unhappily.
  bool ApiReachable() const {
    return kind != ApiErrorKind::kTransport;
  }
};

struct ApiResponse {
  long status_code = 0;
  // Parsed JSON body; an empty body parses as an empty object.
  core::json::Value data;
};

// Narrow read contract for the observability platform. One call maps to one
// blocking request; implementations never retry.
//
// Every method returns true with `response` populated on a 2xx answer, or
// false with `error` populated.
class IRecordClient {
public:
  virtual ~IRecordClient() = default;

  // `filters` is forwarded as the request's `filters` member. Servers may
  // ignore it, so callers re-filter client-side.
  virtual bool SearchCompletions(const core::json::Value& filters, ApiResponse& response,
                                 ApiError& error) = 0;

  virtual bool ListPromptTemplates(ApiResponse& response, ApiError& error) = 0;

  virtual bool GetPromptTemplateVersion(const std::string& template_id,
                                        const std::string& version_id, ApiResponse& response,
                                        ApiError& error) = 0;

  virtual bool ListDatasets(ApiResponse& response, ApiError& error) = 0;

  virtual bool ListDatasetTestCases(const std::string& dataset_id, ApiResponse& response,
                                    ApiError& error) = 0;

  virtual bool ListTestRuns(ApiResponse& response, ApiError& error) = 0;

  virtual bool GetTestRun(const std::string& test_run_id, ApiResponse& response,
                          ApiError& error) = 0;
};

// Returns the `data` array of a list response (or the body itself when it is a
// bare array), or nullptr when the payload carries no records.
const core::json::Value* ListPayload(const ApiResponse& response);

} // namespace plugeval::remote
