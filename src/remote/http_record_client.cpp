#include "remote/http_record_client.hpp"

#include <curl/curl.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <utility>

namespace plugeval::remote {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

using CurlEasyHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// curl_global_init is not thread-safe; run it exactly once per process.
bool EnsureCurlGlobalInit() {
  static std::once_flag once;
  static CURLcode init_result = CURLE_OK;
  std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  return init_result == CURLE_OK;
}

std::size_t AppendBody(char* data, std::size_t size, std::size_t count, void* user_data) {
  auto* body = static_cast<std::string*>(user_data);
  body->append(data, size * count);
  return size * count;
}

// Identifiers come from remote payloads; escape them before splicing into paths.
// The handle argument of curl_easy_escape is unused on every supported platform.
std::string EscapePathSegment(const std::string& segment) {
  char* escaped = curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()));
  if (escaped == nullptr) {
    return segment;
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

} // namespace

HttpRecordClient::HttpRecordClient(core::config::RemoteSettings settings)
    : settings_(std::move(settings)) {}

std::string HttpRecordClient::ProjectPath(const std::string& suffix) const {
  return "/api/v2/projects/" + settings_.project_id + suffix;
}

bool HttpRecordClient::SearchCompletions(const core::json::Value& filters, ApiResponse& response,
                                         ApiError& error) {
  core::json::Value body = core::json::MakeObject();
  body.Set("filters", filters.IsNull() ? core::json::MakeObject() : filters);
  return Request("POST", ProjectPath("/search/completions"), body, response, error);
}

bool HttpRecordClient::ListPromptTemplates(ApiResponse& response, ApiError& error) {
  return Request("GET", ProjectPath("/prompt-templates"), std::nullopt, response, error);
}

bool HttpRecordClient::GetPromptTemplateVersion(const std::string& template_id,
                                                const std::string& version_id,
                                                ApiResponse& response, ApiError& error) {
  const std::string path = ProjectPath("/prompt-templates/id/" + EscapePathSegment(template_id) +
                                       "/versions/" + EscapePathSegment(version_id));
  return Request("GET", path, std::nullopt, response, error);
}

bool HttpRecordClient::ListDatasets(ApiResponse& response, ApiError& error) {
  return Request("GET", ProjectPath("/prompt-datasets"), std::nullopt, response, error);
}

bool HttpRecordClient::ListDatasetTestCases(const std::string& dataset_id, ApiResponse& response,
                                            ApiError& error) {
  return Request("GET",
                 ProjectPath("/prompt-datasets/id/" + EscapePathSegment(dataset_id) + "/test-cases"),
                 std::nullopt, response, error);
}

bool HttpRecordClient::ListTestRuns(ApiResponse& response, ApiError& error) {
  return Request("GET", ProjectPath("/test-runs"), std::nullopt, response, error);
}

bool HttpRecordClient::GetTestRun(const std::string& test_run_id, ApiResponse& response,
                                  ApiError& error) {
  return Request("GET", ProjectPath("/test-runs/id/" + EscapePathSegment(test_run_id)),
                 std::nullopt, response, error);
}

bool HttpRecordClient::Request(const char* method, const std::string& path,
                               const std::optional<core::json::Value>& body,
                               ApiResponse& response, ApiError& error) {
  response = ApiResponse{};
  error = ApiError{};

  if (!EnsureCurlGlobalInit()) {
    error.kind = ApiErrorKind::kTransport;
    error.message = "failed to initialize libcurl";
    return false;
  }

  CurlEasyHandle handle(curl_easy_init());
  if (!handle) {
    error.kind = ApiErrorKind::kTransport;
    error.message = "failed to create libcurl handle";
    return false;
  }

  const std::string url = settings_.base_url + path;
  const std::string auth_header = "Authorization: Bearer " + settings_.api_key;

  curl_slist* raw_headers = nullptr;
  raw_headers = curl_slist_append(raw_headers, auth_header.c_str());
  raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
  raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
  CurlHeaderList headers(raw_headers);

  std::string payload;
  if (body.has_value()) {
    payload = core::json::Serialize(*body, 0);
  }

  std::string response_body;
  char error_buffer[CURL_ERROR_SIZE] = {0};
  const long timeout_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(settings_.request_timeout).count());

  CURL* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &AppendBody);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
  if (body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  }
  if (!settings_.verify_tls) {
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    error.kind = ApiErrorKind::kTransport;
    error.message = std::string(method) + " " + url + " failed: " +
                    (error_buffer[0] != '\0' ? std::string(error_buffer)
                                             : std::string(curl_easy_strerror(code)));
    return false;
  }

  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
  response.status_code = status_code;
  if (status_code < 200 || status_code >= 300) {
    error.kind = ApiErrorKind::kHttpStatus;
    error.status_code = status_code;
    error.message = "HTTP Error " + std::to_string(status_code) + " from " + method + " " + url;
    return false;
  }

  if (response_body.empty()) {
    response.data = core::json::MakeObject();
    return true;
  }

  std::string parse_error;
  if (!core::json::Parse(response_body, response.data, parse_error)) {
    error.kind = ApiErrorKind::kProtocol;
    error.status_code = status_code;
    error.message = "invalid JSON from " + std::string(method) + " " + url + ": " + parse_error;
    return false;
  }
  return true;
}

} // namespace plugeval::remote
