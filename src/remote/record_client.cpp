#include "remote/record_client.hpp"

namespace plugeval::remote {

const char* ToString(ApiErrorKind kind) {
  switch (kind) {
  case ApiErrorKind::kTransport:
    return "transport";
  case ApiErrorKind::kHttpStatus:
    return "http_status";
  case ApiErrorKind::kProtocol:
    return "protocol";
  }
  return "transport";
}

const core::json::Value* ListPayload(const ApiResponse& response) {
  if (response.data.IsArray()) {
    return &response.data;
  }
  const core::json::Value* data = response.data.Find("data");
  if (data == nullptr || !data->IsArray()) {
    return nullptr;
  }
  return data;
}

} // namespace plugeval::remote
