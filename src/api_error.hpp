#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace linebridge {

struct ApiError {
  int status = 500;
  std::string type = "server_error";
  std::string message;
};

inline nlohmann::json MakeError(const std::string& message, const std::string& type) {
  nlohmann::json j;
  j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
  return j;
}

inline nlohmann::json ToJson(const ApiError& e) {
  return MakeError(e.message, e.type);
}

inline ApiError InvalidRequestError(std::string message) {
  return ApiError{400, "invalid_request_error", std::move(message)};
}

inline ApiError UnauthorizedError(std::string message) {
  return ApiError{401, "authentication_error", std::move(message)};
}

inline ApiError TooManyRequestsError(std::string message) {
  return ApiError{429, "rate_limit_error", std::move(message)};
}

inline ApiError ServiceUnavailableError(std::string message) {
  return ApiError{503, "service_unavailable", std::move(message)};
}

inline ApiError InternalError(std::string message) {
  return ApiError{500, "server_error", std::move(message)};
}

}  // namespace linebridge
