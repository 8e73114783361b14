#pragma once

#include "cancel_token.hpp"
#include "token_counter.hpp"
#include "upstream/transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace linebridge {

struct CompletionMeta {
  std::string id;
  int64_t created = 0;
  std::string model;
};

// Accumulates a whole backend body into one chat.completion object.
class ResponseAssembler {
 public:
  enum class Status {
    kOk,
    kCancelled,
    kFailed,
  };

  ResponseAssembler(TokenCounter* counter, size_t initial_buffer_size, size_t max_line_size);

  Status Consume(BodyReader* body, CancelToken* cancel, std::string* err);
  void AddLine(const std::string& line);

  // Estimates output tokens, reconciles usage and renders the response.
  nlohmann::json BuildCompletion(const CompletionMeta& meta);

  const std::string& content() const { return content_; }
  const std::string& reasoning() const { return reasoning_; }
  const std::string& finish_reason() const { return finish_reason_; }

 private:
  TokenCounter* counter_;
  size_t initial_buffer_size_;
  size_t max_line_size_;
  std::string content_;
  std::string reasoning_;
  std::string finish_reason_ = "stop";
};

}  // namespace linebridge
