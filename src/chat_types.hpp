#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace linebridge {

struct ChatMessage {
  std::string role;
  std::string content;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream = false;
};

struct Identity {
  std::string caller_id;
  std::string conversation_id;
};

struct PromptTokensDetails {
  int cached_tokens = 0;
  int audio_tokens = 0;
};

struct CompletionTokensDetails {
  int reasoning_tokens = 0;
  int audio_tokens = 0;
  int accepted_prediction_tokens = 0;
  int rejected_prediction_tokens = 0;
};

// The total is derived, never stored, so it cannot drift from its parts.
struct Usage {
  int prompt_tokens = 0;
  int completion_tokens = 0;
  PromptTokensDetails prompt_details;
  CompletionTokensDetails completion_details;

  // Widened so two saturated counts still add up exactly.
  int64_t total_tokens() const { return static_cast<int64_t>(prompt_tokens) + completion_tokens; }
};

nlohmann::json UsageToJson(const Usage& u);

// Accepts string content or an array of {type:"text", text} parts.
bool ParseChatRequest(const nlohmann::json& body, ChatRequest* out, std::string* err);

}  // namespace linebridge
