#include "chat_types.hpp"

namespace linebridge {
namespace {

static std::string ExtractContentText(const nlohmann::json& content) {
  if (content.is_string()) return content.get<std::string>();
  if (!content.is_array()) return {};
  std::string out;
  for (const auto& part : content) {
    if (!part.is_object()) continue;
    if (part.contains("text") && part["text"].is_string()) out += part["text"].get<std::string>();
  }
  return out;
}

}  // namespace

nlohmann::json UsageToJson(const Usage& u) {
  nlohmann::json j;
  j["prompt_tokens"] = u.prompt_tokens;
  j["completion_tokens"] = u.completion_tokens;
  j["total_tokens"] = u.total_tokens();
  const auto& pd = u.prompt_details;
  if (pd.cached_tokens > 0 || pd.audio_tokens > 0) {
    j["prompt_tokens_details"] = {{"cached_tokens", pd.cached_tokens}, {"audio_tokens", pd.audio_tokens}};
  }
  const auto& cd = u.completion_details;
  if (cd.reasoning_tokens > 0 || cd.audio_tokens > 0 || cd.accepted_prediction_tokens > 0 ||
      cd.rejected_prediction_tokens > 0) {
    j["completion_tokens_details"] = {{"reasoning_tokens", cd.reasoning_tokens},
                                      {"audio_tokens", cd.audio_tokens},
                                      {"accepted_prediction_tokens", cd.accepted_prediction_tokens},
                                      {"rejected_prediction_tokens", cd.rejected_prediction_tokens}};
  }
  return j;
}

bool ParseChatRequest(const nlohmann::json& body, ChatRequest* out, std::string* err) {
  if (!out) return false;
  if (!body.is_object()) {
    if (err) *err = "request body must be a JSON object";
    return false;
  }
  ChatRequest req;
  if (body.contains("model")) {
    if (!body["model"].is_string()) {
      if (err) *err = "model must be a string";
      return false;
    }
    req.model = body["model"].get<std::string>();
  }
  if (body.contains("stream") && body["stream"].is_boolean()) req.stream = body["stream"].get<bool>();
  if (body.contains("messages")) {
    if (!body["messages"].is_array()) {
      if (err) *err = "messages must be an array";
      return false;
    }
    for (const auto& m : body["messages"]) {
      if (!m.is_object()) {
        if (err) *err = "messages must contain objects";
        return false;
      }
      ChatMessage msg;
      if (m.contains("role") && m["role"].is_string()) msg.role = m["role"].get<std::string>();
      if (m.contains("content")) msg.content = ExtractContentText(m["content"]);
      req.messages.push_back(std::move(msg));
    }
  }
  *out = std::move(req);
  return true;
}

}  // namespace linebridge
