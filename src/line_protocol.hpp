#pragma once

#include "chat_types.hpp"

#include <optional>
#include <string>

namespace linebridge {

// One line of the backend's tagged stream:
//   0:"text"            content delta
//   g:"text"            reasoning delta
//   e:{"finishReason"}  finish event
//   d:{"usage":{...}}   usage event
enum class LineKind {
  kIgnored,
  kContent,
  kReasoning,
  kFinish,
  kUsage,
};

struct TranslatedLine {
  LineKind kind = LineKind::kIgnored;
  std::string text;
  // Empty when the finish event carried no reason.
  std::string finish_reason;
  Usage usage;
  // total_tokens exactly as the backend reported it, for logging only.
  std::optional<int> reported_total;
};

TranslatedLine TranslateLine(const std::string& line);

// Decodes a JSON-string-encoded payload, tolerating missing quotes and
// malformed escapes.
std::string DecodeTextPayload(const std::string& payload);

const char* LineKindName(LineKind kind);

}  // namespace linebridge
