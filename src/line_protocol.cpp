#include "line_protocol.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <limits>

namespace linebridge {
namespace {

static std::string TrimAscii(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r' || s[start] == '\n')) start++;
  size_t end = s.size();
  while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r' || s[end - 1] == '\n')) end--;
  return s.substr(start, end - start);
}

static std::optional<std::string> TryParseJsonString(const std::string& quoted) {
  auto j = nlohmann::json::parse(quoted, nullptr, false);
  if (j.is_discarded() || !j.is_string()) return std::nullopt;
  return j.get<std::string>();
}

static std::string ManualUnescape(std::string s) {
  if (!s.empty() && s.front() == '"') s.erase(s.begin());
  if (!s.empty() && s.back() == '"') s.pop_back();
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] == '\\' && i + 1 < s.size()) {
      const char n = s[i + 1];
      if (n == '\\' || n == '"') {
        out.push_back(n);
        i++;
        continue;
      }
      if (n == 'n' || n == 't' || n == 'r') {
        out.push_back(n == 'n' ? '\n' : (n == 't' ? '\t' : '\r'));
        i++;
        continue;
      }
    }
    out.push_back(s[i]);
  }
  return out;
}

// Counts are accepted as integers or floats; anything else reads as zero.
// Values past INT_MAX saturate.
static int CountField(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key)) return 0;
  const auto& v = obj[key];
  if (!v.is_number()) return 0;
  const double d = v.get<double>();
  if (!(d > 0)) return 0;
  if (d >= static_cast<double>(std::numeric_limits<int>::max())) {
    std::cout << "[translate] " << key << "=" << d << " out of range, clamped\n";
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(d);
}

static const nlohmann::json& ObjectField(const nlohmann::json& obj, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (!obj.is_object() || !obj.contains(key) || !obj[key].is_object()) return kEmpty;
  return obj[key];
}

static bool ParseUsagePayload(const std::string& payload, TranslatedLine* out) {
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    std::cout << "[translate] malformed usage payload ignored\n";
    return false;
  }
  if (!j.contains("usage") || !j["usage"].is_object()) {
    std::cout << "[translate] usage payload without usage object ignored\n";
    return false;
  }
  const auto& u = j["usage"];
  Usage usage;

  usage.prompt_tokens = CountField(u, "prompt_tokens");
  if (usage.prompt_tokens == 0) usage.prompt_tokens = CountField(u, "input_tokens");
  usage.completion_tokens = CountField(u, "completion_tokens");
  if (usage.completion_tokens == 0) usage.completion_tokens = CountField(u, "output_tokens");

  const auto& ptd = ObjectField(u, "prompt_tokens_details");
  const auto& itd = ObjectField(u, "input_tokens_details");
  usage.prompt_details.cached_tokens = CountField(ptd, "cached_tokens");
  if (int legacy = CountField(itd, "cached_tokens"); legacy > 0) usage.prompt_details.cached_tokens = legacy;
  usage.prompt_details.audio_tokens = CountField(ptd, "audio_tokens");

  const auto& ctd = ObjectField(u, "completion_tokens_details");
  const auto& otd = ObjectField(u, "output_tokens_details");
  auto& cd = usage.completion_details;
  cd.reasoning_tokens = CountField(ctd, "reasoning_tokens");
  if (int legacy = CountField(otd, "reasoning_tokens"); legacy > 0) cd.reasoning_tokens = legacy;
  cd.audio_tokens = CountField(ctd, "audio_tokens");
  cd.accepted_prediction_tokens = CountField(ctd, "accepted_prediction_tokens");
  cd.rejected_prediction_tokens = CountField(ctd, "rejected_prediction_tokens");

  const int reported_total = CountField(u, "total_tokens");
  if (reported_total > 0) {
    out->reported_total = reported_total;
    if (reported_total != usage.total_tokens()) {
      std::cout << "[translate] reported total_tokens=" << reported_total << " differs from parts="
                << usage.total_tokens() << "\n";
    }
  }

  out->kind = LineKind::kUsage;
  out->usage = usage;
  return true;
}

static bool ParseFinishPayload(const std::string& payload, TranslatedLine* out) {
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    std::cout << "[translate] malformed finish payload ignored\n";
    return false;
  }
  out->kind = LineKind::kFinish;
  if (j.contains("finishReason") && j["finishReason"].is_string()) {
    out->finish_reason = j["finishReason"].get<std::string>();
  }
  return true;
}

}  // namespace

std::string DecodeTextPayload(const std::string& payload) {
  const bool quoted = payload.size() >= 2 && payload.front() == '"' && payload.back() == '"';
  if (auto s = TryParseJsonString(quoted ? payload : "\"" + payload + "\"")) return *s;
  return ManualUnescape(payload);
}

TranslatedLine TranslateLine(const std::string& raw) {
  TranslatedLine out;
  const std::string line = TrimAscii(raw);
  if (line.size() < 2 || line[1] != ':') return out;

  const std::string payload = line.substr(2);
  switch (line[0]) {
    case '0':
      out.kind = LineKind::kContent;
      out.text = DecodeTextPayload(payload);
      break;
    case 'g':
      out.kind = LineKind::kReasoning;
      out.text = DecodeTextPayload(payload);
      break;
    case 'e':
      if (!ParseFinishPayload(payload, &out)) out = TranslatedLine();
      break;
    case 'd':
      if (!ParseUsagePayload(payload, &out)) out = TranslatedLine();
      break;
    default:
      break;
  }
  return out;
}

const char* LineKindName(LineKind kind) {
  switch (kind) {
    case LineKind::kContent:
      return "content";
    case LineKind::kReasoning:
      return "reasoning";
    case LineKind::kFinish:
      return "finish";
    case LineKind::kUsage:
      return "usage";
    case LineKind::kIgnored:
      break;
  }
  return "ignored";
}

}  // namespace linebridge
