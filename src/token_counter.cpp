#include "token_counter.hpp"

#include <cmath>
#include <cstring>
#include <iostream>

namespace linebridge {
namespace {

static bool IsSpaceByte(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool IsPunctuationByte(unsigned char c) {
  static const char* kPunctuation = ".,;:!?()[]{}-_=+*/\\\"'`~@#$%^&<>|";
  return c != 0 && std::strchr(kPunctuation, static_cast<int>(c)) != nullptr;
}

static int ReconcileField(const char* name, int server, int local, double threshold) {
  if (server == 0 && local > 0) return local;
  if (server > 0 && local > 0) {
    const double deviation = static_cast<double>(server - local) / static_cast<double>(local);
    if (std::fabs(deviation) > threshold) {
      std::cout << "[usage] " << name << " deviation=" << deviation << " server=" << server << " local=" << local
                << " using=local\n";
      return local;
    }
  }
  return server;
}

}  // namespace

int EstimateTokens(const std::string& text, const TokenEstimatorWeights& weights) {
  int words = 0;
  int punctuation = 0;
  int multibyte = 0;
  bool in_word = false;
  bool non_blank = false;

  for (unsigned char c : text) {
    if (c < 0x80) {
      if (IsSpaceByte(c)) {
        if (in_word) words++;
        in_word = false;
        continue;
      }
      non_blank = true;
      if (IsPunctuationByte(c)) {
        if (in_word) words++;
        in_word = false;
        punctuation++;
      } else {
        in_word = true;
      }
      continue;
    }
    // UTF-8 continuation bytes belong to the character already counted.
    if ((c & 0xC0) == 0x80) continue;
    non_blank = true;
    if (in_word) words++;
    in_word = false;
    multibyte++;
  }
  if (in_word) words++;

  const double estimate =
      words * weights.word + punctuation * weights.punctuation + multibyte * weights.multibyte;
  int out = static_cast<int>(std::floor(estimate));
  if (out < 1 && non_blank) out = 1;
  return out;
}

int EstimateMessageTokens(const std::vector<ChatMessage>& messages) {
  int total = 0;
  for (const auto& m : messages) {
    total += EstimateTokens(m.role);
    total += EstimateTokens(m.content);
  }
  total += static_cast<int>(messages.size()) * kPerMessageOverheadTokens;
  total += kPerRequestOverheadTokens;
  return total;
}

Usage ReconcileUsage(const Usage& server, const Usage& local, double threshold) {
  Usage out = server;
  out.prompt_tokens = ReconcileField("prompt_tokens", server.prompt_tokens, local.prompt_tokens, threshold);
  out.completion_tokens =
      ReconcileField("completion_tokens", server.completion_tokens, local.completion_tokens, threshold);
  return out;
}

void TokenCounter::AddOutputText(const std::string& text) {
  if (text.empty()) return;
  output_tokens_ += EstimateTokens(text);
}

Usage TokenCounter::LocalUsage() const {
  Usage u;
  u.prompt_tokens = input_tokens_;
  u.completion_tokens = output_tokens_;
  return u;
}

Usage TokenCounter::Reconciled() const {
  const Usage server = server_usage_.value_or(Usage());
  const Usage local = LocalUsage();
  std::cout << "[usage] server prompt=" << server.prompt_tokens << " completion=" << server.completion_tokens
            << " local prompt=" << local.prompt_tokens << " completion=" << local.completion_tokens << "\n";
  return ReconcileUsage(server, local);
}

}  // namespace linebridge
