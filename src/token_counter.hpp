#pragma once

#include "chat_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace linebridge {

// Approximation of tokenizer density, not a real tokenizer.
struct TokenEstimatorWeights {
  double word = 1.3;
  double punctuation = 1.0;
  double multibyte = 1.5;
};

constexpr int kPerMessageOverheadTokens = 4;
constexpr int kPerRequestOverheadTokens = 3;
constexpr double kUsageDeviationThreshold = 0.20;

int EstimateTokens(const std::string& text, const TokenEstimatorWeights& weights = TokenEstimatorWeights());
int EstimateMessageTokens(const std::vector<ChatMessage>& messages);

// Per field: a missing server count is replaced by the local one, and a server
// count deviating from the local one by strictly more than `threshold` is
// replaced as well. Detail counts are taken from the server.
Usage ReconcileUsage(const Usage& server, const Usage& local, double threshold = kUsageDeviationThreshold);

// Request-scoped accumulator. Owned and written by exactly one task.
class TokenCounter {
 public:
  void SetInputTokens(int tokens) { input_tokens_ = tokens; }
  void AddOutputTokens(int tokens) { output_tokens_ += tokens; }
  void AddOutputText(const std::string& text);
  void SetServerUsage(const Usage& usage) { server_usage_ = usage; }

  int input_tokens() const { return input_tokens_; }
  int output_tokens() const { return output_tokens_; }
  const std::optional<Usage>& server_usage() const { return server_usage_; }

  Usage LocalUsage() const;
  Usage Reconciled() const;

 private:
  int input_tokens_ = 0;
  int output_tokens_ = 0;
  std::optional<Usage> server_usage_;
};

}  // namespace linebridge
