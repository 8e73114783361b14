#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace linebridge {

// Process-wide identifier source. Seeded once at construction and shared by
// every request; calls are serialized internally.
class IdGenerator {
 public:
  IdGenerator();
  explicit IdGenerator(uint64_t seed);

  // chat_<unix seconds>_<16 hex chars>
  std::string NewConversationId();
  // chatcmpl-<YYYYmmddHHMMSS><10 chars of [a-z0-9]>
  std::string NewResponseId();

  uint64_t Next();
  size_t NextIndex(size_t bound);

 private:
  std::mutex mu_;
  std::mt19937_64 rng_;
};

}  // namespace linebridge
