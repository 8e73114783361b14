#include "id_generator.hpp"

#include <openssl/rand.h>

#include <array>
#include <chrono>
#include <ctime>
#include <iostream>

namespace linebridge {
namespace {

static std::mt19937_64 MakeSeededEngine() {
  std::array<uint32_t, 8> words{};
  if (RAND_bytes(reinterpret_cast<unsigned char*>(words.data()), static_cast<int>(words.size() * sizeof(uint32_t))) !=
      1) {
    std::cout << "[id] RAND_bytes failed, seeding from std::random_device\n";
    std::random_device rd;
    for (auto& w : words) w = rd();
  }
  std::seed_seq seq(words.begin(), words.end());
  return std::mt19937_64(seq);
}

static std::string Hex16(uint64_t v) {
  static const char* kDigits = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; i--) {
    out[static_cast<size_t>(i)] = kDigits[v & 0xf];
    v >>= 4;
  }
  return out;
}

}  // namespace

IdGenerator::IdGenerator() : rng_(MakeSeededEngine()) {}

IdGenerator::IdGenerator(uint64_t seed) : rng_(seed) {}

uint64_t IdGenerator::Next() {
  std::lock_guard<std::mutex> lock(mu_);
  return rng_();
}

size_t IdGenerator::NextIndex(size_t bound) {
  if (bound == 0) return 0;
  std::lock_guard<std::mutex> lock(mu_);
  std::uniform_int_distribution<size_t> dist(0, bound - 1);
  return dist(rng_);
}

std::string IdGenerator::NewConversationId() {
  const auto now =
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
  return "chat_" + std::to_string(now) + "_" + Hex16(Next());
}

std::string IdGenerator::NewResponseId() {
  static const char* kAlphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
  constexpr size_t kRandomLength = 10;

  const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &tm_buf);

  std::string suffix(kRandomLength, 'a');
  {
    std::lock_guard<std::mutex> lock(mu_);
    std::uniform_int_distribution<int> dist(0, 35);
    for (auto& c : suffix) c = kAlphabet[dist(rng_)];
  }
  return std::string("chatcmpl-") + stamp + suffix;
}

}  // namespace linebridge
