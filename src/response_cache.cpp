#include "response_cache.hpp"

#include <openssl/sha.h>

#include <iostream>

namespace linebridge {

std::string Fingerprint(const ChatRequest& req) {
  nlohmann::json j;
  j["model"] = req.model;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : req.messages) j["messages"].push_back({{"role", m.role}, {"content", m.content}});
  j["stream"] = false;
  const std::string canonical = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(canonical.data()), canonical.size(), hash);

  static const char* kDigits = "0123456789abcdef";
  std::string out = "resp:";
  out.reserve(5 + SHA256_DIGEST_LENGTH * 2);
  for (unsigned char b : hash) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0xf]);
  }
  return out;
}

TtlResponseCache::TtlResponseCache(std::chrono::milliseconds response_ttl,
                                   std::chrono::milliseconds model_ttl,
                                   std::chrono::milliseconds cleanup_interval)
    : response_ttl_(response_ttl),
      model_ttl_(model_ttl),
      cleanup_interval_(cleanup_interval),
      last_sweep_(Clock::now()) {}

void TtlResponseCache::SweepLocked(Clock::time_point now) {
  if (now - last_sweep_ < cleanup_interval_) return;
  last_sweep_ = now;
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expires_at <= now) {
      it = entries_.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  if (models_ && models_->expires_at <= now) models_.reset();
  if (removed > 0) {
    evictions_ += removed;
    std::cout << "[cache] swept expired=" << removed << " remaining=" << entries_.size() << "\n";
  }
}

std::optional<std::string> TtlResponseCache::Get(const std::string& fingerprint) {
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  SweepLocked(now);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end() || it->second.expires_at <= now) {
    if (it != entries_.end()) {
      entries_.erase(it);
      evictions_++;
    }
    misses_++;
    return std::nullopt;
  }
  hits_++;
  return it->second.body;
}

void TtlResponseCache::Set(const std::string& fingerprint, const std::string& body) {
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  SweepLocked(now);
  entries_[fingerprint] = Entry{body, now + response_ttl_};
}

std::optional<std::string> TtlResponseCache::GetModels() {
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mu_);
  if (!models_ || models_->expires_at <= now) {
    models_.reset();
    return std::nullopt;
  }
  return models_->body;
}

void TtlResponseCache::SetModels(const std::string& body) {
  std::lock_guard<std::mutex> lock(mu_);
  models_ = Entry{body, Clock::now() + model_ttl_};
}

size_t TtlResponseCache::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

nlohmann::json TtlResponseCache::Metrics() const {
  nlohmann::json j;
  j["enabled"] = true;
  j["hits"] = hits_.load();
  j["misses"] = misses_.load();
  j["evictions"] = evictions_.load();
  j["size"] = Size();
  const auto total = hits_.load() + misses_.load();
  j["hit_rate"] = total == 0 ? 0.0 : static_cast<double>(hits_.load()) / static_cast<double>(total);
  return j;
}

}  // namespace linebridge
