#pragma once

#include "chat_types.hpp"
#include "id_generator.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace linebridge {

class IdentityRotator {
 public:
  // ids must outlive the rotator.
  IdentityRotator(std::vector<std::string> caller_ids, std::string fallback_caller_id, IdGenerator* ids);

  // Never fails. Each call hands out a fresh conversation id.
  Identity Next();

  size_t PoolSize() const { return caller_ids_.size(); }

 private:
  std::vector<std::string> caller_ids_;
  std::string fallback_caller_id_;
  IdGenerator* ids_;
  std::atomic<uint64_t> index_;
};

}  // namespace linebridge
