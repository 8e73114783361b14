#include "identity_rotator.hpp"

#include <utility>

namespace linebridge {

IdentityRotator::IdentityRotator(std::vector<std::string> caller_ids, std::string fallback_caller_id, IdGenerator* ids)
    : caller_ids_(std::move(caller_ids)),
      fallback_caller_id_(std::move(fallback_caller_id)),
      ids_(ids),
      index_(ids_->NextIndex(caller_ids_.size())) {}

Identity IdentityRotator::Next() {
  Identity out;
  if (caller_ids_.empty()) {
    out.caller_id = fallback_caller_id_;
  } else {
    const uint64_t i = index_.fetch_add(1, std::memory_order_relaxed) + 1;
    out.caller_id = caller_ids_[i % caller_ids_.size()];
  }
  out.conversation_id = ids_->NewConversationId();
  return out;
}

}  // namespace linebridge
