#pragma once

#include "chat_service.hpp"

#include <httplib.h>

#include <chrono>

namespace linebridge {

class OpenAiRouter {
 public:
  explicit OpenAiRouter(ChatService* service);
  void Register(httplib::Server* server);

 private:
  ChatService* service_;
  std::chrono::steady_clock::time_point started_;
};

}  // namespace linebridge
