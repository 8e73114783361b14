#pragma once

#include "cancel_token.hpp"
#include "line_protocol.hpp"
#include "sse_sink.hpp"
#include "token_counter.hpp"
#include "upstream/transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace linebridge {

//   INIT -> STREAMING -> {FINISHING | ERROR_ABORT | CLIENT_GONE} -> CLOSED
enum class StreamState {
  kInit,
  kStreaming,
  kFinishing,
  kErrorAbort,
  kClientGone,
  kClosed,
};

const char* StreamStateName(StreamState s);

struct StreamOptions {
  std::string id;
  int64_t created = 0;
  std::string model;
  std::chrono::milliseconds heartbeat_interval{15000};
  std::chrono::milliseconds min_flush_interval{100};
  size_t initial_buffer_size = 128 * 1024;
  size_t max_buffer_size = 2 * 1024 * 1024;
  int max_consecutive_errors = 5;
};

struct StreamResult {
  // The state the session left STREAMING through.
  StreamState terminal = StreamState::kInit;
  std::string finish_reason;
  Usage usage;
  std::string error;
  int frames = 0;
};

// Writes ": heartbeat" comments on its own thread until stopped. Stop() joins,
// so nothing is written by the heartbeat once it returns.
class Heartbeat {
 public:
  Heartbeat(SseSink* sink, std::chrono::milliseconds interval);
  ~Heartbeat();

  Heartbeat(const Heartbeat&) = delete;
  Heartbeat& operator=(const Heartbeat&) = delete;

  void Start();
  void Stop();
  int beats() const { return beats_.load(); }

 private:
  void Loop();

  SseSink* sink_;
  std::chrono::milliseconds interval_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_ = false;
  std::atomic<int> beats_{0};
  std::thread thread_;
};

// Drives one live SSE response. Only the thread calling Run() writes frames;
// the heartbeat writes comments and is joined before any terminal frame.
class StreamSession {
 public:
  StreamSession(StreamOptions opts, SseSink* sink, TokenCounter* counter);

  // Never throws; a fault inside the session becomes an error frame.
  StreamResult Run(BodyReader* body, CancelToken* cancel);

  StreamState state() const { return state_.load(); }
  int heartbeats() const { return heartbeats_; }

 private:
  bool Cancelled(CancelToken* cancel) const;
  bool ProcessLines(std::vector<std::string>* lines, CancelToken* cancel, StreamResult* result);
  // False when a frame could not be delivered.
  bool HandleLine(const std::string& line, std::string* err);

  nlohmann::json MakeChunk(const nlohmann::json& delta, const nlohmann::json& finish_reason, const Usage& usage) const;
  bool WriteFrame(const nlohmann::json& chunk, bool force_flush);
  bool WriteDelta(const char* field, const std::string& text, std::string* err);
  void WriteTerminal(const nlohmann::json& chunk);
  void AbortWithError(const std::string& content, StreamResult* result);
  // AbortWithError for the fault handlers; a sink that throws again is logged.
  void AbortAfterFault(const std::string& details, StreamResult* result);

  StreamOptions opts_;
  SseSink* sink_;
  TokenCounter* counter_;
  Heartbeat* heartbeat_ = nullptr;
  std::atomic<StreamState> state_{StreamState::kInit};
  std::string finish_reason_ = "stop";
  int consecutive_errors_ = 0;
  int frames_ = 0;
  int heartbeats_ = 0;
  bool flushed_once_ = false;
  std::chrono::steady_clock::time_point last_flush_;
};

}  // namespace linebridge
