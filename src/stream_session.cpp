#include "stream_session.hpp"

#include "line_scanner.hpp"

#include <exception>
#include <iostream>
#include <utility>
#include <vector>

namespace linebridge {
namespace {

static const char* kHeartbeatComment = ": heartbeat\n\n";
static const char* kDoneMarker = "data: [DONE]\n\n";

static std::string SseData(const nlohmann::json& j) {
  return std::string("data: ") + j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n\n";
}

static std::string TrimAscii(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r' || s[start] == '\n')) start++;
  size_t end = s.size();
  while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r' || s[end - 1] == '\n')) end--;
  return s.substr(start, end - start);
}

}  // namespace

const char* StreamStateName(StreamState s) {
  switch (s) {
    case StreamState::kInit:
      return "init";
    case StreamState::kStreaming:
      return "streaming";
    case StreamState::kFinishing:
      return "finishing";
    case StreamState::kErrorAbort:
      return "error_abort";
    case StreamState::kClientGone:
      return "client_gone";
    case StreamState::kClosed:
      return "closed";
  }
  return "unknown";
}

Heartbeat::Heartbeat(SseSink* sink, std::chrono::milliseconds interval) : sink_(sink), interval_(interval) {}

Heartbeat::~Heartbeat() {
  Stop();
}

void Heartbeat::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread([this] { Loop(); });
}

void Heartbeat::Stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void Heartbeat::Loop() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_; })) break;
    // mu_ stays held while writing so Stop() waits out an in-flight beat.
    if (!sink_->Write(kHeartbeatComment) || !sink_->Flush()) {
      std::cout << "[stream] heartbeat write failed\n";
      return;
    }
    beats_++;
  }
}

StreamSession::StreamSession(StreamOptions opts, SseSink* sink, TokenCounter* counter)
    : opts_(std::move(opts)), sink_(sink), counter_(counter) {}

bool StreamSession::Cancelled(CancelToken* cancel) const {
  return cancel && cancel->IsCancelled();
}

nlohmann::json StreamSession::MakeChunk(const nlohmann::json& delta,
                                        const nlohmann::json& finish_reason,
                                        const Usage& usage) const {
  nlohmann::json chunk;
  chunk["id"] = opts_.id;
  chunk["object"] = "chat.completion.chunk";
  chunk["created"] = opts_.created;
  chunk["model"] = opts_.model;
  nlohmann::json choice;
  choice["index"] = 0;
  choice["delta"] = delta;
  choice["finish_reason"] = finish_reason;
  chunk["choices"] = nlohmann::json::array({choice});
  chunk["usage"] = UsageToJson(usage);
  return chunk;
}

bool StreamSession::WriteFrame(const nlohmann::json& chunk, bool force_flush) {
  if (!sink_->Write(SseData(chunk))) return false;
  frames_++;
  const auto now = std::chrono::steady_clock::now();
  if (force_flush || !flushed_once_ || now - last_flush_ >= opts_.min_flush_interval) {
    flushed_once_ = true;
    last_flush_ = now;
    return sink_->Flush();
  }
  return true;
}

bool StreamSession::WriteDelta(const char* field, const std::string& text, std::string* err) {
  nlohmann::json delta;
  delta[field] = text;
  if (!WriteFrame(MakeChunk(delta, nullptr, counter_->LocalUsage()), false)) {
    if (err) *err = "error writing to stream";
    return false;
  }
  return true;
}

void StreamSession::WriteTerminal(const nlohmann::json& chunk) {
  const bool frame_ok = sink_->Write(SseData(chunk));
  if (frame_ok) frames_++;
  const bool done_ok = sink_->Write(kDoneMarker) && sink_->Flush();
  if (!frame_ok || !done_ok) {
    std::cout << "[stream] id=" << opts_.id << " terminal write failed frame_ok=" << (frame_ok ? 1 : 0)
              << " done_ok=" << (done_ok ? 1 : 0) << "\n";
  }
}

void StreamSession::AbortWithError(const std::string& content, StreamResult* result) {
  heartbeat_->Stop();
  state_ = StreamState::kErrorAbort;
  result->terminal = StreamState::kErrorAbort;
  result->finish_reason = "error";
  result->usage = counter_->LocalUsage();
  nlohmann::json delta;
  delta["content"] = content;
  WriteTerminal(MakeChunk(delta, "error", result->usage));
}

void StreamSession::AbortAfterFault(const std::string& details, StreamResult* result) {
  try {
    AbortWithError("\n\n[PANIC: Internal Server Error during stream processing. Details: " + details + "]", result);
  } catch (const std::exception& e) {
    std::cout << "[stream] id=" << opts_.id << " error frame not written err=" << e.what() << "\n";
  } catch (...) {
    std::cout << "[stream] id=" << opts_.id << " error frame not written err=unknown exception\n";
  }
}

bool StreamSession::HandleLine(const std::string& line, std::string* err) {
  auto t = TranslateLine(line);
  switch (t.kind) {
    case LineKind::kContent:
    case LineKind::kReasoning:
      if (t.text.empty()) return true;
      counter_->AddOutputText(t.text);
      return WriteDelta(t.kind == LineKind::kContent ? "content" : "reasoning_content", t.text, err);
    case LineKind::kFinish:
      if (!t.finish_reason.empty()) finish_reason_ = t.finish_reason;
      return true;
    case LineKind::kUsage:
      counter_->SetServerUsage(t.usage);
      return true;
    case LineKind::kIgnored:
      break;
  }
  return true;
}

bool StreamSession::ProcessLines(std::vector<std::string>* lines, CancelToken* cancel, StreamResult* result) {
  for (const auto& raw : *lines) {
    if (Cancelled(cancel)) {
      heartbeat_->Stop();
      state_ = StreamState::kClientGone;
      result->terminal = StreamState::kClientGone;
      result->error = cancel->Reason();
      return false;
    }
    const std::string line = TrimAscii(raw);
    if (line.empty()) continue;

    std::string err;
    if (HandleLine(line, &err)) {
      consecutive_errors_ = 0;
      continue;
    }
    consecutive_errors_++;
    std::cout << "[stream] id=" << opts_.id << " line error=" << err << " consecutive=" << consecutive_errors_ << "\n";
    if (consecutive_errors_ >= opts_.max_consecutive_errors) {
      result->error = "Too many errors processing stream (reached threshold of " +
                      std::to_string(opts_.max_consecutive_errors) + "). Last error: " + err;
      AbortWithError("\n\n[Stream Error: " + result->error + "]", result);
      return false;
    }
  }
  lines->clear();
  return true;
}

StreamResult StreamSession::Run(BodyReader* body, CancelToken* cancel) {
  StreamResult result;
  Heartbeat heartbeat(sink_, opts_.heartbeat_interval);
  heartbeat_ = &heartbeat;

  try {
    state_ = StreamState::kInit;
    heartbeat.Start();

    nlohmann::json initial;
    initial["role"] = "assistant";
    initial["content"] = "";
    if (!WriteFrame(MakeChunk(initial, nullptr, counter_->LocalUsage()), true)) {
      consecutive_errors_++;
      std::cout << "[stream] id=" << opts_.id << " initial frame write failed\n";
    }
    state_ = StreamState::kStreaming;

    LineScanner scanner(opts_.initial_buffer_size, opts_.max_buffer_size);
    std::vector<std::string> lines;
    std::string chunk;
    bool running = true;
    while (running) {
      if (Cancelled(cancel)) {
        heartbeat.Stop();
        state_ = StreamState::kClientGone;
        result.terminal = StreamState::kClientGone;
        result.error = cancel->Reason();
        break;
      }

      chunk.clear();
      std::string read_err;
      const auto r = body->Read(cancel, &chunk, &read_err);
      if (r == BodyReader::Result::kError) {
        if (Cancelled(cancel)) continue;
        result.error = "upstream read error: " + read_err;
        AbortWithError("\n\n[Stream Error: " + result.error + "]", &result);
        break;
      }

      std::string scan_err;
      bool scan_ok = true;
      if (r == BodyReader::Result::kChunk) {
        scan_ok = scanner.Feed(chunk, &lines, &scan_err);
      } else {
        scan_ok = scanner.Finish(&lines, &scan_err);
        running = false;
      }
      if (!ProcessLines(&lines, cancel, &result)) break;
      if (!scan_ok) {
        result.error = "scanner error: " + scan_err;
        AbortWithError("\n\n[Stream Error: " + result.error + "]", &result);
        break;
      }
      if (!running) {
        heartbeat.Stop();
        state_ = StreamState::kFinishing;
        result.terminal = StreamState::kFinishing;
        result.finish_reason = finish_reason_;
        // Reconciliation may lower the totals, so this frame alone can report
        // less than the last running snapshot.
        result.usage = counter_->Reconciled();
        WriteTerminal(MakeChunk(nlohmann::json::object(), finish_reason_, result.usage));
      }
    }
  } catch (const std::exception& e) {
    std::cout << "[stream] id=" << opts_.id << " fault=" << e.what() << "\n";
    result.error = e.what();
    AbortAfterFault(e.what(), &result);
  } catch (...) {
    std::cout << "[stream] id=" << opts_.id << " fault=unknown exception\n";
    result.error = "unknown exception";
    AbortAfterFault("unknown exception", &result);
  }

  heartbeat.Stop();
  heartbeats_ = heartbeat.beats();
  heartbeat_ = nullptr;
  state_ = StreamState::kClosed;
  result.frames = frames_;
  std::cout << "[stream] id=" << opts_.id << " terminal=" << StreamStateName(result.terminal)
            << " frames=" << result.frames << " heartbeats=" << heartbeats_ << " finish_reason=" << result.finish_reason
            << " prompt_tokens=" << result.usage.prompt_tokens << " completion_tokens=" << result.usage.completion_tokens
            << (result.error.empty() ? "" : " err=" + result.error) << "\n";
  return result;
}

}  // namespace linebridge
