#include "upstream/http_transport.hpp"

#include <httplib.h>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace linebridge {
namespace {

constexpr size_t kMaxBufferedBytes = 4 * 1024 * 1024;
constexpr std::chrono::milliseconds kPollSlice{50};

struct TransferState {
  std::mutex mu;
  std::condition_variable cv;
  bool headers_ready = false;
  int status = 0;
  std::deque<std::string> chunks;
  size_t buffered = 0;
  bool finished = false;
  bool aborted = false;
  std::string error;
};

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static std::shared_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, int read_timeout_sec) {
  auto cli = std::make_shared<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(10);
  cli->set_read_timeout(read_timeout_sec);
  cli->set_write_timeout(30);
  return cli;
}

static void Abort(const std::shared_ptr<TransferState>& state, const std::shared_ptr<httplib::Client>& client) {
  {
    std::lock_guard<std::mutex> lock(state->mu);
    state->aborted = true;
  }
  state->cv.notify_all();
  client->stop();
}

class ChannelBodyReader : public BodyReader {
 public:
  ChannelBodyReader(std::shared_ptr<TransferState> state, std::shared_ptr<httplib::Client> client, std::thread worker)
      : state_(std::move(state)), client_(std::move(client)), worker_(std::move(worker)) {}

  ~ChannelBodyReader() override {
    bool done = false;
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      done = state_->finished;
    }
    if (!done) Abort(state_, client_);
    if (worker_.joinable()) worker_.join();
  }

  Result Read(CancelToken* cancel, std::string* chunk, std::string* err) override {
    std::unique_lock<std::mutex> lock(state_->mu);
    while (true) {
      if (!state_->chunks.empty()) {
        *chunk = std::move(state_->chunks.front());
        state_->chunks.pop_front();
        state_->buffered -= chunk->size();
        lock.unlock();
        state_->cv.notify_all();
        return Result::kChunk;
      }
      if (state_->finished) {
        if (state_->error.empty()) return Result::kEof;
        if (err) *err = state_->error;
        return Result::kError;
      }
      if (cancel && cancel->IsCancelled()) {
        lock.unlock();
        Abort(state_, client_);
        if (err) *err = cancel->Reason();
        return Result::kError;
      }
      state_->cv.wait_for(lock, kPollSlice);
    }
  }

 private:
  std::shared_ptr<TransferState> state_;
  std::shared_ptr<httplib::Client> client_;
  std::thread worker_;
};

}  // namespace

HttpUpstreamTransport::HttpUpstreamTransport(HttpEndpoint endpoint, int read_timeout_sec, IProxyProvider* proxies)
    : endpoint_(std::move(endpoint)), read_timeout_sec_(read_timeout_sec), proxies_(proxies) {}

std::optional<UpstreamResponse> HttpUpstreamTransport::Send(const UpstreamRequest& req,
                                                            CancelToken* cancel,
                                                            std::string* err) {
  if (cancel && cancel->IsCancelled()) {
    if (err) *err = cancel->Reason();
    return std::nullopt;
  }

  auto client = MakeClient(endpoint_, read_timeout_sec_);
  if (proxies_) {
    std::string proxy_err;
    if (auto proxy = proxies_->GetProxy(&proxy_err)) {
      client->set_proxy(proxy->host, proxy->port);
    } else {
      std::cout << "[upstream] proxy unavailable, connecting directly err=" << proxy_err << "\n";
    }
  }

  auto state = std::make_shared<TransferState>();
  httplib::Request hreq;
  hreq.method = "POST";
  hreq.path = JoinPath(endpoint_.base_path, req.path);
  hreq.body = req.body;
  hreq.set_header("Content-Type", req.content_type);
  for (const auto& h : req.headers) hreq.set_header(h.first, h.second);
  hreq.response_handler = [state](const httplib::Response& r) {
    std::lock_guard<std::mutex> lock(state->mu);
    state->status = r.status;
    state->headers_ready = true;
    state->cv.notify_all();
    return !state->aborted;
  };
  hreq.content_receiver = [state](const char* data, size_t len, uint64_t, uint64_t) {
    std::unique_lock<std::mutex> lock(state->mu);
    state->cv.wait(lock, [&] { return state->aborted || state->buffered < kMaxBufferedBytes; });
    if (state->aborted) return false;
    state->chunks.emplace_back(data, len);
    state->buffered += len;
    state->cv.notify_all();
    return true;
  };

  std::thread worker([state, client, hreq = std::move(hreq)]() mutable {
    httplib::Response hres;
    httplib::Error error = httplib::Error::Success;
    const bool ok = client->send(hreq, hres, error);
    std::lock_guard<std::mutex> lock(state->mu);
    state->finished = true;
    if (!ok && !state->aborted) state->error = "HTTP request failed: " + httplib::to_string(error);
    if (!ok && state->aborted) state->error = "request aborted";
    state->cv.notify_all();
  });

  int status = 0;
  {
    std::unique_lock<std::mutex> lock(state->mu);
    while (!state->headers_ready && !state->finished) {
      if (cancel && cancel->IsCancelled()) {
        lock.unlock();
        Abort(state, client);
        worker.join();
        if (err) *err = cancel->Reason();
        return std::nullopt;
      }
      state->cv.wait_for(lock, kPollSlice);
    }
    if (!state->headers_ready) {
      const std::string failure = state->error.empty() ? "HTTP request failed" : state->error;
      lock.unlock();
      worker.join();
      if (err) *err = failure + ", URL: " + endpoint_.host + JoinPath(endpoint_.base_path, req.path);
      return std::nullopt;
    }
    status = state->status;
  }

  UpstreamResponse out;
  out.status = status;
  out.body = std::make_unique<ChannelBodyReader>(state, client, std::move(worker));
  return out;
}

}  // namespace linebridge
