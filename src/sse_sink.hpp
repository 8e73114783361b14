#pragma once

#include <httplib.h>

#include <mutex>
#include <string>

namespace linebridge {

// Destination of an SSE session. Write() buffers, Flush() pushes the buffered
// bytes to the peer. Implementations must be safe for one frame writer plus
// one heartbeat writer.
class SseSink {
 public:
  virtual ~SseSink() = default;
  virtual bool Write(const std::string& bytes) = 0;
  virtual bool Flush() = 0;
};

class HttpSseSink : public SseSink {
 public:
  explicit HttpSseSink(httplib::DataSink* sink);

  bool Write(const std::string& bytes) override;
  bool Flush() override;

  // False once the peer is gone or a write failed.
  bool IsWritable();

 private:
  httplib::DataSink* sink_;
  std::mutex mu_;
  std::string pending_;
  bool broken_ = false;
};

}  // namespace linebridge
