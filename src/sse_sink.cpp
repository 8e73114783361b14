#include "sse_sink.hpp"

namespace linebridge {

HttpSseSink::HttpSseSink(httplib::DataSink* sink) : sink_(sink) {}

bool HttpSseSink::Write(const std::string& bytes) {
  std::lock_guard<std::mutex> lock(mu_);
  if (broken_) return false;
  pending_ += bytes;
  return true;
}

bool HttpSseSink::Flush() {
  std::lock_guard<std::mutex> lock(mu_);
  if (broken_) return false;
  if (pending_.empty()) return true;
  if ((sink_->is_writable && !sink_->is_writable()) || !sink_->write) {
    broken_ = true;
    return false;
  }
  if (!sink_->write(pending_.data(), pending_.size())) {
    broken_ = true;
    return false;
  }
  pending_.clear();
  return true;
}

bool HttpSseSink::IsWritable() {
  std::lock_guard<std::mutex> lock(mu_);
  if (broken_) return false;
  if (sink_->is_writable && !sink_->is_writable()) broken_ = true;
  return !broken_;
}

}  // namespace linebridge
