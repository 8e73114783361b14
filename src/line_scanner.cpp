#include "line_scanner.hpp"

#include <cstring>

namespace linebridge {

static const char* kTokenTooLong = "token too long";

LineScanner::LineScanner(size_t initial_size, size_t max_line_size) : max_line_size_(max_line_size) {
  pending_.reserve(initial_size < max_line_size ? initial_size : max_line_size);
}

void LineScanner::EmitLine(std::vector<std::string>* lines) {
  if (!pending_.empty() && pending_.back() == '\r') pending_.pop_back();
  if (lines) lines->push_back(pending_);
  pending_.clear();
}

bool LineScanner::Feed(const char* data, size_t len, std::vector<std::string>* lines, std::string* err) {
  if (failed_) {
    if (err) *err = kTokenTooLong;
    return false;
  }
  size_t pos = 0;
  while (pos < len) {
    const void* nl = std::memchr(data + pos, '\n', len - pos);
    const size_t end = nl ? static_cast<size_t>(static_cast<const char*>(nl) - data) : len;
    if (pending_.size() + (end - pos) > max_line_size_) {
      failed_ = true;
      pending_.clear();
      if (err) *err = kTokenTooLong;
      return false;
    }
    pending_.append(data + pos, end - pos);
    if (!nl) break;
    EmitLine(lines);
    pos = end + 1;
  }
  return true;
}

bool LineScanner::Finish(std::vector<std::string>* lines, std::string* err) {
  if (failed_) {
    if (err) *err = kTokenTooLong;
    return false;
  }
  if (!pending_.empty()) EmitLine(lines);
  return true;
}

}  // namespace linebridge
