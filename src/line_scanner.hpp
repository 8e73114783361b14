#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace linebridge {

// Splits an incrementally delivered body into '\n'-terminated lines. A line
// longer than max_line_size is a permanent error; the scanner then refuses
// further input.
class LineScanner {
 public:
  LineScanner(size_t initial_size, size_t max_line_size);

  bool Feed(const char* data, size_t len, std::vector<std::string>* lines, std::string* err);
  bool Feed(const std::string& data, std::vector<std::string>* lines, std::string* err) {
    return Feed(data.data(), data.size(), lines, err);
  }

  // Flushes an unterminated trailing line, if any.
  bool Finish(std::vector<std::string>* lines, std::string* err);

  bool failed() const { return failed_; }

 private:
  void EmitLine(std::vector<std::string>* lines);

  std::string pending_;
  size_t max_line_size_;
  bool failed_ = false;
};

}  // namespace linebridge
