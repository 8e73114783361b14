#include "response_assembler.hpp"

#include "line_protocol.hpp"
#include "line_scanner.hpp"

#include <iostream>
#include <vector>

namespace linebridge {

ResponseAssembler::ResponseAssembler(TokenCounter* counter, size_t initial_buffer_size, size_t max_line_size)
    : counter_(counter), initial_buffer_size_(initial_buffer_size), max_line_size_(max_line_size) {}

void ResponseAssembler::AddLine(const std::string& line) {
  auto t = TranslateLine(line);
  switch (t.kind) {
    case LineKind::kContent:
      content_ += t.text;
      break;
    case LineKind::kReasoning:
      if (reasoning_.empty()) {
        reasoning_ = t.text;
      } else {
        reasoning_ += "\n" + t.text;
      }
      break;
    case LineKind::kFinish:
      if (!t.finish_reason.empty()) finish_reason_ = t.finish_reason;
      break;
    case LineKind::kUsage:
      counter_->SetServerUsage(t.usage);
      break;
    case LineKind::kIgnored:
      break;
  }
}

ResponseAssembler::Status ResponseAssembler::Consume(BodyReader* body, CancelToken* cancel, std::string* err) {
  LineScanner scanner(initial_buffer_size_, max_line_size_);
  std::vector<std::string> lines;
  std::string chunk;
  while (true) {
    if (cancel && cancel->IsCancelled()) {
      if (err) *err = cancel->Reason();
      return Status::kCancelled;
    }
    chunk.clear();
    std::string read_err;
    const auto r = body->Read(cancel, &chunk, &read_err);
    if (r == BodyReader::Result::kError) {
      if (cancel && cancel->IsCancelled()) {
        if (err) *err = cancel->Reason();
        return Status::kCancelled;
      }
      if (err) *err = "upstream read error: " + read_err;
      return Status::kFailed;
    }
    std::string scan_err;
    const bool done = r == BodyReader::Result::kEof;
    const bool scan_ok = done ? scanner.Finish(&lines, &scan_err) : scanner.Feed(chunk, &lines, &scan_err);
    if (!scan_ok) {
      if (err) *err = "scanner error: " + scan_err;
      return Status::kFailed;
    }
    for (const auto& line : lines) {
      if (cancel && cancel->IsCancelled()) {
        if (err) *err = cancel->Reason();
        return Status::kCancelled;
      }
      AddLine(line);
    }
    lines.clear();
    if (done) return Status::kOk;
  }
}

nlohmann::json ResponseAssembler::BuildCompletion(const CompletionMeta& meta) {
  counter_->AddOutputText(content_);
  counter_->AddOutputText(reasoning_);
  const Usage usage = counter_->Reconciled();

  nlohmann::json message;
  message["role"] = "assistant";
  message["content"] = content_;
  if (!reasoning_.empty()) message["reasoning_content"] = reasoning_;

  nlohmann::json choice;
  choice["index"] = 0;
  choice["message"] = std::move(message);
  choice["finish_reason"] = finish_reason_;

  nlohmann::json out;
  out["id"] = meta.id;
  out["object"] = "chat.completion";
  out["created"] = meta.created;
  out["model"] = meta.model;
  out["choices"] = nlohmann::json::array({choice});
  out["usage"] = UsageToJson(usage);
  std::cout << "[sync] id=" << meta.id << " content_chars=" << content_.size() << " reasoning_chars=" << reasoning_.size()
            << " finish_reason=" << finish_reason_ << " total_tokens=" << usage.total_tokens() << "\n";
  return out;
}

}  // namespace linebridge
